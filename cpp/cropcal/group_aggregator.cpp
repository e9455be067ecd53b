#include "group_aggregator.hpp"

#include <gaez/water_regime.hpp>
#include <geo/grid_aligner.hpp>

#include <spdlog/spdlog.h>

#include <cmath>
#include <limits>

namespace cropcal {

    group_aggregator::group_aggregator(const geo::raster_source &source, const gaez::path_resolver &resolver)
            : source_(source), resolver_(resolver) {}

    geo::raster group_aggregator::aggregate(const crop_group &group, const aggregation_request &request) const {
        const auto area_water = gaez::area_water_code(request.water_code);
        const auto output_name = "kcal_" + group.code;

        auto area = source_.load(resolver_.harvested_area_path(group.code, area_water));

        // phase 1: attempt every member, keep the ones that load
        std::vector<geo::raster> yields;
        for (const auto &crop: group.members) {
            auto path = resolver_.yield_path(request.variable_family, request.period, request.climate_model,
                                             request.scenario, crop, request.water_code);
            auto result = source_.try_load(path);
            if (!result.ok()) {
                spdlog::warn("[{}] skipping crop={} ({}) - failed to open: {} -> {}",
                             group.code, crop, request.water_code, path, result.error().message);
                continue;
            }
            yields.push_back(result.value());
        }

        if (yields.empty()) {
            spdlog::warn("[{}] no member yield available for {}, using a zero layer", group.code, request.output_name());
            const auto area_values = area.values();
            std::vector<float> zeros(area_values.size());
            for (size_t i = 0; i < zeros.size(); ++i) {
                zeros[i] = std::isnan(area_values[i]) ? std::numeric_limits<float>::quiet_NaN() : 0.0f;
            }
            return {output_name, area.grid(), std::move(zeros)};
        }

        // phase 2: the first loaded member is the reference grid
        const auto reference = yields.front().grid();
        area = geo::align(reference, area);
        for (auto &yield: yields) {
            yield = geo::align(reference, yield);
        }

        const auto area_values = area.values();
        std::vector<float> values(reference.size());
        for (size_t i = 0; i < values.size(); ++i) {
            double sum = 0.0;
            int count = 0;
            for (const auto &yield: yields) {
                const float v = yield.values()[i];
                if (!std::isnan(v)) {
                    sum += v;
                    ++count;
                }
            }
            if (count == 0) {
                values[i] = std::numeric_limits<float>::quiet_NaN();
                continue;
            }
            values[i] = static_cast<float>(sum / count * static_cast<double>(area_values[i]) * group.kcal_per_kg);
        }

        spdlog::debug("[{}] aggregated {} of {} member yields", group.code, yields.size(), group.members.size());
        return {output_name, reference, std::move(values)};
    }

}
