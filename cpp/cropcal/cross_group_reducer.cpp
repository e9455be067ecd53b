#include "cross_group_reducer.hpp"
#include "exceptions.hpp"

#include <gaez/water_regime.hpp>
#include <geo/grid_aligner.hpp>

#include <spdlog/spdlog.h>

#include <cmath>
#include <limits>

namespace cropcal {

    cross_group_reducer::cross_group_reducer(const geo::raster_source &source,
                                             const gaez::path_resolver &resolver,
                                             const gaez::calorie_mapping &calories)
            : source_(source), resolver_(resolver), calories_(calories), aggregator_(source, resolver) {}

    geo::raster cross_group_reducer::reduce(const std::vector<geo::raster> &layers, const std::string &name, const std::string &units) {
        if (layers.empty()) {
            throw no_valid_groups(name);
        }
        const auto reference = layers.front().grid();

        std::vector<double> sums(reference.size(), 0.0);
        std::vector<bool> present(reference.size(), false);
        for (const auto &layer: layers) {
            const auto aligned = geo::align(reference, layer);
            const auto values = aligned.values();
            for (size_t i = 0; i < values.size(); ++i) {
                if (!std::isnan(values[i])) {
                    sums[i] += values[i];
                    present[i] = true;
                }
            }
        }

        std::vector<float> total(reference.size());
        for (size_t i = 0; i < total.size(); ++i) {
            total[i] = present[i] ? static_cast<float>(sums[i]) : std::numeric_limits<float>::quiet_NaN();
        }

        return geo::raster(name, reference, std::move(total))
                .with_metadata("units", units)
                .with_metadata("source", OUTPUT_SOURCE);
    }

    geo::raster cross_group_reducer::sum_groups_kcal(const aggregation_request &request, const gaez::crop_mapping &crops) const {
        std::vector<geo::raster> group_layers;
        group_layers.reserve(calories_.factors().size());
        for (const auto &factor: calories_.factors()) {
            if (!crops.contains(factor.group)) {
                spdlog::warn("[{}] group has no member crops for {}", factor.group, request.variable_family);
            }
            crop_group group{factor.group, crops.members(factor.group), factor.kcal_per_kg};
            group_layers.push_back(aggregator_.aggregate(group, request));
        }
        return reduce(group_layers, request.output_name(), KCAL_UNITS);
    }

    geo::raster cross_group_reducer::sum_groups_area(const std::string &water_code) const {
        const auto area_water = gaez::area_water_code(water_code);
        const auto name = harvested_area_output_name(water_code);

        std::vector<geo::raster> area_layers;
        for (const auto &group: calories_.groups()) {
            auto path = resolver_.harvested_area_path(group, area_water);
            auto result = source_.try_load(path);
            if (!result.ok()) {
                spdlog::warn("Skipping group={} ({}) - failed to open: {} -> {}", group, water_code, path, result.error().message);
                continue;
            }
            area_layers.push_back(result.value());
        }

        if (area_layers.empty()) {
            throw no_valid_groups(name);
        }
        return reduce(area_layers, name, AREA_UNITS);
    }

}
