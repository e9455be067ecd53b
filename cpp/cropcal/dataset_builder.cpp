#include "dataset_builder.hpp"
#include "cross_group_reducer.hpp"
#include "exceptions.hpp"

#include <geo/gdal_raster_source.hpp>
#include <geo/grid_aligner.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>

namespace cropcal {

    namespace {
        const std::string HARVESTED_AREA_PREFIX = "har_area";

        geo::raster clamp_negatives(const geo::raster &layer) {
            const auto source = layer.values();
            std::vector<float> values(source.begin(), source.end());
            for (auto &v: values) {
                if (v < 0.0f) {
                    v = 0.0f;
                }
            }
            return {layer.name(), layer.grid(), std::move(values)};
        }

        geo::raster::metadata_t dataset_attributes(const std::string &title, const std::string &note) {
            return {{"title", title},
                    {"grid", DATASET_GRID},
                    {"source", DATASET_SOURCE},
                    {"note", note}};
        }
    }

    dataset_builder::dataset_builder(std::shared_ptr<storage::storage> outputs) : outputs_(std::move(outputs)) {}

    std::vector<std::string> dataset_builder::layer_paths(const std::string &folder, const std::string &prefix) const {
        std::vector<std::string> paths;
        for (const auto &file: outputs_->list_files(folder)) {
            const auto file_name = std::filesystem::path(file.path).filename().string();
            if (file_name.starts_with(prefix + "_") && file_name.ends_with(".tif")) {
                paths.push_back(file.path);
            }
        }
        std::sort(paths.begin(), paths.end());
        return paths;
    }

    std::vector<geo::raster> dataset_builder::load_layers(const std::string &folder, const std::string &prefix) const {
        const auto paths = layer_paths(folder, prefix);
        if (paths.empty()) {
            throw no_layers_found(folder, prefix);
        }

        std::vector<geo::raster> layers;
        layers.reserve(paths.size());
        for (const auto &path: paths) {
            auto name = std::filesystem::path(path).stem().string();
            auto layer = geo::gdal_raster_source::decode(name, outputs_->get_bytes(path));
            if (!layers.empty()) {
                layer = geo::align(layers.front().grid(), layer);
            }
            layers.push_back(clamp_negatives(layer));
        }
        spdlog::info("Loaded {} layers matching {}_*.tif from {}", layers.size(), prefix, folder);
        return layers;
    }

    geo::dataset dataset_builder::calorie_dataset(const std::string &variable_family) const {
        const auto prefix = "cal_yld_" + variable_family;
        auto layers = load_layers("/cal_yld/" + variable_family, prefix);
        for (auto &layer: layers) {
            layer = layer.with_metadata("units", KCAL_UNITS);
        }
        return {prefix, std::move(layers),
                dataset_attributes(prefix + " (calories per cell)",
                                   "Each variable = one input GeoTIFF. Negatives clamped to 0.")};
    }

    geo::dataset dataset_builder::harvested_area_dataset() const {
        auto layers = load_layers("/" + HARVESTED_AREA_PREFIX, HARVESTED_AREA_PREFIX);
        for (auto &layer: layers) {
            const auto water_code = layer.name().substr(HARVESTED_AREA_PREFIX.size() + 1);
            layer = layer.with_metadata("units", AREA_UNITS)
                    .with_metadata("long_name", fmt::format("Harvested area ({})", water_code));
        }
        return {HARVESTED_AREA_PREFIX, std::move(layers),
                dataset_attributes(HARVESTED_AREA_PREFIX + " (harvested area per cell)",
                                   "Each variable = one water supply type (HILM=irrigated, HRLM=rainfed). "
                                   "Negatives clamped to 0.")};
    }

}
