#include "pipeline.hpp"
#include "cross_group_reducer.hpp"

#include <base/exception.hpp>
#include <geo/gdal_raster_source.hpp>
#include <storage/local_storage.hpp>

#include <spdlog/spdlog.h>

#include <map>

namespace cropcal {

    namespace {
        const run_configuration &validated(const run_configuration &config) {
            config.validate();
            return config;
        }
    }

    bool run_summary::ok() const {
        return failed.empty();
    }

    void run_summary::merge(const run_summary &other) {
        written.insert(written.end(), other.written.begin(), other.written.end());
        skipped.insert(skipped.end(), other.skipped.begin(), other.skipped.end());
        failed.insert(failed.end(), other.failed.begin(), other.failed.end());
    }

    pipeline::pipeline(run_configuration config,
                       std::shared_ptr<geo::raster_source> source,
                       std::shared_ptr<storage::storage> data_storage,
                       std::shared_ptr<storage::storage> output_storage)
            : config_(std::move(config)),
              resolver_(validated(config_).resolver()),
              source_(std::move(source)),
              data_storage_(std::move(data_storage)),
              output_storage_(std::move(output_storage)),
              writer_(output_storage_),
              dataset_writer_(output_storage_),
              datasets_(output_storage_) {}

    pipeline pipeline::create(const run_configuration &config) {
        return {config,
                std::make_shared<geo::gdal_raster_source>(),
                std::make_shared<storage::local_storage>(config.data_root),
                std::make_shared<storage::local_storage>(config.output_dir)};
    }

    std::string pipeline::calorie_output_path(const aggregation_request &request) {
        return "/cal_yld/" + request.variable_family + "/" + request.output_name() + ".tif";
    }

    std::string pipeline::area_output_path(const std::string &water_code) {
        return "/har_area/" + harvested_area_output_name(water_code) + ".tif";
    }

    std::string pipeline::calorie_dataset_path(const std::string &variable_family) {
        return "/cal_yld_" + variable_family + ".nc";
    }

    std::string pipeline::area_dataset_path() {
        return "/har_area.nc";
    }

    void pipeline::run_output(const std::string &name,
                              const std::string &path,
                              const std::function<void()> &produce,
                              run_summary &summary) const {
        if (output_storage_->file(path).exists() && !config_.overwrite) {
            spdlog::info("Exists, skipping: {}", path);
            summary.skipped.push_back(path);
            return;
        }

        spdlog::info("Building {} ...", name);
        try {
            produce();
            spdlog::info("Saved {}", path);
            summary.written.push_back(path);
        } catch (const base::exception &e) {
            if (e.resource().empty()) {
                spdlog::error("Failed {}: {}", name, e.message());
            } else {
                spdlog::error("Failed {} at {}: {}", name, e.resource(), e.message());
            }
            summary.failed.push_back({name, e.message()});
        } catch (const std::exception &e) {
            spdlog::error("Failed {}: {}", name, e.what());
            summary.failed.push_back({name, e.what()});
        }
    }

    run_summary pipeline::run_calories() const {
        auto calories = gaez::calorie_mapping::load(*data_storage_, config_.calorie_mapping_path);
        spdlog::info("Processing {} crop groups", calories.factors().size());
        cross_group_reducer reducer(*source_, resolver_, calories);

        std::map<std::string, gaez::crop_mapping> crop_mappings;
        run_summary summary;
        for (const auto &request: config_.requests()) {
            auto mapping = crop_mappings.find(request.variable_family);
            if (mapping == crop_mappings.end()) {
                auto theme = gaez::theme_for_family(request.variable_family);
                mapping = crop_mappings.emplace(request.variable_family,
                                                gaez::crop_mapping::load(*data_storage_, config_.crop_mapping_path, theme)).first;
            }
            const auto &crops = mapping->second;
            const auto path = calorie_output_path(request);
            run_output(request.output_name(), path, [this, &reducer, &request, &crops, &path] {
                writer_.write(reducer.sum_groups_kcal(request, crops), path);
            }, summary);
        }
        return summary;
    }

    run_summary pipeline::run_harvested_area() const {
        auto calories = gaez::calorie_mapping::load(*data_storage_, config_.calorie_mapping_path);
        spdlog::info("Processing {} crop groups", calories.factors().size());
        cross_group_reducer reducer(*source_, resolver_, calories);

        run_summary summary;
        for (const auto &water_code: config_.water_codes) {
            const auto path = area_output_path(water_code);
            run_output(harvested_area_output_name(water_code), path, [this, &reducer, &water_code, &path] {
                writer_.write(reducer.sum_groups_area(water_code), path);
            }, summary);
        }
        return summary;
    }

    run_summary pipeline::run_datasets() const {
        run_summary summary;
        for (const auto &variable_family: config_.yield_variables) {
            const auto path = calorie_dataset_path(variable_family);
            run_output("cal_yld_" + variable_family, path, [this, &variable_family, &path] {
                dataset_writer_.write(datasets_.calorie_dataset(variable_family), path);
            }, summary);
        }
        const auto path = area_dataset_path();
        run_output("har_area", path, [this, &path] {
            dataset_writer_.write(datasets_.harvested_area_dataset(), path);
        }, summary);
        return summary;
    }

}
