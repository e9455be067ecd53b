#pragma once

/**
 * @file pipeline.hpp
 * @brief Run driver: enumerates outputs, skips existing ones, writes the rest.
 */

#include "dataset_builder.hpp"
#include "run_configuration.hpp"

#include <gaez/crop_mapping.hpp>
#include <geo/raster.hpp>
#include <geo/raster_source.hpp>
#include <geo/netcdf_writer.hpp>
#include <geo/raster_writer.hpp>
#include <storage/storage.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace cropcal {

    struct request_failure {
        std::string name;
        std::string message;
    };

    struct run_summary {
        std::vector<std::string> written;
        std::vector<std::string> skipped;
        std::vector<request_failure> failed;

        bool ok() const;

        void merge(const run_summary &other);
    };

    class pipeline {
    public:
        /**
         * @param source Raster source for yield and harvested area layers.
         * @param data_storage Storage the lookup table paths are relative to.
         * @param output_storage Storage the output rasters are written to.
         */
        pipeline(run_configuration config,
                 std::shared_ptr<geo::raster_source> source,
                 std::shared_ptr<storage::storage> data_storage,
                 std::shared_ptr<storage::storage> output_storage);

        /**
         * @brief GDAL raster source and local storages rooted at the configured data and output directories.
         */
        [[nodiscard]] static pipeline create(const run_configuration &config);

        /**
         * @brief Writes `cal_yld/<family>/<name>.tif` for every request of the configuration.
         *
         * A failed request is logged and recorded, the others continue. Mapping table errors abort the run.
         */
        run_summary run_calories() const;

        /**
         * @brief Writes `har_area/har_area_<water>.tif` for every configured water code.
         */
        run_summary run_harvested_area() const;

        /**
         * @brief Writes `cal_yld_<family>.nc` for every yield variable and `har_area.nc` from the
         * rasters already in the output storage.
         */
        run_summary run_datasets() const;

        static std::string calorie_output_path(const aggregation_request &request);

        static std::string area_output_path(const std::string &water_code);

        static std::string calorie_dataset_path(const std::string &variable_family);

        static std::string area_dataset_path();

    private:
        void run_output(const std::string &name,
                        const std::string &path,
                        const std::function<void()> &produce,
                        run_summary &summary) const;

        run_configuration config_;
        gaez::path_resolver resolver_;
        std::shared_ptr<geo::raster_source> source_;
        std::shared_ptr<storage::storage> data_storage_;
        std::shared_ptr<storage::storage> output_storage_;
        geo::raster_writer writer_;
        geo::netcdf_writer dataset_writer_;
        dataset_builder datasets_;
    };

}
