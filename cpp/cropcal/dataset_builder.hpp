#pragma once

/**
 * @file dataset_builder.hpp
 * @brief Assembles the per-request output rasters of a folder into one multi-variable dataset.
 */

#include <geo/netcdf_writer.hpp>
#include <geo/raster.hpp>
#include <storage/storage.hpp>

#include <memory>
#include <string>
#include <vector>

namespace cropcal {

    const std::string DATASET_GRID = "5 arc-min, WGS84";
    const std::string DATASET_SOURCE = "GAEZ v5 + pipeline";

    class dataset_builder {
    public:
        /**
         * @param outputs Storage holding the `cal_yld/` and `har_area/` output trees.
         */
        explicit dataset_builder(std::shared_ptr<storage::storage> outputs);

        /**
         * @brief Paths of `<folder>/<prefix>_*.tif`, sorted.
         */
        std::vector<std::string> layer_paths(const std::string &folder, const std::string &prefix) const;

        /**
         * @brief One variable per matching raster, named after the file stem.
         *
         * The first raster defines the grid, the others are aligned onto it. Negative cells are clamped
         * to 0, nodata stays NaN.
         *
         * @throws no_layers_found if no raster matches.
         */
        std::vector<geo::raster> load_layers(const std::string &folder, const std::string &prefix) const;

        /**
         * @brief `cal_yld_<family>` dataset from `cal_yld/<family>/`, variables in kcal.
         */
        geo::dataset calorie_dataset(const std::string &variable_family) const;

        /**
         * @brief `har_area` dataset from `har_area/`, one variable per water code, in ha.
         */
        geo::dataset harvested_area_dataset() const;

    private:
        std::shared_ptr<storage::storage> outputs_;
    };

}
