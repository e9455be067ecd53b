#pragma once

/**
 * @file netcdf_writer.hpp
 * @brief Multi-variable NetCDF-4 output through the GDAL multidimensional API.
 */

#include "raster.hpp"

#include <storage/storage.hpp>

#include <memory>
#include <string>
#include <vector>

namespace geo {

    /**
     * @brief Rasters sharing one grid, stored together as the variables of a single file.
     */
    struct dataset {
        std::string name;
        std::vector<raster> variables;
        raster::metadata_t attributes;
    };

    /**
     * @brief Writes datasets as NetCDF-4 with `y`/`x` coordinate variables.
     *
     * Every variable is float32, deflate level 4, chunked by 256x256 (capped at the grid shape), NaN fill
     * value. Raster metadata becomes variable attributes, dataset attributes become global attributes.
     */
    class netcdf_writer {
    public:
        explicit netcdf_writer(std::shared_ptr<storage::storage> storage);

        /**
         * @throws raster_write_failed if the dataset is empty, a variable is off the first variable's grid,
         * or GDAL fails.
         */
        static std::string encode(const dataset &value);

        void write(const dataset &value, const std::string &path) const;

    private:
        std::shared_ptr<storage::storage> storage_;
    };

}
