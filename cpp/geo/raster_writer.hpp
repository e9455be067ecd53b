#pragma once

#include "raster.hpp"

#include <storage/storage.hpp>

#include <memory>
#include <string>

namespace geo {

    /**
     * @brief Encodes rasters as tiled, ZSTD compressed float32 GeoTIFFs and stores them.
     */
    class raster_writer {
    public:
        explicit raster_writer(std::shared_ptr<storage::storage> storage);

        /**
         * @brief GeoTIFF bytes of the raster. NaN is nodata, raster metadata becomes dataset metadata
         * and the raster name the band description.
         *
         * @throws raster_write_failed
         */
        static std::string encode(const raster &value);

        void write(const raster &value, const std::string &path) const;

    private:
        std::shared_ptr<storage::storage> storage_;
    };

}
