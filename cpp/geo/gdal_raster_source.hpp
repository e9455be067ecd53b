#pragma once

#include "raster_source.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace geo {

    /**
     * @brief Reads GeoTIFFs (or any GDAL raster) from local paths, `https://` or `gs://` urls.
     *
     * Remote objects are read by range requests, so only the header and the pixel blocks are fetched.
     */
    class gdal_raster_source : public raster_source {
    public:
        gdal_raster_source();

        raster load(const std::string &identifier) const override;

        /**
         * @brief Decodes GeoTIFF bytes, as produced by `raster_writer::encode`, into a raster named `name`.
         *
         * @throws source_malformed if the bytes are not a georeferenced raster.
         */
        static raster decode(const std::string &name, const std::vector<uint8_t> &bytes);
    };

}
