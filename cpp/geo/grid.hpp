#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace geo {

    /**
     * @brief GDAL affine geotransform: origin x, pixel width, row rotation, origin y, column rotation, pixel height.
     */
    using geo_transform = std::array<double, 6>;

    /**
     * @brief Spatial indexing of a raster.
     *
     * Two grids are compatible when crs, transform and shape are all equal. Only compatible rasters
     * take part in cell-wise arithmetic.
     */
    struct grid {
        std::string crs;
        geo_transform transform = {0.0, 1.0, 0.0, 0.0, 0.0, -1.0};
        int64_t rows = 0;
        int64_t cols = 0;

        size_t size() const;

        bool compatible_with(const grid &other) const;

        bool operator==(const grid &other) const = default;
    };

}
