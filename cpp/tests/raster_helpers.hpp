#pragma once

#include <geo/grid.hpp>
#include <geo/raster.hpp>

#include <limits>
#include <string>
#include <vector>

namespace test_helpers {

    const float NaN = std::numeric_limits<float>::quiet_NaN();

    /**
     * @brief rows x cols grid of unit cells with the top left corner at (0, rows), no crs.
     */
    inline geo::grid unit_grid(int64_t rows, int64_t cols) {
        return {"", {0.0, 1.0, 0.0, static_cast<double>(rows), 0.0, -1.0}, rows, cols};
    }

    inline geo::raster constant(const std::string &name, const geo::grid &grid, float value) {
        return geo::raster::filled(name, grid, value);
    }

    inline geo::raster with_values(const std::string &name, const geo::grid &grid, std::vector<float> values) {
        return {name, grid, std::move(values)};
    }

}
