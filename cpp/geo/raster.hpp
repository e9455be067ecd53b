#pragma once

#include "grid.hpp"

#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace geo {

    /**
     * @brief Immutable 2-D float raster on a grid. NaN marks nodata.
     *
     * Copies share the cell values. Derived rasters are new values.
     */
    class raster {
    public:
        using metadata_t = std::map<std::string, std::string, std::less<>>;

        /**
         * @throws shape_mismatch if values.size() differs from the grid size.
         */
        raster(std::string name, geo::grid grid, std::vector<float> values);

        static raster filled(std::string name, const geo::grid &grid, float value);

        const std::string &name() const;

        const geo::grid &grid() const;

        std::span<const float> values() const;

        float at(int64_t row, int64_t col) const;

        const metadata_t &metadata() const;

        raster with_metadata(const std::string &key, const std::string &value) const;

        bool shares_values_with(const raster &other) const;

    private:
        std::string name_;
        geo::grid grid_;
        std::shared_ptr<const std::vector<float>> values_;
        metadata_t metadata_;
    };

}
