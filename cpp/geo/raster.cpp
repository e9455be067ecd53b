#include "raster.hpp"
#include "exceptions.hpp"

namespace geo {

    raster::raster(std::string name, geo::grid grid, std::vector<float> values)
            : name_(std::move(name)), grid_(std::move(grid)) {
        if (values.size() != grid_.size()) {
            throw shape_mismatch(name_, grid_.size(), values.size());
        }
        values_ = std::make_shared<const std::vector<float>>(std::move(values));
    }

    raster raster::filled(std::string name, const geo::grid &grid, float value) {
        return {std::move(name), grid, std::vector<float>(grid.size(), value)};
    }

    const std::string &raster::name() const {
        return name_;
    }

    const geo::grid &raster::grid() const {
        return grid_;
    }

    std::span<const float> raster::values() const {
        return {values_->data(), values_->size()};
    }

    float raster::at(int64_t row, int64_t col) const {
        return values_->at(static_cast<size_t>(row * grid_.cols + col));
    }

    const raster::metadata_t &raster::metadata() const {
        return metadata_;
    }

    raster raster::with_metadata(const std::string &key, const std::string &value) const {
        auto copy = *this;
        copy.metadata_[key] = value;
        return copy;
    }

    bool raster::shares_values_with(const raster &other) const {
        return values_ == other.values_;
    }

}
