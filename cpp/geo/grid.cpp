#include "grid.hpp"

namespace geo {

    size_t grid::size() const {
        return static_cast<size_t>(rows) * static_cast<size_t>(cols);
    }

    bool grid::compatible_with(const grid &other) const {
        return *this == other;
    }

}
