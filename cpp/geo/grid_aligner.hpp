#pragma once

#include "grid.hpp"
#include "raster.hpp"

namespace geo {

    /**
     * @brief Brings a raster onto the reference grid.
     *
     * A candidate already on a compatible grid is returned unchanged. Otherwise it is warped with
     * nearest-neighbour resampling; NaN stays nodata and reference cells outside the candidate are NaN.
     *
     * @throws alignment_failed if GDAL cannot build the transformation or warp.
     */
    raster align(const grid &reference, const raster &candidate);

}
