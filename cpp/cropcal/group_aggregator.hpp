#pragma once

#include "aggregation_request.hpp"

#include <gaez/path_resolver.hpp>
#include <geo/raster.hpp>
#include <geo/raster_source.hpp>

#include <string>
#include <vector>

namespace cropcal {

    struct crop_group {
        std::string code;
        std::vector<std::string> members;
        double kcal_per_kg;
    };

    /**
     * @brief Calorie yield of one crop group: mean member yield x harvested area x kcal per kg.
     */
    class group_aggregator {
    public:
        group_aggregator(const geo::raster_source &source, const gaez::path_resolver &resolver);

        /**
         * @brief Builds `kcal_<group>` for the request.
         *
         * The group's harvested area is required and its load failure propagates. Members whose yield
         * cannot be loaded are skipped with a warning. The first loaded member, in member order, defines
         * the output grid. Without any loaded member the result is zero on the harvested area grid, NaN where
         * the harvested area is nodata.
         *
         * @throws geo::source_unavailable, geo::source_malformed for the harvested area raster.
         * @throws gaez::unknown_water_code
         */
        geo::raster aggregate(const crop_group &group, const aggregation_request &request) const;

    private:
        const geo::raster_source &source_;
        const gaez::path_resolver &resolver_;
    };

}
