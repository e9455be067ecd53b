#pragma once

#include "aggregation_request.hpp"
#include "group_aggregator.hpp"

#include <gaez/crop_mapping.hpp>
#include <gaez/path_resolver.hpp>
#include <geo/raster.hpp>
#include <geo/raster_source.hpp>

#include <string>
#include <vector>

namespace cropcal {

    const std::string KCAL_UNITS = "kcal";
    const std::string AREA_UNITS = "ha";
    const std::string OUTPUT_SOURCE = "GAEZ v5";

    /**
     * @brief Sums group layers into one output raster per request.
     */
    class cross_group_reducer {
    public:
        cross_group_reducer(const geo::raster_source &source,
                            const gaez::path_resolver &resolver,
                            const gaez::calorie_mapping &calories);

        /**
         * @brief Cell-wise sum of the layers on the first layer's grid.
         *
         * Layers on another grid are aligned first. NaN contributions count as zero, a cell is NaN only
         * when it is NaN in every layer. The result carries `units` and `source` metadata.
         *
         * @throws no_valid_groups if layers is empty.
         */
        static geo::raster reduce(const std::vector<geo::raster> &layers, const std::string &name, const std::string &units);

        /**
         * @brief Total calories of the request over every group of the calorie table.
         *
         * A group missing from the crop mapping degrades to a zero layer. Harvested area failures propagate.
         */
        geo::raster sum_groups_kcal(const aggregation_request &request, const gaez::crop_mapping &crops) const;

        /**
         * @brief Total harvested area of the water code's area regime over every group of the calorie table.
         *
         * Groups whose area cannot be loaded are skipped with a warning.
         *
         * @throws no_valid_groups if no group area could be loaded.
         */
        geo::raster sum_groups_area(const std::string &water_code) const;

    private:
        const geo::raster_source &source_;
        const gaez::path_resolver &resolver_;
        const gaez::calorie_mapping &calories_;
        group_aggregator aggregator_;
    };

}
