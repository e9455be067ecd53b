#pragma once

#include <string>

namespace cropcal {

    /**
     * @brief Identifies one calorie output raster.
     */
    struct aggregation_request {
        std::string variable_family;
        std::string period;
        std::string climate_model;
        std::string scenario;
        std::string water_code;

        /**
         * @brief `cal_yld_<family>_<period>_<model>_<scenario>_<water>`
         */
        std::string output_name() const;

        bool operator==(const aggregation_request &other) const = default;
    };

    /**
     * @brief `har_area_<water>`
     */
    std::string harvested_area_output_name(const std::string &water_code);

}
