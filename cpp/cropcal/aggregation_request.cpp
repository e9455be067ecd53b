#include "aggregation_request.hpp"

#include <fmt/format.h>

namespace cropcal {

    std::string aggregation_request::output_name() const {
        return fmt::format("cal_yld_{}_{}_{}_{}_{}", variable_family, period, climate_model, scenario, water_code);
    }

    std::string harvested_area_output_name(const std::string &water_code) {
        return "har_area_" + water_code;
    }

}
