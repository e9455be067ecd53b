#pragma once

/**
 * @file run_configuration.hpp
 * @brief Immutable settings of one pipeline run.
 */

#include "aggregation_request.hpp"

#include <gaez/path_resolver.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace cropcal {

    struct scenario_config {
        std::string name;
        std::vector<std::string> periods;
        std::vector<std::string> models;
    };

    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(scenario_config, name, periods, models);

    class run_configuration {
    public:
        /**
         * @brief Historical AGERA5 periods plus SSP126/370/585 ensemble periods, RES05-YCX, HILM and HRLM.
         */
        static run_configuration defaults();

        /**
         * @brief Defaults overridden by the keys present in the JSON object.
         *
         * @throws invalid_configuration on wrong types or values.
         */
        static run_configuration from_json(const nlohmann::json &json);

        static run_configuration load(const std::string &path);

        /**
         * @throws invalid_configuration
         */
        void validate() const;

        /**
         * @brief Requests in yield variable, scenario, period, model, water code order.
         */
        std::vector<aggregation_request> requests() const;

        gaez::path_resolver resolver() const;

        nlohmann::json to_json() const;

        std::string storage_scheme = "https";
        std::string raster_root;
        std::string data_root = ".";
        std::string crop_mapping_path;
        std::string calorie_mapping_path;
        std::string output_dir = "outputs";
        bool overwrite = false;
        std::string log_level = "info";
        std::vector<std::string> yield_variables;
        std::vector<std::string> water_codes;
        std::vector<scenario_config> scenarios;
    };

}
