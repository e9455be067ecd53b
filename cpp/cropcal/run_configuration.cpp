#include "run_configuration.hpp"
#include "exceptions.hpp"

#include <base/exception.hpp>
#include <base/logging.hpp>
#include <gaez/crop_mapping.hpp>
#include <gaez/exceptions.hpp>
#include <gaez/water_regime.hpp>

#include <fstream>

namespace cropcal {

    namespace {
        const std::vector<std::string> HIST_PERIODS = {"HP8100", "HP0120"};
        const std::vector<std::string> FUTURE_PERIODS = {"FP2140", "FP4160", "FP6180", "FP8100"};
        const std::vector<std::string> HIST_MODELS = {"AGERA5"};
        const std::vector<std::string> FUTURE_MODELS = {"ENSEMBLE"};

        template<typename T>
        void read_optional(const nlohmann::json &json, const std::string &key, T &target) {
            if (json.contains(key)) {
                target = json.at(key).get<T>();
            }
        }
    }

    run_configuration run_configuration::defaults() {
        run_configuration config;
        config.crop_mapping_path = gaez::DEFAULT_CROP_MAPPING_PATH;
        config.calorie_mapping_path = gaez::DEFAULT_CALORIE_MAPPING_PATH;
        config.yield_variables = {"RES05-YCX"};
        config.water_codes = {"HILM", "HRLM"};
        config.scenarios = {
                {"HIST", HIST_PERIODS, HIST_MODELS},
                {"SSP126", FUTURE_PERIODS, FUTURE_MODELS},
                {"SSP370", FUTURE_PERIODS, FUTURE_MODELS},
                {"SSP585", FUTURE_PERIODS, FUTURE_MODELS},
        };
        return config;
    }

    run_configuration run_configuration::from_json(const nlohmann::json &json) {
        if (!json.is_object()) {
            throw invalid_configuration("configuration must be a JSON object");
        }
        auto config = defaults();
        try {
            read_optional(json, "storage_scheme", config.storage_scheme);
            read_optional(json, "raster_root", config.raster_root);
            read_optional(json, "data_root", config.data_root);
            read_optional(json, "crop_mapping_path", config.crop_mapping_path);
            read_optional(json, "calorie_mapping_path", config.calorie_mapping_path);
            read_optional(json, "output_dir", config.output_dir);
            read_optional(json, "overwrite", config.overwrite);
            read_optional(json, "log_level", config.log_level);
            read_optional(json, "yield_variables", config.yield_variables);
            read_optional(json, "water_codes", config.water_codes);
            read_optional(json, "scenarios", config.scenarios);
        } catch (const nlohmann::json::exception &e) {
            throw invalid_configuration(e.what());
        }
        config.validate();
        return config;
    }

    run_configuration run_configuration::load(const std::string &path) {
        std::ifstream stream(path);
        if (!stream.is_open()) {
            throw invalid_configuration("cannot open " + path);
        }
        nlohmann::json json;
        try {
            json = nlohmann::json::parse(stream);
        } catch (const nlohmann::json::parse_error &e) {
            throw invalid_configuration(path + ": " + e.what());
        }
        return from_json(json);
    }

    void run_configuration::validate() const {
        if (yield_variables.empty()) {
            throw invalid_configuration("yield_variables is empty");
        }
        if (water_codes.empty()) {
            throw invalid_configuration("water_codes is empty");
        }
        if (scenarios.empty()) {
            throw invalid_configuration("scenarios is empty");
        }
        for (const auto &variable: yield_variables) {
            try {
                if (gaez::classify_family(variable) != gaez::naming_scheme::time_series) {
                    throw invalid_configuration("'" + variable + "' is not a yield variable family");
                }
            } catch (const gaez::unrecognized_family &e) {
                throw invalid_configuration(e.message());
            }
        }
        for (const auto &water_code: water_codes) {
            if (!gaez::is_yield_water_code(water_code)) {
                throw invalid_configuration("unknown water code '" + water_code + "'");
            }
        }
        for (const auto &scenario: scenarios) {
            if (scenario.name.empty() || scenario.periods.empty() || scenario.models.empty()) {
                throw invalid_configuration("scenario '" + scenario.name + "' needs a name, periods and models");
            }
        }
        gaez::storage_scheme scheme;
        try {
            scheme = gaez::parse_storage_scheme(storage_scheme);
        } catch (const gaez::unknown_storage_scheme &e) {
            throw invalid_configuration(e.message());
        }
        if (scheme == gaez::storage_scheme::local && raster_root.empty()) {
            throw invalid_configuration("storage_scheme 'local' requires raster_root");
        }
        try {
            static_cast<void>(base::str_to_log_level(log_level));
        } catch (const base::unknown_log_level &e) {
            throw invalid_configuration(e.message());
        }
    }

    std::vector<aggregation_request> run_configuration::requests() const {
        std::vector<aggregation_request> result;
        for (const auto &variable: yield_variables) {
            for (const auto &scenario: scenarios) {
                for (const auto &period: scenario.periods) {
                    for (const auto &model: scenario.models) {
                        for (const auto &water_code: water_codes) {
                            result.push_back({variable, period, model, scenario.name, water_code});
                        }
                    }
                }
            }
        }
        return result;
    }

    gaez::path_resolver run_configuration::resolver() const {
        auto scheme = gaez::parse_storage_scheme(storage_scheme);
        if (scheme == gaez::storage_scheme::local) {
            return gaez::path_resolver(raster_root);
        }
        return gaez::path_resolver(scheme);
    }

    nlohmann::json run_configuration::to_json() const {
        nlohmann::json json;
        json["storage_scheme"] = storage_scheme;
        json["raster_root"] = raster_root;
        json["data_root"] = data_root;
        json["crop_mapping_path"] = crop_mapping_path;
        json["calorie_mapping_path"] = calorie_mapping_path;
        json["output_dir"] = output_dir;
        json["overwrite"] = overwrite;
        json["log_level"] = log_level;
        json["yield_variables"] = yield_variables;
        json["water_codes"] = water_codes;
        json["scenarios"] = scenarios;
        return json;
    }

}
