#include "crop_mapping.hpp"
#include "csv_table.hpp"
#include "exceptions.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <set>

namespace gaez {

    namespace {
        const std::string EXCLUDED_CALORIE_GROUP = "FRT";
        const double CALORIE_SCALE = 10.0;

        std::string trim(const std::string &s) {
            const size_t first = s.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) {
                return "";
            }
            const size_t last = s.find_last_not_of(" \t\r\n");
            return s.substr(first, last - first + 1);
        }

        std::string to_upper(std::string s) {
            for (char &c: s) {
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
            return s;
        }

        std::string to_lower(std::string s) {
            for (char &c: s) {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            return s;
        }

        std::string normalize_code(const std::string &s) {
            return to_upper(trim(s));
        }

        std::optional<double> parse_number(const std::string &text) {
            auto value = trim(text);
            if (value.empty()) {
                return std::nullopt;
            }
            double result = 0;
            auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
            if (ec != std::errc() || end != value.data() + value.size()) {
                return std::nullopt;
            }
            return result;
        }
    }

    code_theme theme_for_family(const std::string &variable_family) {
        if (variable_family == "RES05-YCX" || variable_family == "RES05-YXX") {
            return code_theme::theme5;
        }
        return code_theme::theme2;
    }

    std::string theme_column(code_theme theme) {
        return theme == code_theme::theme5 ? "theme5_code" : "theme2_code";
    }

    crop_mapping::crop_mapping(std::map<std::string, std::vector<std::string>> groups) : groups_(std::move(groups)) {}

    crop_mapping crop_mapping::load(const storage::storage &storage, const std::string &path, code_theme theme) {
        const auto code_column = theme_column(theme);
        auto table = csv_table::read(storage, path, {"mapping_note", "theme6_code", code_column});

        std::map<std::string, std::set<std::string>> members;
        for (int64_t row = 0; row < table.num_rows(); ++row) {
            if (to_lower(trim(table.value("mapping_note", row))) == "unmapped") {
                continue;
            }
            auto code = normalize_code(table.value(code_column, row));
            if (code.empty()) {
                continue;
            }
            auto group = normalize_code(table.value("theme6_code", row));
            if (group.empty()) {
                throw mapping_parse_error(path, row, "theme6_code", "crop '" + code + "' has no group code");
            }
            members[group].insert(code);
        }

        std::map<std::string, std::vector<std::string>> groups;
        for (const auto &[group, codes]: members) {
            groups.emplace(group, std::vector<std::string>(codes.begin(), codes.end()));
        }
        spdlog::debug("Loaded {} crop groups from {} using {}", groups.size(), path, code_column);
        return crop_mapping(std::move(groups));
    }

    bool crop_mapping::contains(const std::string &group) const {
        return groups_.contains(group);
    }

    const std::vector<std::string> &crop_mapping::members(const std::string &group) const {
        static const std::vector<std::string> no_members;
        auto it = groups_.find(group);
        if (it == groups_.end()) {
            return no_members;
        }
        return it->second;
    }

    calorie_mapping::calorie_mapping(std::vector<calorie_factor> factors) : factors_(std::move(factors)) {}

    calorie_mapping calorie_mapping::load(const storage::storage &storage, const std::string &path) {
        auto table = csv_table::read(storage, path, {"gaez_crop_code", "crop_type", "cal_yld"});

        std::vector<calorie_factor> factors;
        for (int64_t row = 0; row < table.num_rows(); ++row) {
            if (table.value("crop_type", row) != "grain") {
                continue;
            }
            auto group = normalize_code(table.value("gaez_crop_code", row));
            // TODO: confirm with the data owner whether FRT is dropped for data quality or by policy
            if (group.empty() || group == EXCLUDED_CALORIE_GROUP) {
                continue;
            }
            auto cal_yld = parse_number(table.value("cal_yld", row));
            if (!cal_yld.has_value()) {
                throw mapping_parse_error(path, row, "cal_yld", "'" + table.value("cal_yld", row) + "' is not a number");
            }
            auto kcal_per_kg = *cal_yld * CALORIE_SCALE;

            auto existing = std::find_if(factors.begin(), factors.end(), [&group](const calorie_factor &f) {
                return f.group == group;
            });
            if (existing != factors.end()) {
                spdlog::warn("Calorie table {} lists group {} more than once, using the last value", path, group);
                existing->kcal_per_kg = kcal_per_kg;
            } else {
                factors.push_back({group, kcal_per_kg});
            }
        }
        spdlog::debug("Loaded {} calorie factors from {}", factors.size(), path);
        return calorie_mapping(std::move(factors));
    }

    const std::vector<calorie_factor> &calorie_mapping::factors() const {
        return factors_;
    }

    std::vector<std::string> calorie_mapping::groups() const {
        std::vector<std::string> groups;
        groups.reserve(factors_.size());
        for (const auto &f: factors_) {
            groups.push_back(f.group);
        }
        return groups;
    }

}
