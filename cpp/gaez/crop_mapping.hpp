#pragma once

/**
 * @file crop_mapping.hpp
 * @brief Static lookup tables: crop group membership and calorie factors.
 */

#include <storage/storage.hpp>

#include <map>
#include <string>
#include <vector>

namespace gaez {

    const std::string DEFAULT_CROP_MAPPING_PATH = "data/gaez_v5_crop_mapper.csv";
    const std::string DEFAULT_CALORIE_MAPPING_PATH = "data/gaezv5_cal_mapping.csv";

    /**
     * @brief Which crop code column names the members of a theme-6 group.
     */
    enum class code_theme {
        theme2,
        theme5
    };

    /**
     * @brief `theme5` for the RES05-YCX / RES05-YXX yield families, `theme2` otherwise.
     */
    code_theme theme_for_family(const std::string &variable_family);

    std::string theme_column(code_theme theme);

    /**
     * @brief Theme-6 crop group code to its sorted, unique member crop codes.
     */
    class crop_mapping {
    public:
        crop_mapping() = default;

        explicit crop_mapping(std::map<std::string, std::vector<std::string>> groups);

        /**
         * @brief Loads the crop mapper table.
         *
         * Rows with mapping note `unmapped` (any case) and rows without a member code are dropped,
         * codes are trimmed and upper-cased.
         *
         * @throws mapping_parse_error on missing columns or a member code without group code.
         */
        static crop_mapping load(const storage::storage &storage, const std::string &path, code_theme theme);

        bool contains(const std::string &group) const;

        /**
         * @return The members of the group, empty if the group is unknown.
         */
        const std::vector<std::string> &members(const std::string &group) const;

    private:
        std::map<std::string, std::vector<std::string>> groups_;
    };

    struct calorie_factor {
        std::string group;
        double kcal_per_kg;
    };

    /**
     * @brief Theme-6 crop group code to kcal per kg, in table order.
     */
    class calorie_mapping {
    public:
        calorie_mapping() = default;

        explicit calorie_mapping(std::vector<calorie_factor> factors);

        /**
         * @brief Loads the calorie table.
         *
         * Keeps `grain` rows only, drops group `FRT` and multiplies `cal_yld` by 10.
         * A repeated group keeps its first position and takes the last value.
         *
         * @throws mapping_parse_error on missing columns or a non-numeric `cal_yld`.
         */
        static calorie_mapping load(const storage::storage &storage, const std::string &path);

        const std::vector<calorie_factor> &factors() const;

        std::vector<std::string> groups() const;

    private:
        std::vector<calorie_factor> factors_;
    };

}
