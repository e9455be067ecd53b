#pragma once

/**
 * @file path_resolver.hpp
 * @brief Deterministic GAEZ v5 raster identifiers.
 */

#include <optional>
#include <string>

namespace gaez {

    const std::string HARVESTED_AREA_FAMILY = "RES06-HAR";

    enum class storage_scheme {
        https,
        gs,
        local
    };

    storage_scheme parse_storage_scheme(const std::string &scheme);

    /**
     * @brief File naming scheme of a variable family.
     *
     * `time_series` families (RES02..RES05) embed period, climate model, scenario, crop and water code.
     * `static_layer` families (RES06) embed crop and water code only.
     */
    enum class naming_scheme {
        time_series,
        static_layer
    };

    /**
     * @throws unrecognized_family if the family matches no known prefix.
     */
    naming_scheme classify_family(const std::string &variable_family);

    struct raster_key {
        std::string variable_family;
        std::optional<std::string> period;
        std::optional<std::string> climate_model;
        std::optional<std::string> scenario;
        std::string crop;
        std::string water_code;
    };

    class path_resolver {
    public:
        explicit path_resolver(storage_scheme scheme = storage_scheme::https);

        /**
         * @brief Resolver rooted at a mirror of the MAPSET tree (local directory or URL).
         */
        explicit path_resolver(std::string root);

        /**
         * @brief `<root>/<family>/GAEZ-V5.<family>[.<period>.<model>.<scenario>].<crop>.<water>.tif`
         *
         * @throws unrecognized_family, missing_path_component
         */
        std::string resolve(const raster_key &key) const;

        std::string yield_path(const std::string &variable_family,
                               const std::string &period,
                               const std::string &climate_model,
                               const std::string &scenario,
                               const std::string &crop,
                               const std::string &water_code) const;

        std::string harvested_area_path(const std::string &crop, const std::string &area_water_code) const;

        const std::string &root() const;

    private:
        std::string root_;
    };

}
