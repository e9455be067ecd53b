#include "path_resolver.hpp"
#include "exceptions.hpp"

#include <array>
#include <fmt/format.h>

namespace gaez {

    namespace {
        const std::string HTTPS_ROOT = "https://storage.googleapis.com/fao-gismgr-gaez-v5-data/DATA/GAEZ-V5/MAPSET";
        const std::string GS_ROOT = "gs://fao-gismgr-gaez-v5-data/DATA/GAEZ-V5/MAPSET";

        const std::array<std::string, 4> TIME_SERIES_PREFIXES = {"RES02", "RES03", "RES04", "RES05"};
        const std::array<std::string, 1> STATIC_LAYER_PREFIXES = {"RES06"};

        const std::string &required(const std::string &family, const std::string &name, const std::optional<std::string> &value) {
            if (!value.has_value() || value->empty()) {
                throw missing_path_component(family, name);
            }
            return *value;
        }

        const std::string &required(const std::string &family, const std::string &name, const std::string &value) {
            if (value.empty()) {
                throw missing_path_component(family, name);
            }
            return value;
        }
    }

    storage_scheme parse_storage_scheme(const std::string &scheme) {
        if (scheme == "https") {
            return storage_scheme::https;
        }
        if (scheme == "gs") {
            return storage_scheme::gs;
        }
        if (scheme == "local") {
            return storage_scheme::local;
        }
        throw unknown_storage_scheme(scheme);
    }

    naming_scheme classify_family(const std::string &variable_family) {
        for (const auto &prefix: TIME_SERIES_PREFIXES) {
            if (variable_family.starts_with(prefix)) {
                return naming_scheme::time_series;
            }
        }
        for (const auto &prefix: STATIC_LAYER_PREFIXES) {
            if (variable_family.starts_with(prefix)) {
                return naming_scheme::static_layer;
            }
        }
        throw unrecognized_family(variable_family);
    }

    path_resolver::path_resolver(storage_scheme scheme) {
        switch (scheme) {
            case storage_scheme::gs:
                root_ = GS_ROOT;
                break;
            case storage_scheme::https:
                root_ = HTTPS_ROOT;
                break;
            case storage_scheme::local:
                throw missing_path_component("local", "raster_root");
        }
    }

    path_resolver::path_resolver(std::string root) : root_(std::move(root)) {
        while (root_.size() > 1 && root_.back() == '/') {
            root_.pop_back();
        }
        if (root_.empty()) {
            throw missing_path_component("local", "raster_root");
        }
    }

    const std::string &path_resolver::root() const {
        return root_;
    }

    std::string path_resolver::resolve(const raster_key &key) const {
        const auto &family = key.variable_family;
        std::string file_name;
        if (classify_family(family) == naming_scheme::time_series) {
            file_name = fmt::format("GAEZ-V5.{}.{}.{}.{}.{}.{}.tif",
                                    family,
                                    required(family, "period", key.period),
                                    required(family, "climate_model", key.climate_model),
                                    required(family, "scenario", key.scenario),
                                    required(family, "crop", key.crop),
                                    required(family, "water_code", key.water_code));
        } else {
            file_name = fmt::format("GAEZ-V5.{}.{}.{}.tif",
                                    family,
                                    required(family, "crop", key.crop),
                                    required(family, "water_code", key.water_code));
        }
        return fmt::format("{}/{}/{}", root_, family, file_name);
    }

    std::string path_resolver::yield_path(const std::string &variable_family,
                                          const std::string &period,
                                          const std::string &climate_model,
                                          const std::string &scenario,
                                          const std::string &crop,
                                          const std::string &water_code) const {
        return resolve({variable_family, period, climate_model, scenario, crop, water_code});
    }

    std::string path_resolver::harvested_area_path(const std::string &crop, const std::string &area_water_code) const {
        return resolve({HARVESTED_AREA_FAMILY, std::nullopt, std::nullopt, std::nullopt, crop, area_water_code});
    }

}
