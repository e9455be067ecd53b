#include "water_regime.hpp"
#include "exceptions.hpp"

#include <map>

namespace gaez {

    namespace {
        const std::map<std::string, std::string> &yield_to_area() {
            static const std::map<std::string, std::string> mapping = {
                    {"HILM", "WSI"},
                    {"LILM", "WSI"},
                    {"HRLM", "WSR"},
                    {"LRLM", "WSR"},
            };
            return mapping;
        }
    }

    const std::vector<std::string> &yield_water_codes() {
        static const std::vector<std::string> codes = {"HILM", "LILM", "HRLM", "LRLM"};
        return codes;
    }

    bool is_yield_water_code(const std::string &water_code) {
        return yield_to_area().contains(water_code);
    }

    std::string area_water_code(const std::string &water_code) {
        auto it = yield_to_area().find(water_code);
        if (it == yield_to_area().end()) {
            throw unknown_water_code(water_code);
        }
        return it->second;
    }

}
