#pragma once

#include <string>
#include <vector>

namespace gaez {

    /**
     * @brief Yield water/input codes, in canonical order: HILM, LILM, HRLM, LRLM.
     */
    const std::vector<std::string> &yield_water_codes();

    bool is_yield_water_code(const std::string &water_code);

    /**
     * @brief Harvested-area water supply code (`WSI` irrigated, `WSR` rainfed) for a yield water code.
     *
     * @throws unknown_water_code if the code is not one of the four yield water codes.
     */
    std::string area_water_code(const std::string &water_code);

}
