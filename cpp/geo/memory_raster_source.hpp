#pragma once

#include "raster_source.hpp"

#include <map>
#include <set>
#include <string>

namespace geo {

    /**
     * @brief Serves rasters registered in memory, keyed by identifier.
     */
    class memory_raster_source : public raster_source {
    public:
        void add(const std::string &identifier, const raster &value);

        /**
         * @brief Registers an identifier that exists but does not decode.
         */
        void add_malformed(const std::string &identifier);

        raster load(const std::string &identifier) const override;

    private:
        std::map<std::string, raster> rasters_;
        std::set<std::string> malformed_;
    };

}
