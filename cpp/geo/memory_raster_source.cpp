#include "memory_raster_source.hpp"
#include "exceptions.hpp"

namespace geo {

    void memory_raster_source::add(const std::string &identifier, const raster &value) {
        malformed_.erase(identifier);
        rasters_.insert_or_assign(identifier, value);
    }

    void memory_raster_source::add_malformed(const std::string &identifier) {
        rasters_.erase(identifier);
        malformed_.insert(identifier);
    }

    raster memory_raster_source::load(const std::string &identifier) const {
        if (malformed_.contains(identifier)) {
            throw source_malformed(identifier, "not a raster");
        }
        auto it = rasters_.find(identifier);
        if (it == rasters_.end()) {
            throw source_unavailable(identifier, "no such key");
        }
        return it->second;
    }

}
