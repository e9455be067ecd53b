#include "raster_source.hpp"
#include "exceptions.hpp"

namespace geo {

    load_result raster_source::try_load(const std::string &identifier) const {
        try {
            return load(identifier);
        } catch (const source_unavailable &e) {
            return load_error{load_error_kind::unavailable, e.identifier(), e.cause()};
        } catch (const source_malformed &e) {
            return load_error{load_error_kind::malformed, e.identifier(), e.cause()};
        }
    }

}
