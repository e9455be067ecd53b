#pragma once

/**
 * @file raster_source.hpp
 * @brief Definition of `raster_source` class.
 */

#include "raster.hpp"

#include <string>
#include <variant>

namespace geo {

    enum class load_error_kind {
        unavailable,
        malformed
    };

    struct load_error {
        load_error_kind kind;
        std::string identifier;
        std::string message;
    };

    /**
     * @brief Outcome of a single raster load: the raster or the reason it could not be loaded.
     */
    class load_result {
    public:
        load_result(raster value) : result_(std::move(value)) {}

        load_result(load_error error) : result_(std::move(error)) {}

        bool ok() const {
            return std::holds_alternative<raster>(result_);
        }

        const raster &value() const {
            return std::get<raster>(result_);
        }

        const load_error &error() const {
            return std::get<load_error>(result_);
        }

    private:
        std::variant<raster, load_error> result_;
    };

    class raster_source {
    public:
        virtual ~raster_source() = default;

        /**
         * @brief Loads band 1 of the raster as float, nodata cells as NaN.
         *
         * @param identifier Raster identifier as produced by the path resolver.
         * @throws source_unavailable if the identifier does not resolve to bytes.
         * @throws source_malformed if the bytes do not decode to a georeferenced raster.
         */
        virtual raster load(const std::string &identifier) const = 0;

        /**
         * Alternate version of load, which returns the failure instead of throwing it.
         * Only `source_unavailable` and `source_malformed` are captured.
         */
        load_result try_load(const std::string &identifier) const;
    };

}
