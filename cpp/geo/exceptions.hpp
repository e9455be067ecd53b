#pragma once

/**
 * @file exceptions.hpp
 * @brief Definitions of the exceptions for `geo` module.
 */

#include <base/exception.hpp>

#include <fmt/format.h>

namespace geo {

class exception : public base::exception
{
public:
    exception(std::string&& what, params_t&& params)
        : base::exception(std::move(what), std::move(params))
    {
    }

    explicit exception(std::string&& what)
        : base::exception(std::move(what))
    {
    }
};

/**
 * @brief A raster identifier could not be loaded.
 */
class source_error : public exception
{
public:
    source_error(std::string&& what, const std::string& identifier, const std::string& message)
        : exception(std::move(what), {{"resource", identifier}, {"message", message}})
        , identifier_(identifier)
        , cause_(message)
    {
    }

    const std::string& identifier() const noexcept
    {
        return identifier_;
    }

    const std::string& cause() const noexcept
    {
        return cause_;
    }

private:
    std::string identifier_;
    std::string cause_;
};

class source_unavailable : public source_error
{
public:
    source_unavailable(const std::string& identifier, const std::string& message)
        : source_error(fmt::format("Raster source unavailable: {} ({})", identifier, message), identifier, message)
    {
    }
};

class source_malformed : public source_error
{
public:
    source_malformed(const std::string& identifier, const std::string& message)
        : source_error(fmt::format("Raster source malformed: {} ({})", identifier, message), identifier, message)
    {
    }
};

class shape_mismatch : public exception
{
public:
    shape_mismatch(const std::string& name, size_t expected, size_t actual)
        : exception(fmt::format("Raster '{}' expects {} values, got {}", name, expected, actual),
                    {{"name", name}, {"expected", std::to_string(expected)}, {"actual", std::to_string(actual)}})
    {
    }
};

class alignment_failed : public exception
{
public:
    alignment_failed(const std::string& name, const std::string& message)
        : exception(fmt::format("Failed to align raster '{}': {}", name, message), {{"name", name}, {"message", message}})
    {
    }
};

class raster_write_failed : public exception
{
public:
    raster_write_failed(const std::string& name, const std::string& message)
        : exception(fmt::format("Failed to encode raster '{}': {}", name, message), {{"name", name}, {"message", message}})
    {
    }
};

} // namespace geo
