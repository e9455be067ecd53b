#pragma once

/**
 * @file exceptions.hpp
 * @brief Definitions of the exceptions for `gaez` module.
 */

#include <base/exception.hpp>

#include <fmt/format.h>

namespace gaez {

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

class unrecognized_family : public exception
{
public:
    explicit unrecognized_family(const std::string& family)
        : exception(fmt::format("Unrecognized variable code family '{}'.", family), {{"family", family}})
    {
    }
};

class missing_path_component : public exception
{
public:
    missing_path_component(const std::string& family, const std::string& component)
        : exception(fmt::format("Variable family '{}' requires a non-empty '{}'.", family, component),
                    {{"family", family}, {"component", component}})
    {
    }
};

class unknown_water_code : public exception
{
public:
    explicit unknown_water_code(const std::string& code)
        : exception(fmt::format("Unknown water supply code '{}'.", code), {{"water_code", code}})
    {
    }
};

class unknown_storage_scheme : public exception
{
public:
    explicit unknown_storage_scheme(const std::string& scheme)
        : exception(fmt::format("Unknown storage scheme '{}'.", scheme), {{"scheme", scheme}})
    {
    }
};

class mapping_parse_error : public exception
{
public:
    mapping_parse_error(const std::string& path, const std::string& message)
        : exception(fmt::format("Failed to parse mapping table {}: {}", path, message),
                    {{"resource", path}, {"message", message}})
    {
    }

    mapping_parse_error(const std::string& path, int64_t row, const std::string& column, const std::string& message)
        : exception(fmt::format("Failed to parse mapping table {} at row {}, column '{}': {}", path, row, column, message),
                    {{"resource", path}, {"row", std::to_string(row)}, {"column", column}, {"message", message}})
    {
    }
};

} // namespace gaez
