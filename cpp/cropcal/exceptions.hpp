#pragma once

/**
 * @file exceptions.hpp
 * @brief Definitions of the exceptions for `cropcal` module.
 */

#include <base/exception.hpp>

#include <fmt/format.h>

namespace cropcal {

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
 * @brief No group contributed a layer to an output.
 */
class no_valid_groups : public exception
{
public:
    explicit no_valid_groups(const std::string& output_name)
        : exception(fmt::format("No valid group layers found for {}", output_name), {{"output", output_name}})
    {
    }
};

/**
 * @brief No output raster matches a dataset's folder and prefix.
 */
class no_layers_found : public exception
{
public:
    no_layers_found(const std::string& folder, const std::string& prefix)
        : exception(fmt::format("No rasters matching {}_*.tif in {}", prefix, folder),
                    {{"resource", folder}, {"prefix", prefix}})
    {
    }
};

class invalid_configuration : public exception
{
public:
    explicit invalid_configuration(const std::string& message)
        : exception(fmt::format("Invalid configuration: {}", message), {{"message", message}})
    {
    }
};

} // namespace cropcal
