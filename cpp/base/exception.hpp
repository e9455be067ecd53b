#pragma once

/**
 * @file exception.hpp
 * @brief Definition of the `exception` class.
 */

#include <fmt/format.h>

#include <exception>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>

namespace base {

/**
 * @brief Base class for all cropcal exceptions.
 *
 * Carries a human readable message and a set of key/value parameters describing the failed
 * resource, so callers can log or report the failure without parsing the message.
 */
class exception : public std::exception
{
public:
    using params_t = std::map<std::string, std::string, std::less<>>;

public:
    explicit exception(std::string&& what)
        : what_(std::move(what))
    {
    }

    exception(std::string&& what, params_t&& params)
        : what_(std::move(what))
        , params_(std::move(params))
    {
    }

    const char* what() const noexcept override
    {
        return what_.c_str();
    }

    const std::string& message() const noexcept
    {
        return what_;
    }

    const auto& params() const noexcept
    {
        return params_;
    }

    /**
     * @brief The `resource` parameter (file, url or output name the failure is about), empty if unset.
     */
    std::string_view resource() const noexcept
    {
        auto it = params_.find("resource");
        return it == params_.end() ? std::string_view() : std::string_view(it->second);
    }

private:
    std::string what_;
    params_t params_;
};

class unknown_log_level : public exception
{
public:
    explicit unknown_log_level(const std::string& level)
        : exception(fmt::format("Unknown log level '{}'", level), {{"level", level}})
    {
    }
};

} // namespace base
