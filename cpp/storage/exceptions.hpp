#pragma once

/**
 * @file exceptions.hpp
 * @brief Definitions of the exceptions for `storage` module.
 */

#include <base/exception.hpp>

#include <fmt/format.h>

namespace storage {

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

class storage_key_not_found : public exception
{
public:
    explicit storage_key_not_found(const std::string& path)
        : exception(fmt::format("Storage key not found: {}", path), {{"resource", path}})
    {
    }
};

class storage_reader_error : public exception
{
public:
    storage_reader_error(const std::string& path, const std::string& message)
        : exception(fmt::format("Storage reader error: resource: {} message: {}", path, message),
                    {{"resource", path}, {"message", message}})
    {
    }
};

class storage_writer_failed : public exception
{
public:
    storage_writer_failed(const std::string& path, const std::string& message)
        : exception(fmt::format("Failed to write to {}: {}", path, message), {{"resource", path}, {"message", message}})
    {
    }
};

} // namespace storage
