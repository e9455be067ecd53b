#pragma once

#include "file_ref.hpp"

#include <cstdint>
#include <string>
#include <vector>

/**
 * @file storage.hpp
 * @brief Storage module level definitions.
 */

/**
 * @defgroup storage
 * @{
 * @brief storage module.
 *
 * key-value storage abstraction used for lookup tables and output artifacts.
 *
 * @}
 */

namespace storage {

class storage
{
public:
    virtual ~storage() = default;

    /**
     * @brief Describes the resource at the given path.
     *
     * @param path The path of the resource, relative to the storage root.
     * @return file_ref with size -1 if the resource does not exist.
     */
    virtual file_ref file(const std::string& path) const = 0;

    /**
     * @brief Lists the regular files directly under the given directory, sorted by path.
     */
    virtual std::vector<file_ref> list_files(const std::string& base_dir) const = 0;

    /**
     * @brief Reads the whole resource.
     *
     * @throws storage_key_not_found if the resource does not exist.
     */
    virtual std::vector<uint8_t> get_bytes(const std::string& path) const = 0;

    /**
     * @brief Replaces the resource with the given bytes, creating parent locations as needed.
     */
    virtual void set_bytes(const std::string& path, const std::string& data) const = 0;
};

} // namespace storage
