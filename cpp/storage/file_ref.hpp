#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace storage {

    /**
     * @brief Path of a stored object and its size in bytes. A missing object has size -1.
     */
    struct file_ref {
        std::string path;
        int64_t size;

        file_ref(std::string path, int64_t size) : path(std::move(path)), size(size) {}

        static file_ref missing(std::string path);

        [[nodiscard]] bool exists() const;

        bool operator<(const file_ref &other) const {
            return path < other.path;
        }
    };

}
