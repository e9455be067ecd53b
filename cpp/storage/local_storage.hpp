#pragma once

#include "storage.hpp"

#include <filesystem>
#include <string>

namespace storage {

    /**
     * @brief Storage on a local directory. Keys are paths relative to the root, a leading `/` is ignored.
     *
     * The root directory is created on construction. Used for the lookup tables and the output tree.
     */
    class local_storage : public ::storage::storage {
    public:
        explicit local_storage(const std::string &root);

        const std::filesystem::path &root() const;

        file_ref file(const std::string &path) const override;

        std::vector<file_ref> list_files(const std::string &base_dir) const override;

        std::vector<uint8_t> get_bytes(const std::string &path) const override;

        void set_bytes(const std::string &path, const std::string &data) const override;

    private:
        std::filesystem::path resolve(const std::string &path) const;

        std::filesystem::path root_;
    };

}
