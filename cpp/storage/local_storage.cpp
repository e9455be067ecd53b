#include "local_storage.hpp"
#include "exceptions.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string_view>

namespace storage {

    local_storage::local_storage(const std::string &root) : root_(std::filesystem::absolute(root)) {
        std::filesystem::create_directories(root_);
    }

    const std::filesystem::path &local_storage::root() const {
        return root_;
    }

    std::filesystem::path local_storage::resolve(const std::string &path) const {
        auto relative = std::string_view(path);
        while (relative.starts_with('/')) {
            relative.remove_prefix(1);
        }
        return root_ / std::filesystem::path(relative);
    }

    file_ref local_storage::file(const std::string &path) const {
        auto file_path = resolve(path);
        if (std::filesystem::exists(file_path)) {
            if (std::filesystem::is_regular_file(file_path)) {
                return file_ref(path, static_cast<int64_t>(std::filesystem::file_size(file_path)));
            }
            return file_ref(path, 0);
        }
        return file_ref::missing(path);
    }

    std::vector<file_ref> local_storage::list_files(const std::string &base_dir) const {
        auto base_dir_path = resolve(base_dir);
        std::vector<file_ref> files;
        if (!std::filesystem::is_directory(base_dir_path)) {
            return files;
        }
        for (const auto &entry: std::filesystem::directory_iterator(base_dir_path)) {
            if (entry.is_regular_file()) {
                files.emplace_back("/" + std::filesystem::relative(entry.path(), root_).string(),
                                   static_cast<int64_t>(entry.file_size()));
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    std::vector<uint8_t> local_storage::get_bytes(const std::string &path) const {
        auto final_path = resolve(path);
        if (!std::filesystem::is_regular_file(final_path)) {
            throw storage_key_not_found(final_path.string());
        }

        auto file = std::ifstream(final_path, std::ios::binary);

        if (!file.is_open()) {
            throw storage_reader_error(final_path.string(), "cannot open file");
        }

        file.seekg(0, std::ios::end);
        std::streampos file_size = file.tellg();
        file.seekg(0, std::ios::beg);

        if (file_size <= 0) {
            return {};
        }

        std::vector<uint8_t> return_data(static_cast<size_t>(file_size));
        file.read(reinterpret_cast<char *>(return_data.data()), file_size);

        if (!file) {
            throw storage_reader_error(final_path.string(), "short read");
        }

        return return_data;
    }

    void local_storage::set_bytes(const std::string &path, const std::string &data) const {
        auto final_path = resolve(path);
        std::filesystem::create_directories(final_path.parent_path());

        std::ofstream stream{final_path, std::ios::binary | std::ios::trunc};
        if (!stream.is_open()) {
            throw storage_writer_failed(final_path.string(), "cannot open file for writing");
        }
        stream.write(data.data(), static_cast<std::streamsize>(data.size()));
        stream.close();
        if (!stream) {
            throw storage_writer_failed(final_path.string(), "write failed");
        }
    }

}
