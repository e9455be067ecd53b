#include "file_ref.hpp"

namespace storage {

    file_ref file_ref::missing(std::string path) {
        return {std::move(path), -1};
    }

    bool file_ref::exists() const {
        return size >= 0;
    }

}
