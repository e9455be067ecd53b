#pragma once

#include <storage/storage.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace gaez {

    /**
     * @brief String columns of a CSV file, read with the Arrow CSV reader.
     *
     * Only the requested columns are kept. Empty cells are empty strings.
     */
    class csv_table {
    public:
        /**
         * @throws mapping_parse_error if the file cannot be parsed or a requested column is missing.
         */
        static csv_table read(const storage::storage &storage, const std::string &path, const std::vector<std::string> &columns);

        const std::string &path() const;

        int64_t num_rows() const;

        const std::string &value(const std::string &column, int64_t row) const;

    private:
        csv_table(std::string path, int64_t num_rows, std::map<std::string, std::vector<std::string>> columns);

        std::string path_;
        int64_t num_rows_;
        std::map<std::string, std::vector<std::string>> columns_;
    };

}
