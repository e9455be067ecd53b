#include "csv_table.hpp"
#include "exceptions.hpp"

#include <arrow/api.h>
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <spdlog/spdlog.h>

namespace gaez {

    csv_table::csv_table(std::string path, int64_t num_rows, std::map<std::string, std::vector<std::string>> columns)
            : path_(std::move(path)), num_rows_(num_rows), columns_(std::move(columns)) {}

    csv_table csv_table::read(const storage::storage &storage, const std::string &path, const std::vector<std::string> &columns) {
        spdlog::debug("Reading mapping table {}", path);
        auto file_data = storage.get_bytes(path);
        auto buffer = arrow::Buffer::FromString(std::string(file_data.begin(), file_data.end()));
        auto input = std::make_shared<arrow::io::BufferReader>(buffer);

        auto read_options = arrow::csv::ReadOptions::Defaults();
        auto parse_options = arrow::csv::ParseOptions::Defaults();
        auto convert_options = arrow::csv::ConvertOptions::Defaults();
        for (const auto &column: columns) {
            convert_options.column_types[column] = arrow::utf8();
        }

        auto maybe_reader = arrow::csv::TableReader::Make(arrow::io::default_io_context(), input, read_options, parse_options, convert_options);
        if (!maybe_reader.ok()) {
            throw mapping_parse_error(path, maybe_reader.status().message());
        }
        auto maybe_table = (*maybe_reader)->Read();
        if (!maybe_table.ok()) {
            throw mapping_parse_error(path, maybe_table.status().message());
        }
        auto table = *maybe_table;

        std::map<std::string, std::vector<std::string>> values;
        for (const auto &column: columns) {
            auto chunked = table->GetColumnByName(column);
            if (chunked == nullptr) {
                throw mapping_parse_error(path, "missing column '" + column + "'");
            }
            auto &column_values = values[column];
            column_values.reserve(static_cast<size_t>(table->num_rows()));
            for (const auto &chunk: chunked->chunks()) {
                auto strings = std::static_pointer_cast<arrow::StringArray>(chunk);
                for (int64_t i = 0; i < strings->length(); ++i) {
                    column_values.push_back(strings->IsNull(i) ? std::string() : strings->GetString(i));
                }
            }
        }

        return {path, table->num_rows(), std::move(values)};
    }

    const std::string &csv_table::path() const {
        return path_;
    }

    int64_t csv_table::num_rows() const {
        return num_rows_;
    }

    const std::string &csv_table::value(const std::string &column, int64_t row) const {
        return columns_.at(column).at(static_cast<size_t>(row));
    }

}
