#pragma once

/** \file file_index.hpp
 *  \brief All column indexes of one source file; the unit of persistence.
 *
 * Ownership: value-semantic and immutable after construction. Loaded instances
 * are shared read-only between request handlers via shared_ptr<const FileIndex>.
 */

#include <expected>
#include <map>
#include <string>
#include <vector>

#include "bloomdb/data/table_source.hpp"
#include "bloomdb/error.hpp"
#include "bloomdb/index/column_index.hpp"

namespace bloomdb {

class FileIndex {
public:
    using column_map = std::map<std::string, index::ColumnIndex>;

    FileIndex(std::string source_path, index::BuildConfig config, column_map columns)
        : source_path_(std::move(source_path)), config_(config), columns_(std::move(columns)) {}

    [[nodiscard]] auto source_path() const noexcept -> const std::string& { return source_path_; }

    /** \brief Configuration the indexes were built with. */
    [[nodiscard]] auto build_config() const noexcept -> const index::BuildConfig& { return config_; }

    [[nodiscard]] auto columns() const noexcept -> const column_map& { return columns_; }

    /** \brief Column index by exact name, or nullptr when the column was never observed. */
    [[nodiscard]] auto find(const std::string& column) const -> const index::ColumnIndex* {
        auto it = columns_.find(column);
        return it == columns_.end() ? nullptr : &it->second;
    }

private:
    std::string source_path_;
    index::BuildConfig config_;
    column_map columns_;
};

/** \brief A column that could not be indexed; its siblings are unaffected. */
struct ColumnFailure {
    std::string column;
    core::error error;
};

struct FileIndexBuild {
    FileIndex index;
    std::vector<ColumnFailure> failures; /**< empty when every column was indexed */
};

/** \brief Index every column of a table independently.
 *
 * Columns that fail (invalid_column) are left out of the FileIndex and listed
 * in failures. Duplicate column names are an invalid_column failure for the
 * later occurrence.
 */
auto build_file_index(const data::TableSource& table, const index::ColumnIndexBuilder& builder)
    -> FileIndexBuild;

} // namespace bloomdb
