#pragma once

/** \file directory_indexer.hpp
 *  \brief Batch indexing of every matching source file under a location.
 */

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "bloomdb/data/table_source.hpp"
#include "bloomdb/error.hpp"
#include "bloomdb/file_index.hpp"
#include "bloomdb/index/column_index.hpp"
#include "bloomdb/storage/index_store.hpp"

namespace bloomdb::indexer {

struct FileReport {
    std::string source;                      /**< input location */
    std::string index_location;              /**< empty when nothing was written */
    std::vector<ColumnFailure> column_failures;
    std::optional<core::error> error;        /**< set when the file was not indexed */

    [[nodiscard]] auto ok() const noexcept -> bool { return !error.has_value(); }
};

struct IndexReport {
    std::vector<FileReport> files;           /**< sorted by source name */

    [[nodiscard]] auto indexed() const noexcept -> std::size_t;
    [[nodiscard]] auto failed() const noexcept -> std::size_t { return files.size() - indexed(); }
};

/** \brief Index one source: parse as CSV, build, write next to output_location. */
auto index_file(const std::string& source, const std::string& output_location,
                const index::ColumnIndexBuilder& builder, const storage::IndexStore& store,
                const data::CsvOptions& csv = {}) -> FileReport;

/** \brief Index every file in input_dir whose name matches file_pattern.
 *
 * A failing file is recorded in its FileReport and does not stop the batch.
 * \return not_found/io_failed only when input_dir itself cannot be listed
 */
auto index_directory(const std::string& input_dir, const std::string& file_pattern,
                     const std::string& output_location, const index::ColumnIndexBuilder& builder,
                     const storage::IndexStore& store, const data::CsvOptions& csv = {})
    -> std::expected<IndexReport, core::error>;

} // namespace bloomdb::indexer
