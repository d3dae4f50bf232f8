#pragma once

/** \file table_source.hpp
 *  \brief Tabular data sources: ordered column names and per-column values.
 */

#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "bloomdb/error.hpp"
#include "bloomdb/value.hpp"

namespace bloomdb::data {

/** \brief Read-only view of one source file's columns. */
class TableSource {
public:
    virtual ~TableSource() = default;

    /** \brief Identifying path of the source file. */
    [[nodiscard]] virtual auto source_path() const -> const std::string& = 0;

    /** \brief Column names in file order. */
    [[nodiscard]] virtual auto column_names() const -> const std::vector<std::string>& = 0;

    /** \brief Non-missing values of column i (row order is not significant). */
    [[nodiscard]] virtual auto column(std::size_t i) const -> std::span<const value> = 0;
};

/** \brief Columns held in memory; used by tests and by callers with their own loaders. */
class MemoryTable final : public TableSource {
public:
    explicit MemoryTable(std::string source_path) : source_path_(std::move(source_path)) {}

    auto add_column(std::string name, std::vector<value> values) -> MemoryTable& {
        names_.push_back(std::move(name));
        columns_.push_back(std::move(values));
        return *this;
    }

    [[nodiscard]] auto source_path() const -> const std::string& override { return source_path_; }
    [[nodiscard]] auto column_names() const -> const std::vector<std::string>& override { return names_; }
    [[nodiscard]] auto column(std::size_t i) const -> std::span<const value> override { return columns_.at(i); }

private:
    std::string source_path_;
    std::vector<std::string> names_;
    std::vector<std::vector<value>> columns_;
};

struct CsvOptions {
    char delimiter{','};
    char quote{'"'};
};

/** \brief CSV file with a header row.
 *
 * Unquoted cells are typed via parse_cell(); quoted cells stay strings. Empty
 * unquoted cells are missing values and are skipped.
 */
class CsvTable final : public TableSource {
public:
    /** \brief Load and parse a whole file.
     *
     * \return data_source on missing file, empty header or ragged rows
     */
    static auto load(const std::string& path, CsvOptions options = {})
        -> std::expected<CsvTable, core::error>;

    /** \brief Parse CSV text already in memory; path is recorded as the source. */
    static auto parse(std::string_view text, std::string source_path, CsvOptions options = {})
        -> std::expected<CsvTable, core::error>;

    [[nodiscard]] auto source_path() const -> const std::string& override { return source_path_; }
    [[nodiscard]] auto column_names() const -> const std::vector<std::string>& override { return names_; }
    [[nodiscard]] auto column(std::size_t i) const -> std::span<const value> override { return columns_.at(i); }
    [[nodiscard]] auto row_count() const noexcept -> std::size_t { return rows_; }

private:
    CsvTable() = default;

    std::string source_path_;
    std::vector<std::string> names_;
    std::vector<std::vector<value>> columns_;
    std::size_t rows_{0};
};

} // namespace bloomdb::data
