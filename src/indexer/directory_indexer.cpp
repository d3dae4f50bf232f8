#include "bloomdb/indexer/directory_indexer.hpp"

#include <algorithm>
#include <iostream>
#include <string_view>

#include "bloomdb/core/platform_utils.hpp"
#include "bloomdb/storage/backend.hpp"

namespace bloomdb::indexer {

auto IndexReport::indexed() const noexcept -> std::size_t {
  return static_cast<std::size_t>(std::count_if(files.begin(), files.end(),
                                                [](const FileReport& f) { return f.ok(); }));
}

auto index_file(const std::string& source, const std::string& output_location,
                const index::ColumnIndexBuilder& builder, const storage::IndexStore& store,
                const data::CsvOptions& csv) -> FileReport {
  FileReport report;
  report.source = source;

  auto backend = storage::open_backend(source);
  if (!backend) {
    report.error = backend.error();
    return report;
  }
  auto bytes = (*backend)->get(source);
  if (!bytes) {
    report.error = core::error{core::error_code::data_source, bytes.error().message, "indexer"};
    return report;
  }
  const std::string_view text(reinterpret_cast<const char*>(bytes->data()), bytes->size());
  auto table = data::CsvTable::parse(text, source, csv);
  if (!table) {
    report.error = table.error();
    return report;
  }

  auto built = build_file_index(*table, builder);
  for (const auto& f : built.failures) {
    std::cerr << "[INDEXER] " << source << ": column '" << f.column << "' skipped: "
              << f.error.message << std::endl;
  }
  report.column_failures = std::move(built.failures);

  const auto dest = storage::index_location_for(source, output_location);
  if (auto ok = store.write(built.index, dest); !ok) {
    report.error = ok.error();
    return report;
  }
  report.index_location = dest;
  if (core::debug_enabled()) {
    std::cerr << "[INDEXER] " << source << " -> " << dest << " (" << built.index.columns().size()
              << " columns, " << table->row_count() << " rows)" << std::endl;
  }
  return report;
}

auto index_directory(const std::string& input_dir, const std::string& file_pattern,
                     const std::string& output_location, const index::ColumnIndexBuilder& builder,
                     const storage::IndexStore& store, const data::CsvOptions& csv)
    -> std::expected<IndexReport, core::error> {
  auto backend = storage::open_backend(input_dir);
  if (!backend) return std::unexpected(backend.error());
  auto sources = (*backend)->list(input_dir, file_pattern);
  if (!sources) return std::unexpected(sources.error());

  IndexReport report;
  report.files.reserve(sources->size());
  for (const auto& source : *sources) {
    auto file = index_file(source, output_location, builder, store, csv);
    if (!file.ok()) {
      std::cerr << "[INDEXER] " << source << " failed: " << core::describe(*file.error) << std::endl;
    }
    report.files.push_back(std::move(file));
  }
  std::cerr << "[INDEXER] indexed " << report.indexed() << "/" << report.files.size()
            << " file(s) from " << input_dir << std::endl;
  return report;
}

} // namespace bloomdb::indexer
