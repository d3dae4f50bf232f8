#include "bloomdb/file_index.hpp"

#include <set>

namespace bloomdb {

auto build_file_index(const data::TableSource& table, const index::ColumnIndexBuilder& builder)
    -> FileIndexBuild {
  FileIndex::column_map columns;
  std::vector<ColumnFailure> failures;
  std::set<std::string> seen;
  const auto& names = table.column_names();
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (!seen.insert(names[i]).second) {
      failures.push_back({names[i], core::error{core::error_code::invalid_column,
                                                "duplicate column name", "index.file"}});
      continue;
    }
    auto built = builder.build(table.column(i));
    if (!built) {
      failures.push_back({names[i], built.error()});
      continue;
    }
    columns.emplace(names[i], std::move(*built));
  }
  return FileIndexBuild{FileIndex(table.source_path(), builder.config(), std::move(columns)),
                        std::move(failures)};
}

} // namespace bloomdb
