#include "bloomdb/server/search_service.hpp"

#include <iostream>

#include "bloomdb/core/platform_utils.hpp"
#include "bloomdb/query/evaluator.hpp"
#include "bloomdb/storage/backend.hpp"

namespace bloomdb::server {

namespace {

// Relative, no "..": requests may not reach outside the index root.
auto safe_source(const std::string& source) -> bool {
  if (!source.empty() && source.front() == '/') return false;
  if (source.find("://") != std::string::npos) return false;
  std::size_t start = 0;
  while (start <= source.size()) {
    const auto end = source.find('/', start);
    const auto part = source.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (part == "..") return false;
    if (end == std::string::npos) break;
    start = end + 1;
  }
  return true;
}

} // namespace

SearchService::SearchService(std::string index_root, std::shared_ptr<cache::IndexCache> cache,
                             storage::IndexStore store)
    : index_root_(std::move(index_root)), cache_(std::move(cache)), store_(store) {}

auto SearchService::resolve(const std::string& index_source, const std::string& file_pattern) const
    -> std::expected<std::vector<std::string>, core::error> {
  if (!safe_source(index_source)) {
    return std::unexpected(core::error{core::error_code::invalid_argument,
        "index_source must be a relative path inside the index root", "server.search"});
  }
  if (file_pattern.empty()) {
    return std::unexpected(core::error{core::error_code::invalid_argument,
        "file_pattern must not be empty", "server.search"});
  }
  const auto base = index_source.empty() ? index_root_ : storage::join_location(index_root_, index_source);
  auto backend = storage::open_backend(base);
  if (!backend) return std::unexpected(backend.error());
  return (*backend)->list(base, file_pattern + std::string(storage::INDEX_FILE_EXTENSION));
}

auto SearchService::load(const std::vector<std::string>& locations,
                         const std::function<bool()>& cancelled) const
    -> std::expected<LoadedIndexes, core::error> {
  const cache::IndexLoader loader = [this](const std::string& loc) { return store_.read(loc); };
  LoadedIndexes out;
  out.indexes.reserve(locations.size());
  for (const auto& loc : locations) {
    if (cancelled && cancelled()) {
      return std::unexpected(core::error{core::error_code::cancelled, "client went away", "server.search"});
    }
    std::expected<cache::IndexPtr, core::error> idx = cache_
        ? cache_->get_or_load(loc, loader)
        : [&]() -> std::expected<cache::IndexPtr, core::error> {
            auto f = store_.read(loc);
            if (!f) return std::unexpected(f.error());
            return std::make_shared<const FileIndex>(std::move(*f));
          }();
    if (!idx) {
      std::cerr << "[SERVER][load] excluding " << loc << ": " << core::describe(idx.error()) << std::endl;
      out.failures.push_back({loc, idx.error()});
      continue;
    }
    out.indexes.push_back(std::move(*idx));
  }
  return out;
}

auto SearchService::evaluate(const query::rule& expr, const LoadedIndexes& loaded) -> std::vector<std::string> {
  return query::candidate_files(expr, loaded.indexes);
}

auto SearchService::search(const protocol::search_request& request,
                           const std::function<bool()>& cancelled) const
    -> std::expected<SearchOutcome, core::error> {
  auto locations = resolve(request.index_source, request.file_pattern);
  if (!locations) return std::unexpected(locations.error());
  if (core::debug_enabled()) {
    std::cerr << "[SERVER][resolve] " << locations->size() << " index file(s) for '"
              << request.file_pattern << "' in '" << request.index_source << "'" << std::endl;
  }
  auto loaded = load(*locations, cancelled);
  if (!loaded) return std::unexpected(loaded.error());
  return SearchOutcome{evaluate(request.query, *loaded), std::move(loaded->failures)};
}

} // namespace bloomdb::server
