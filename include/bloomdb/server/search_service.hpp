#pragma once

/** \file search_service.hpp
 *  \brief Transport-independent search: resolve index files, load, evaluate.
 *
 * Policy: a file whose index fails to load is excluded from the result and
 * reported in SearchOutcome::failures; the remaining files still answer.
 * Thread-safety: search() may be called concurrently.
 */

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "bloomdb/cache/index_cache.hpp"
#include "bloomdb/error.hpp"
#include "bloomdb/protocol/wire.hpp"
#include "bloomdb/query/rule.hpp"
#include "bloomdb/storage/index_store.hpp"

namespace bloomdb::server {

struct FileFailure {
    std::string location;
    core::error error;
};

struct LoadedIndexes {
    std::vector<cache::IndexPtr> indexes;  /**< resolution order, failures skipped */
    std::vector<FileFailure> failures;
};

struct SearchOutcome {
    std::vector<std::string> files;      /**< candidate source paths, resolution order */
    std::vector<FileFailure> failures;   /**< indexes that could not be loaded */
};

class SearchService {
public:
    /** \param cache shared read-through cache; nullptr loads every index per request */
    SearchService(std::string index_root, std::shared_ptr<cache::IndexCache> cache,
                  storage::IndexStore store = {});

    /** \brief Index locations under index_source whose stem matches file_pattern.
     *
     * \return invalid_argument for absolute or escaping sources, not_found when
     *         the source does not exist; an empty list when nothing matches
     */
    auto resolve(const std::string& index_source, const std::string& file_pattern) const
        -> std::expected<std::vector<std::string>, core::error>;

    /** \brief Load each location through the cache; cancelled() is polled between loads.
     *
     * Unreadable indexes are logged and listed in failures. Returns cancelled
     * when cancelled() reports true.
     */
    auto load(const std::vector<std::string>& locations,
              const std::function<bool()>& cancelled = {}) const
        -> std::expected<LoadedIndexes, core::error>;

    /** \brief Source paths of the loaded files that might satisfy expr. */
    static auto evaluate(const query::rule& expr, const LoadedIndexes& loaded) -> std::vector<std::string>;

    /** \brief resolve(), load() and evaluate() in sequence. */
    auto search(const protocol::search_request& request,
                const std::function<bool()>& cancelled = {}) const
        -> std::expected<SearchOutcome, core::error>;

    [[nodiscard]] auto index_root() const noexcept -> const std::string& { return index_root_; }

private:
    std::string index_root_;
    std::shared_ptr<cache::IndexCache> cache_;
    storage::IndexStore store_;
};

} // namespace bloomdb::server
