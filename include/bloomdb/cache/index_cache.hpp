/** \file index_cache.hpp
 *  \brief Thread-safe sharded LRU cache of loaded FileIndex objects.
 *
 * Entries are immutable once inserted. A miss loads outside the shard lock and
 * inserts only if no other thread got there first, so concurrent loaders of the
 * same location all end up sharing the first inserted instance.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "bloomdb/error.hpp"
#include "bloomdb/file_index.hpp"

namespace bloomdb::cache {

/**
 * \brief Statistics for cache performance monitoring
 */
struct CacheStats {
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t inserts{0};
    std::uint64_t evictions{0};

    [[nodiscard]] auto hit_rate() const -> double {
        auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }
};

using IndexPtr = std::shared_ptr<const FileIndex>;
using IndexLoader = std::function<std::expected<FileIndex, core::error>(const std::string&)>;

/**
 * \brief LRU cache shard, bounded by entry count
 */
class IndexCacheShard {
public:
    explicit IndexCacheShard(std::size_t capacity) : capacity_(capacity) {}

    IndexCacheShard(const IndexCacheShard&) = delete;
    IndexCacheShard& operator=(const IndexCacheShard&) = delete;

    [[nodiscard]] auto get(const std::string& key) -> IndexPtr {
        std::unique_lock lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
        // Move to front (most recently used)
        if (it->second != lru_list_.begin()) {
            lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        }
        hits_.fetch_add(1, std::memory_order_relaxed);
        return it->second->value;
    }

    /** \brief Insert unless present; returns the resident entry either way. */
    auto insert_if_absent(const std::string& key, IndexPtr value) -> IndexPtr {
        std::unique_lock lock(mutex_);
        auto it = index_.find(key);
        if (it != index_.end()) return it->second->value;
        while (lru_list_.size() >= capacity_ && !lru_list_.empty()) {
            index_.erase(lru_list_.back().key);
            lru_list_.pop_back();
            evictions_.fetch_add(1, std::memory_order_relaxed);
        }
        lru_list_.push_front(Entry{key, value});
        index_.emplace(key, lru_list_.begin());
        inserts_.fetch_add(1, std::memory_order_relaxed);
        return value;
    }

    auto clear() -> void {
        std::unique_lock lock(mutex_);
        lru_list_.clear();
        index_.clear();
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::shared_lock lock(mutex_);
        return index_.size();
    }

    auto accumulate(CacheStats& s) const -> void {
        s.hits += hits_.load(std::memory_order_relaxed);
        s.misses += misses_.load(std::memory_order_relaxed);
        s.inserts += inserts_.load(std::memory_order_relaxed);
        s.evictions += evictions_.load(std::memory_order_relaxed);
    }

private:
    struct Entry {
        std::string key;
        IndexPtr value;
    };

    mutable std::shared_mutex mutex_;
    std::list<Entry> lru_list_;
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
    std::size_t capacity_;

    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> inserts_{0};
    std::atomic<std::uint64_t> evictions_{0};
};

/**
 * \brief Sharded read-through cache keyed by index location
 */
class IndexCache {
public:
    static constexpr std::size_t DEFAULT_NUM_SHARDS = 16;

    /** \param capacity total entries; 0 disables caching (every lookup loads) */
    explicit IndexCache(std::size_t capacity, std::size_t num_shards = DEFAULT_NUM_SHARDS);

    /** \brief Cached entry, or load it with loader and cache the result.
     *
     * Load failures are returned unchanged and nothing is cached.
     */
    auto get_or_load(const std::string& location, const IndexLoader& loader)
        -> std::expected<IndexPtr, core::error>;

    /** \brief Cached entry or nullptr; counts a hit or miss. */
    [[nodiscard]] auto get(const std::string& location) -> IndexPtr;

    auto clear() -> void;

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto stats() const -> CacheStats;
    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }

private:
    auto shard_for(const std::string& key) -> IndexCacheShard&;

    std::size_t capacity_;
    std::vector<std::unique_ptr<IndexCacheShard>> shards_;
};

} // namespace bloomdb::cache
