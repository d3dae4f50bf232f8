#include "bloomdb/cache/index_cache.hpp"

#include <algorithm>

namespace bloomdb::cache {

IndexCache::IndexCache(std::size_t capacity, std::size_t num_shards)
    : capacity_(capacity) {
  if (capacity_ == 0) return;
  num_shards = std::clamp<std::size_t>(num_shards, 1, capacity_);
  const std::size_t per_shard = (capacity_ + num_shards - 1) / num_shards;
  shards_.reserve(num_shards);
  for (std::size_t i = 0; i < num_shards; ++i) {
    shards_.push_back(std::make_unique<IndexCacheShard>(per_shard));
  }
}

auto IndexCache::shard_for(const std::string& key) -> IndexCacheShard& {
  return *shards_[std::hash<std::string>{}(key) % shards_.size()];
}

auto IndexCache::get(const std::string& location) -> IndexPtr {
  if (shards_.empty()) return nullptr;
  return shard_for(location).get(location);
}

auto IndexCache::get_or_load(const std::string& location, const IndexLoader& loader)
    -> std::expected<IndexPtr, core::error> {
  if (shards_.empty()) {
    auto loaded = loader(location);
    if (!loaded) return std::unexpected(loaded.error());
    return std::make_shared<const FileIndex>(std::move(*loaded));
  }
  auto& shard = shard_for(location);
  if (auto hit = shard.get(location)) return hit;
  auto loaded = loader(location);
  if (!loaded) return std::unexpected(loaded.error());
  return shard.insert_if_absent(location, std::make_shared<const FileIndex>(std::move(*loaded)));
}

auto IndexCache::clear() -> void {
  for (auto& s : shards_) s->clear();
}

auto IndexCache::size() const -> std::size_t {
  std::size_t n = 0;
  for (const auto& s : shards_) n += s->size();
  return n;
}

auto IndexCache::stats() const -> CacheStats {
  CacheStats out;
  for (const auto& s : shards_) s->accumulate(out);
  return out;
}

} // namespace bloomdb::cache
