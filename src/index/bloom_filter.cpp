#include "bloomdb/index/bloom_filter.hpp"

#include <algorithm>
#include <cmath>

namespace bloomdb::index {

namespace {

inline auto splitmix64(std::uint64_t x) noexcept -> std::uint64_t {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

constexpr std::uint32_t kMaxHashes = 32;

} // namespace

BloomFilter::BloomFilter(std::uint64_t num_bits, std::uint32_t num_hashes)
    : num_bits_(num_bits)
    , num_hashes_(num_hashes)
    , words_(static_cast<std::size_t>(num_bits / 64), 0) {}

auto BloomFilter::with_capacity(std::size_t capacity, double error_rate) -> BloomFilter {
  // Zero-capacity filters still get one word so probing stays well defined.
  const double n = static_cast<double>(std::max<std::size_t>(capacity, 1));
  const double ln2 = std::log(2.0);
  const double raw_bits = std::ceil(-n * std::log(error_rate) / (ln2 * ln2));
  const std::uint64_t words = std::max<std::uint64_t>(1, (static_cast<std::uint64_t>(raw_bits) + 63) / 64);
  const auto k = static_cast<std::uint32_t>(std::lround(-std::log2(error_rate)));
  return BloomFilter(words * 64, std::clamp<std::uint32_t>(k, 1, kMaxHashes));
}

auto BloomFilter::from_words(std::uint64_t num_bits, std::uint32_t num_hashes,
                             std::uint64_t inserted, std::vector<std::uint64_t> words)
    -> std::expected<BloomFilter, core::error> {
  using core::error; using core::error_code;
  if (num_bits == 0 || num_bits % 64 != 0 || words.size() != num_bits / 64) {
    return std::unexpected(error{error_code::data_integrity, "bloom bit count mismatch", "index.bloom"});
  }
  if (num_hashes == 0 || num_hashes > kMaxHashes) {
    return std::unexpected(error{error_code::data_integrity, "bloom hash count out of range", "index.bloom"});
  }
  BloomFilter f(num_bits, num_hashes);
  f.inserted_ = inserted;
  f.words_ = std::move(words);
  return f;
}

auto BloomFilter::insert(const value& v) -> void {
  const std::uint64_t h = value_hash(v);
  const std::uint64_t h1 = splitmix64(h);
  const std::uint64_t h2 = splitmix64(h ^ 0x6a09e667f3bcc909ULL) | 1ULL;
  for (std::uint32_t i = 0; i < num_hashes_; ++i) {
    const std::uint64_t bit = (h1 + static_cast<std::uint64_t>(i) * h2) % num_bits_;
    words_[bit >> 6] |= (1ULL << (bit & 63));
  }
  ++inserted_;
}

auto BloomFilter::contains(const value& v) const -> bool {
  if (inserted_ == 0) return false;
  const std::uint64_t h = value_hash(v);
  const std::uint64_t h1 = splitmix64(h);
  const std::uint64_t h2 = splitmix64(h ^ 0x6a09e667f3bcc909ULL) | 1ULL;
  for (std::uint32_t i = 0; i < num_hashes_; ++i) {
    const std::uint64_t bit = (h1 + static_cast<std::uint64_t>(i) * h2) % num_bits_;
    if ((words_[bit >> 6] & (1ULL << (bit & 63))) == 0) return false;
  }
  return true;
}

auto BloomFilter::estimated_fpp() const -> double {
  if (inserted_ == 0) return 0.0;
  const double k = static_cast<double>(num_hashes_);
  const double fill = 1.0 - std::exp(-k * static_cast<double>(inserted_) / static_cast<double>(num_bits_));
  return std::pow(fill, k);
}

} // namespace bloomdb::index
