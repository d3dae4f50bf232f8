#pragma once

/** \file bloom_filter.hpp
 *  \brief Bloom filter over scalar values (membership index of a column).
 *
 * Sizing: m = ceil(-n ln p / (ln 2)^2) bits rounded up to whole 64-bit words,
 * k = round(-log2 p) bit positions per value, using double hashing over value_hash().
 * Contract: contains() never returns false for an inserted value.
 * Thread-safety: const methods are safe for concurrent use.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "bloomdb/error.hpp"
#include "bloomdb/value.hpp"

namespace bloomdb::index {

class BloomFilter {
public:
    /** \brief Empty filter sized for capacity elements at false-positive rate error_rate. */
    static auto with_capacity(std::size_t capacity, double error_rate) -> BloomFilter;

    /** \brief Rebuild from serialized state; validates word count against num_bits. */
    static auto from_words(std::uint64_t num_bits, std::uint32_t num_hashes,
                           std::uint64_t inserted, std::vector<std::uint64_t> words)
        -> std::expected<BloomFilter, core::error>;

    auto insert(const value& v) -> void;
    [[nodiscard]] auto contains(const value& v) const -> bool;

    [[nodiscard]] auto num_bits() const noexcept -> std::uint64_t { return num_bits_; }
    [[nodiscard]] auto num_hashes() const noexcept -> std::uint32_t { return num_hashes_; }
    [[nodiscard]] auto inserted() const noexcept -> std::uint64_t { return inserted_; }
    [[nodiscard]] auto words() const noexcept -> std::span<const std::uint64_t> { return words_; }

    /** \brief Expected false-positive rate for the current fill. */
    [[nodiscard]] auto estimated_fpp() const -> double;

private:
    BloomFilter(std::uint64_t num_bits, std::uint32_t num_hashes);

    std::uint64_t num_bits_{0};
    std::uint32_t num_hashes_{0};
    std::uint64_t inserted_{0};
    std::vector<std::uint64_t> words_;
};

} // namespace bloomdb::index
