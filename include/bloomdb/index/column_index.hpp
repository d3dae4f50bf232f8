#pragma once

/** \file column_index.hpp
 *  \brief Per-column index (Bloom filter or range bounds) and its builder.
 *
 * Selection rule: distinct-value count below range_filter_threshold builds a
 * BloomFilter, at or above builds a RangeIndex. An empty column builds a
 * BloomFilter with zero insertions, which matches nothing.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <variant>

#include "bloomdb/error.hpp"
#include "bloomdb/index/bloom_filter.hpp"
#include "bloomdb/index/range_index.hpp"
#include "bloomdb/value.hpp"

namespace bloomdb::index {

/** \brief Persisted kind tag; values are part of the on-disk format. */
enum class ColumnIndexKind : std::uint8_t {
    membership = 1,
    range = 2,
};

class ColumnIndex {
public:
    explicit ColumnIndex(BloomFilter filter) : repr_(std::move(filter)) {}
    explicit ColumnIndex(RangeIndex range) : repr_(std::move(range)) {}

    /** \brief May the column hold v? False answers are always exact. */
    [[nodiscard]] auto contains(const value& v) const -> bool {
        return std::visit([&](const auto& idx) { return idx.contains(v); }, repr_);
    }

    [[nodiscard]] auto kind() const noexcept -> ColumnIndexKind {
        return std::holds_alternative<BloomFilter>(repr_) ? ColumnIndexKind::membership
                                                          : ColumnIndexKind::range;
    }

    [[nodiscard]] auto as_bloom() const noexcept -> const BloomFilter* { return std::get_if<BloomFilter>(&repr_); }
    [[nodiscard]] auto as_range() const noexcept -> const RangeIndex* { return std::get_if<RangeIndex>(&repr_); }

private:
    std::variant<BloomFilter, RangeIndex> repr_;
};

/** \brief Build-time configuration, fixed for the lifetime of an index. */
struct BuildConfig {
    double error_rate{0.1};                    /**< Bloom false-positive target, 0 < p < 1 */
    std::uint64_t range_filter_threshold{1000}; /**< distinct count at which ranges take over */
};

class ColumnIndexBuilder {
public:
    /** \brief Validate configuration.
     *
     * \return Builder, or config_invalid when error_rate is outside (0,1) or the
     *         threshold is zero
     */
    static auto create(BuildConfig config) -> std::expected<ColumnIndexBuilder, core::error>;

    /** \brief Build the index of one column from all of its values (duplicates allowed).
     *
     * \return invalid_column when a range is required but the values are not mutually ordered
     */
    [[nodiscard]] auto build(std::span<const value> values) const
        -> std::expected<ColumnIndex, core::error>;

    [[nodiscard]] auto config() const noexcept -> const BuildConfig& { return config_; }

private:
    explicit ColumnIndexBuilder(BuildConfig config) : config_(config) {}

    BuildConfig config_;
};

} // namespace bloomdb::index
