#pragma once

/** \file range_index.hpp
 *  \brief Inclusive [min, max] bounds of a column.
 *
 * contains() is exact for values outside the bounds and over-includes values
 * inside them. Lookups that are unordered against the bounds (a string looked up
 * against numeric bounds) cannot equal any cell and return false.
 */

#include <utility>

#include "bloomdb/value.hpp"

namespace bloomdb::index {

class RangeIndex {
public:
    RangeIndex(value min_value, value max_value)
        : min_(std::move(min_value)), max_(std::move(max_value)) {}

    [[nodiscard]] auto contains(const value& v) const -> bool {
        const auto lo = compare_values(min_, v);
        const auto hi = compare_values(v, max_);
        return (lo == std::partial_ordering::less || lo == std::partial_ordering::equivalent) &&
               (hi == std::partial_ordering::less || hi == std::partial_ordering::equivalent);
    }

    [[nodiscard]] auto min() const noexcept -> const value& { return min_; }
    [[nodiscard]] auto max() const noexcept -> const value& { return max_; }

private:
    value min_;
    value max_;
};

} // namespace bloomdb::index
