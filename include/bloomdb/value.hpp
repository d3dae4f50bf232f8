#pragma once

/** \file value.hpp
 *  \brief Scalar cell value shared by column indexes, CSV loading and query leaves.
 *
 * Integers and integral doubles are the same value: they compare equal, hash equal
 * and order numerically. Strings order bytewise, booleans false < true. Any other
 * pairing is unordered.
 */

#include <compare>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace bloomdb {

using value = std::variant<bool, std::int64_t, double, std::string>;

/** \brief Stable 64-bit hash; identical across processes, used for persisted filters. */
auto value_hash(const value& v) noexcept -> std::uint64_t;

/** \brief Equality with numeric canonicalization (7 == 7.0). */
auto values_equal(const value& a, const value& b) noexcept -> bool;

/** \brief Natural ordering; unordered for mixed kinds and NaN. */
auto compare_values(const value& a, const value& b) noexcept -> std::partial_ordering;

/** \brief Human-readable rendering (strings unquoted). */
auto to_string(const value& v) -> std::string;

/** \brief Name of the held alternative: "bool", "int", "double" or "string". */
auto kind_name(const value& v) noexcept -> std::string_view;

/** \brief Type an unquoted text cell: integer, then double, else string. */
auto parse_cell(std::string_view text) -> value;

struct value_hasher {
  auto operator()(const value& v) const noexcept -> std::size_t {
    return static_cast<std::size_t>(value_hash(v));
  }
};

struct value_equal {
  auto operator()(const value& a, const value& b) const noexcept -> bool {
    return values_equal(a, b);
  }
};

} // namespace bloomdb
