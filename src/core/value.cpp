#include "bloomdb/value.hpp"

#include <charconv>
#include <cmath>
#include <cstring>
#include <limits>
#include <optional>
#include <sstream>

namespace bloomdb {

namespace {

constexpr std::uint64_t kFnvOffset = 0xcbf29ce484222325ULL;
constexpr std::uint64_t kFnvPrime = 0x100000001b3ULL;

// Hash tags are part of the persisted format; never renumber.
constexpr std::uint8_t kTagBool = 1;
constexpr std::uint8_t kTagNumberInt = 2;
constexpr std::uint8_t kTagNumberReal = 3;
constexpr std::uint8_t kTagString = 4;

inline auto fnv1a(std::uint64_t h, const void* data, std::size_t n) noexcept -> std::uint64_t {
  const auto* p = static_cast<const unsigned char*>(data);
  for (std::size_t i = 0; i < n; ++i) {
    h ^= p[i];
    h *= kFnvPrime;
  }
  return h;
}

inline auto fmix64(std::uint64_t x) noexcept -> std::uint64_t {
  x ^= x >> 33;
  x *= 0xff51afd7ed558ccdULL;
  x ^= x >> 33;
  x *= 0xc4ceb9fe1a85ec53ULL;
  x ^= x >> 33;
  return x;
}

// Integral doubles that fit in int64 collapse to the integer representation.
inline auto as_integer(double d) noexcept -> std::optional<std::int64_t> {
  if (!std::isfinite(d)) return std::nullopt;
  if (d != std::trunc(d)) return std::nullopt;
  if (d < -9223372036854775808.0 || d >= 9223372036854775808.0) return std::nullopt;
  return static_cast<std::int64_t>(d);
}

inline auto is_number(const value& v) noexcept -> bool {
  return std::holds_alternative<std::int64_t>(v) || std::holds_alternative<double>(v);
}

inline auto as_double(const value& v) noexcept -> double {
  if (std::holds_alternative<std::int64_t>(v)) return static_cast<double>(std::get<std::int64_t>(v));
  return std::get<double>(v);
}

inline auto canonical_integer(const value& v) noexcept -> std::optional<std::int64_t> {
  if (std::holds_alternative<std::int64_t>(v)) return std::get<std::int64_t>(v);
  if (std::holds_alternative<double>(v)) return as_integer(std::get<double>(v));
  return std::nullopt;
}

inline void put_le64(unsigned char* out, std::uint64_t x) noexcept {
  for (int i = 0; i < 8; ++i) out[i] = static_cast<unsigned char>(x >> (8 * i));
}

} // namespace

auto value_hash(const value& v) noexcept -> std::uint64_t {
  std::uint64_t h = kFnvOffset;
  unsigned char buf[8];
  if (std::holds_alternative<bool>(v)) {
    const unsigned char b = std::get<bool>(v) ? 1 : 0;
    h = fnv1a(h, &kTagBool, 1);
    h = fnv1a(h, &b, 1);
  } else if (auto i = canonical_integer(v)) {
    put_le64(buf, static_cast<std::uint64_t>(*i));
    h = fnv1a(h, &kTagNumberInt, 1);
    h = fnv1a(h, buf, sizeof(buf));
  } else if (std::holds_alternative<double>(v)) {
    const double d = std::get<double>(v);
    std::uint64_t bits;
    std::memcpy(&bits, &d, sizeof(bits));
    put_le64(buf, bits);
    h = fnv1a(h, &kTagNumberReal, 1);
    h = fnv1a(h, buf, sizeof(buf));
  } else {
    const auto& s = std::get<std::string>(v);
    h = fnv1a(h, &kTagString, 1);
    h = fnv1a(h, s.data(), s.size());
  }
  return fmix64(h);
}

auto values_equal(const value& a, const value& b) noexcept -> bool {
  if (is_number(a) && is_number(b)) {
    auto ia = canonical_integer(a);
    auto ib = canonical_integer(b);
    if (ia && ib) return *ia == *ib;
    if (ia || ib) return false;
    return std::get<double>(a) == std::get<double>(b);
  }
  if (a.index() != b.index()) return false;
  return a == b;
}

auto compare_values(const value& a, const value& b) noexcept -> std::partial_ordering {
  if (is_number(a) && is_number(b)) {
    auto ia = canonical_integer(a);
    auto ib = canonical_integer(b);
    if (ia && ib) return *ia <=> *ib;
    return as_double(a) <=> as_double(b);
  }
  if (std::holds_alternative<std::string>(a) && std::holds_alternative<std::string>(b)) {
    const int c = std::get<std::string>(a).compare(std::get<std::string>(b));
    return c < 0 ? std::partial_ordering::less
         : c > 0 ? std::partial_ordering::greater
                 : std::partial_ordering::equivalent;
  }
  if (std::holds_alternative<bool>(a) && std::holds_alternative<bool>(b)) {
    return std::get<bool>(a) <=> std::get<bool>(b);
  }
  return std::partial_ordering::unordered;
}

auto to_string(const value& v) -> std::string {
  if (std::holds_alternative<bool>(v)) return std::get<bool>(v) ? "true" : "false";
  if (std::holds_alternative<std::int64_t>(v)) return std::to_string(std::get<std::int64_t>(v));
  if (std::holds_alternative<double>(v)) {
    std::ostringstream oss;
    oss.precision(std::numeric_limits<double>::max_digits10);
    oss << std::get<double>(v);
    return oss.str();
  }
  return std::get<std::string>(v);
}

auto kind_name(const value& v) noexcept -> std::string_view {
  switch (v.index()) {
    case 0: return "bool";
    case 1: return "int";
    case 2: return "double";
    default: return "string";
  }
}

auto parse_cell(std::string_view text) -> value {
  if (text.empty()) return std::string{};
  const char* first = text.data();
  const char* last = text.data() + text.size();
  if (*first == '+') ++first;
  // from_chars also accepts "nan" and "inf"; those stay text.
  bool has_digit = false;
  for (const char* c = first; c != last; ++c) {
    if (*c >= '0' && *c <= '9') { has_digit = true; break; }
  }
  if (!has_digit) return std::string(text);

  std::int64_t i{};
  auto ri = std::from_chars(first, last, i);
  if (ri.ec == std::errc{} && ri.ptr == last) return i;

  double d{};
  auto rd = std::from_chars(first, last, d);
  if (rd.ec == std::errc{} && rd.ptr == last) return d;

  return std::string(text);
}

} // namespace bloomdb
