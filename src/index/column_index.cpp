#include "bloomdb/index/column_index.hpp"

#include <cmath>
#include <unordered_set>

namespace bloomdb::index {

auto ColumnIndexBuilder::create(BuildConfig config) -> std::expected<ColumnIndexBuilder, core::error> {
  using core::error; using core::error_code;
  if (!(config.error_rate > 0.0 && config.error_rate < 1.0)) {
    return std::unexpected(error{error_code::config_invalid, "error_rate must be in (0, 1)", "index.builder"});
  }
  if (config.range_filter_threshold == 0) {
    return std::unexpected(error{error_code::config_invalid, "range_filter_threshold must be positive", "index.builder"});
  }
  return ColumnIndexBuilder(config);
}

auto ColumnIndexBuilder::build(std::span<const value> values) const
    -> std::expected<ColumnIndex, core::error> {
  std::unordered_set<value, value_hasher, value_equal> distinct;
  distinct.reserve(values.size());
  for (const auto& v : values) distinct.insert(v);

  if (distinct.size() < config_.range_filter_threshold) {
    auto filter = BloomFilter::with_capacity(distinct.size(), config_.error_rate);
    for (const auto& v : distinct) filter.insert(v);
    return ColumnIndex(std::move(filter));
  }

  auto it = distinct.begin();
  const value* lo = &*it;
  const value* hi = &*it;
  for (; it != distinct.end(); ++it) {
    const value& v = *it;
    if (std::holds_alternative<double>(v) && std::isnan(std::get<double>(v))) {
      return std::unexpected(core::error{core::error_code::invalid_column,
                                         "NaN cannot bound a range index", "index.builder"});
    }
    const auto c_lo = compare_values(v, *lo);
    const auto c_hi = compare_values(v, *hi);
    if (c_lo == std::partial_ordering::unordered || c_hi == std::partial_ordering::unordered) {
      return std::unexpected(core::error{core::error_code::invalid_column,
          std::string("values of kind ") + std::string(kind_name(v)) + " and " +
          std::string(kind_name(*lo)) + " are not mutually ordered", "index.builder"});
    }
    if (c_lo == std::partial_ordering::less) lo = &v;
    if (c_hi == std::partial_ordering::greater) hi = &v;
  }
  return ColumnIndex(RangeIndex(*lo, *hi));
}

} // namespace bloomdb::index
