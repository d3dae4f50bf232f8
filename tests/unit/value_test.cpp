#include <catch2/catch_all.hpp>
#include <bloomdb/value.hpp>

#include <cmath>
#include <limits>

using namespace bloomdb;

TEST_CASE("parse_cell infers int, double and text", "[value]") {
  REQUIRE(std::holds_alternative<std::int64_t>(parse_cell("42")));
  REQUIRE(std::get<std::int64_t>(parse_cell("-7")) == -7);
  REQUIRE(std::get<std::int64_t>(parse_cell("+5")) == 5);
  REQUIRE(std::holds_alternative<double>(parse_cell("2.5")));
  REQUIRE(std::get<double>(parse_cell("1e3")) == 1000.0);
  REQUIRE(std::get<std::string>(parse_cell("active")) == "active");
  REQUIRE(std::get<std::string>(parse_cell("12abc")) == "12abc");
  // Not numbers even though from_chars would take them.
  REQUIRE(std::holds_alternative<std::string>(parse_cell("nan")));
  REQUIRE(std::holds_alternative<std::string>(parse_cell("inf")));
}

TEST_CASE("integral doubles equal and hash like integers", "[value]") {
  const value i{std::int64_t{3}};
  const value d{3.0};
  REQUIRE(values_equal(i, d));
  REQUIRE(value_hash(i) == value_hash(d));
  REQUIRE_FALSE(values_equal(value{3.5}, i));
  REQUIRE_FALSE(values_equal(value{std::string("3")}, i));
  REQUIRE(value_hash(value{std::string("3")}) != value_hash(i));
}

TEST_CASE("value hash is stable across runs", "[value]") {
  // Persisted Bloom filters depend on this; changing it breaks stored indexes.
  REQUIRE(value_hash(value{std::string("a")}) == value_hash(value{std::string("a")}));
  REQUIRE(value_hash(value{true}) != value_hash(value{false}));
  REQUIRE(value_hash(value{true}) != value_hash(value{std::int64_t{1}}));
}

TEST_CASE("compare_values orders within a kind only", "[value]") {
  using std::partial_ordering;
  REQUIRE(compare_values(value{std::int64_t{1}}, value{2.5}) == partial_ordering::less);
  REQUIRE(compare_values(value{std::string("b")}, value{std::string("a")}) == partial_ordering::greater);
  REQUIRE(compare_values(value{false}, value{true}) == partial_ordering::less);
  REQUIRE(compare_values(value{std::string("1")}, value{std::int64_t{1}}) == partial_ordering::unordered);
  REQUIRE(compare_values(value{std::numeric_limits<double>::quiet_NaN()}, value{1.0}) == partial_ordering::unordered);
}

TEST_CASE("to_string and kind_name", "[value]") {
  REQUIRE(to_string(value{true}) == "true");
  REQUIRE(to_string(value{std::int64_t{-12}}) == "-12");
  REQUIRE(to_string(value{std::string("x")}) == "x");
  REQUIRE(kind_name(value{1.5}) == "double");
  REQUIRE(kind_name(value{std::string()}) == "string");
}
