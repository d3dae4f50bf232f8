#include <bloomdb/error.hpp>
#include <catch2/catch_all.hpp>

TEST_CASE("error codes stable subset", "[errors]") {
  using bloomdb::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::io_failed) == 1001u);
  REQUIRE(static_cast<unsigned>(error_code::store_read) == 1201u);
  REQUIRE(static_cast<unsigned>(error_code::store_version_mismatch) == 3002u);
  REQUIRE(static_cast<unsigned>(error_code::protocol) == 3201u);
  REQUIRE(static_cast<unsigned>(error_code::connection) == 7001u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
}

TEST_CASE("error code names round-trip for the wire", "[errors]") {
  using namespace bloomdb::core;
  for (auto c : {error_code::io_failed, error_code::data_source, error_code::store_read,
                 error_code::store_write, error_code::config_invalid, error_code::data_integrity,
                 error_code::store_version_mismatch, error_code::invalid_column, error_code::protocol,
                 error_code::precondition_failed, error_code::not_found, error_code::connection,
                 error_code::unavailable, error_code::cancelled, error_code::internal,
                 error_code::invalid_argument, error_code::unsupported}) {
    auto name = error_code_name(c);
    REQUIRE_FALSE(name.empty());
    auto back = error_code_from_name(name);
    REQUIRE(back.has_value());
    REQUIRE(*back == c);
  }
  REQUIRE(error_code_name(error_code::store_read) == "store_read_error");
  REQUIRE(error_code_name(error_code::protocol) == "protocol_error");
  REQUIRE_FALSE(error_code_from_name("no_such_kind").has_value());
}

TEST_CASE("describe names component and kind", "[errors]") {
  using namespace bloomdb::core;
  const error e{error_code::invalid_column, "mixed kinds", "index.builder"};
  auto s = describe(e);
  REQUIRE(s.find("index.builder") != std::string::npos);
  REQUIRE(s.find("mixed kinds") != std::string::npos);
  REQUIRE(s.find("invalid_column_error") != std::string::npos);
}
