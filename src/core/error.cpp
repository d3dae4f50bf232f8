#include "bloomdb/error.hpp"

#include <array>
#include <utility>

namespace bloomdb::core {

namespace {

constexpr std::array<std::pair<error_code, std::string_view>, 18> kNames{{
  {error_code::ok, "ok"},
  {error_code::io_failed, "io_error"},
  {error_code::data_source, "data_source_error"},
  {error_code::store_read, "store_read_error"},
  {error_code::store_write, "store_write_error"},
  {error_code::config_invalid, "configuration_error"},
  {error_code::data_integrity, "data_integrity_error"},
  {error_code::store_version_mismatch, "store_version_mismatch_error"},
  {error_code::invalid_column, "invalid_column_error"},
  {error_code::protocol, "protocol_error"},
  {error_code::precondition_failed, "precondition_failed"},
  {error_code::not_found, "not_found"},
  {error_code::connection, "connection_error"},
  {error_code::unavailable, "unavailable"},
  {error_code::cancelled, "cancelled"},
  {error_code::internal, "internal_error"},
  {error_code::invalid_argument, "invalid_argument"},
  {error_code::unsupported, "unsupported"},
}};

} // namespace

auto error_code_name(error_code code) -> std::string_view {
  for (const auto& [c, name] : kNames) {
    if (c == code) return name;
  }
  return "internal_error";
}

auto error_code_from_name(std::string_view name) -> std::optional<error_code> {
  for (const auto& [c, n] : kNames) {
    if (n == name) return c;
  }
  return std::nullopt;
}

auto describe(const error& e) -> std::string {
  std::string out;
  if (!e.component.empty()) {
    out += e.component;
    out += ": ";
  }
  out += e.message;
  out += " (";
  out += error_code_name(e.code);
  out += ")";
  return out;
}

} // namespace bloomdb::core
