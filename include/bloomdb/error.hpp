#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling and for the wire protocol.
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace bloomdb::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  data_source = 1101,             /**< tabular source could not be opened or parsed */
  store_read = 1201,              /**< index absent, unreadable or corrupt */
  store_write = 1202,             /**< index could not be persisted */
  config_invalid = 2001,
  data_integrity = 3001,
  store_version_mismatch = 3002,  /**< serialized index written by another format version */
  invalid_column = 3101,          /**< column unsuitable for its selected index kind */
  protocol = 3201,                /**< malformed request or response */
  precondition_failed = 4001,
  not_found = 6001,
  connection = 7001,              /**< transport failure */
  unavailable = 7002,
  cancelled = 8001,
  internal = 9001,
  invalid_argument = 9002,
  unsupported = 9005,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "storage.index_store" */
};

/** \brief Stable lowercase name of a code, as carried in wire error replies. */
auto error_code_name(error_code code) -> std::string_view;

/** \brief Inverse of error_code_name; nullopt for unknown names. */
auto error_code_from_name(std::string_view name) -> std::optional<error_code>;

/** \brief "component: message (name)" for logs and CLI output. */
auto describe(const error& e) -> std::string;

} // namespace bloomdb::core
