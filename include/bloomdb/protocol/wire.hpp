#pragma once

/** \file wire.hpp
 *  \brief Request/response messages of the search protocol.
 *
 * Each message is one codec frame with magic "BDXW" and version
 * PROTOCOL_VERSION; the frame type names the message and the payload is JSON.
 *
 *   search  {"index_source": str, "file_pattern": str, "query": node}
 *           node = {"condition": "AND"|"OR", "rules": [node...]} | {"column": str, "value": scalar}
 *   result  {"files": [str...]}
 *   error   {"kind": str, "message": str}
 *   ping / pong carry an empty object.
 *
 * Malformed messages are reported as error_code::protocol.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "bloomdb/error.hpp"
#include "bloomdb/query/rule.hpp"

namespace bloomdb::protocol {

constexpr std::uint32_t WIRE_MAGIC = 0x57584442u; // "BDXW"
constexpr std::uint32_t PROTOCOL_VERSION = 1;
constexpr std::size_t MAX_RULE_DEPTH = 512;

enum class message_type : std::uint16_t {
  search = 1,
  result = 2,
  error = 3,
  ping = 4,
  pong = 5,
};

struct search_request {
  std::string index_source;  /**< location relative to the server's index root */
  std::string file_pattern;  /**< shell glob over index names */
  query::rule query;
};

struct search_result {
  std::vector<std::string> files;
};

struct error_reply {
  std::string kind;     /**< core::error_code_name() of the failure */
  std::string message;
};

struct ping_message {};
struct pong_message {};

using message = std::variant<search_request, search_result, error_reply, ping_message, pong_message>;

// Rule tree <-> JSON. rule_from_json validates shape, condition names, scalar
// values and depth.
auto rule_to_json(const query::rule& r) -> nlohmann::json;
auto rule_from_json(const nlohmann::json& j) -> std::expected<query::rule, core::error>;

auto value_to_json(const value& v) -> nlohmann::json;
auto value_from_json(const nlohmann::json& j) -> std::expected<value, core::error>;

// Whole frames.
auto encode_message(const message& m) -> std::expected<std::vector<std::uint8_t>, core::error>;
auto decode_message(std::span<const std::uint8_t> frame) -> std::expected<message, core::error>;

/** \brief error_reply for a failure, preserving its code name. */
auto make_error_reply(const core::error& e) -> error_reply;

/** \brief core::error for a received error_reply; unknown kinds map to internal. */
auto to_error(const error_reply& reply) -> core::error;

} // namespace bloomdb::protocol
