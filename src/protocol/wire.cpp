#include "bloomdb/protocol/wire.hpp"

#include <limits>

#include "bloomdb/codec/frame.hpp"

namespace bloomdb::protocol {

using nlohmann::json;

namespace {

auto malformed(std::string what) -> core::error {
  return core::error{core::error_code::protocol, std::move(what), "protocol.wire"};
}

auto rule_from_json_at(const json& j, std::size_t depth) -> std::expected<query::rule, core::error> {
  if (depth > MAX_RULE_DEPTH) return std::unexpected(malformed("rule tree nested too deeply"));
  if (!j.is_object()) return std::unexpected(malformed("rule must be an object"));

  const bool is_leaf = j.contains("column") || j.contains("value");
  const bool is_group = j.contains("condition") || j.contains("rules");
  if (is_leaf && is_group) return std::unexpected(malformed("rule is both a leaf and a group"));

  if (is_leaf) {
    auto col = j.find("column");
    auto val = j.find("value");
    if (col == j.end() || val == j.end()) return std::unexpected(malformed("leaf needs column and value"));
    if (!col->is_string()) return std::unexpected(malformed("leaf column must be a string"));
    auto v = value_from_json(*val);
    if (!v) return std::unexpected(v.error());
    return query::make_leaf(col->get<std::string>(), std::move(*v));
  }

  auto cond = j.find("condition");
  auto rules = j.find("rules");
  if (cond == j.end() || rules == j.end()) return std::unexpected(malformed("group needs condition and rules"));
  if (!cond->is_string()) return std::unexpected(malformed("condition must be a string"));
  if (!rules->is_array()) return std::unexpected(malformed("rules must be an array"));

  query::rule::group g;
  const auto& name = cond->get_ref<const std::string&>();
  if (name == "AND") g.cond = query::condition::all_of;
  else if (name == "OR") g.cond = query::condition::any_of;
  else return std::unexpected(malformed("unknown condition '" + name + "'"));

  g.children.reserve(rules->size());
  for (const auto& child : *rules) {
    auto c = rule_from_json_at(child, depth + 1);
    if (!c) return std::unexpected(c.error());
    g.children.push_back(std::move(*c));
  }
  return query::rule{std::move(g)};
}

auto string_field(const json& j, const char* key) -> std::expected<std::string, core::error> {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return std::unexpected(malformed(std::string("missing string field '") + key + "'"));
  }
  return it->get<std::string>();
}

auto payload_json(const message& m) -> json {
  if (const auto* req = std::get_if<search_request>(&m)) {
    return json{{"index_source", req->index_source},
                {"file_pattern", req->file_pattern},
                {"query", rule_to_json(req->query)}};
  }
  if (const auto* res = std::get_if<search_result>(&m)) {
    return json{{"files", res->files}};
  }
  if (const auto* err = std::get_if<error_reply>(&m)) {
    return json{{"kind", err->kind}, {"message", err->message}};
  }
  return json::object();
}

auto type_of(const message& m) -> message_type {
  switch (m.index()) {
    case 0: return message_type::search;
    case 1: return message_type::result;
    case 2: return message_type::error;
    case 3: return message_type::ping;
    default: return message_type::pong;
  }
}

} // namespace

auto value_to_json(const value& v) -> json {
  if (std::holds_alternative<bool>(v)) return std::get<bool>(v);
  if (std::holds_alternative<std::int64_t>(v)) return std::get<std::int64_t>(v);
  if (std::holds_alternative<double>(v)) return std::get<double>(v);
  return std::get<std::string>(v);
}

auto value_from_json(const json& j) -> std::expected<value, core::error> {
  if (j.is_string()) return value{j.get<std::string>()};
  if (j.is_boolean()) return value{j.get<bool>()};
  if (j.is_number_unsigned()) {
    const auto u = j.get<std::uint64_t>();
    if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      return value{static_cast<double>(u)};
    }
    return value{static_cast<std::int64_t>(u)};
  }
  if (j.is_number_integer()) return value{j.get<std::int64_t>()};
  if (j.is_number_float()) return value{j.get<double>()};
  return std::unexpected(malformed("value must be a string, number or boolean"));
}

auto rule_to_json(const query::rule& r) -> json {
  if (const auto* l = std::get_if<query::rule::leaf>(&r.node)) {
    return json{{"column", l->column}, {"value", value_to_json(l->val)}};
  }
  const auto& g = std::get<query::rule::group>(r.node);
  json rules = json::array();
  for (const auto& c : g.children) rules.push_back(rule_to_json(c));
  return json{{"condition", g.cond == query::condition::all_of ? "AND" : "OR"}, {"rules", std::move(rules)}};
}

auto rule_from_json(const json& j) -> std::expected<query::rule, core::error> {
  return rule_from_json_at(j, 0);
}

auto encode_message(const message& m) -> std::expected<std::vector<std::uint8_t>, core::error> {
  // Invalid UTF-8 in strings would make dump() throw; replace it instead.
  const std::string text = payload_json(m).dump(-1, ' ', false, json::error_handler_t::replace);
  std::span<const std::uint8_t> payload(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
  return codec::encode_frame(WIRE_MAGIC, static_cast<std::uint16_t>(type_of(m)), 0, PROTOCOL_VERSION, payload);
}

auto decode_message(std::span<const std::uint8_t> frame) -> std::expected<message, core::error> {
  auto f = codec::decode_frame(frame, WIRE_MAGIC, PROTOCOL_VERSION, core::error_code::protocol);
  if (!f) return std::unexpected(malformed(f.error().message));

  json j = json::parse(f->payload.begin(), f->payload.end(), nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) return std::unexpected(malformed("payload is not valid JSON"));
  if (!j.is_object()) return std::unexpected(malformed("payload must be a JSON object"));

  switch (static_cast<message_type>(f->header.type)) {
    case message_type::search: {
      auto source = string_field(j, "index_source");
      if (!source) return std::unexpected(source.error());
      auto pattern = string_field(j, "file_pattern");
      if (!pattern) return std::unexpected(pattern.error());
      auto q = j.find("query");
      if (q == j.end()) return std::unexpected(malformed("missing field 'query'"));
      auto r = rule_from_json(*q);
      if (!r) return std::unexpected(r.error());
      return message{search_request{std::move(*source), std::move(*pattern), std::move(*r)}};
    }
    case message_type::result: {
      auto files = j.find("files");
      if (files == j.end() || !files->is_array()) return std::unexpected(malformed("missing array field 'files'"));
      search_result res;
      res.files.reserve(files->size());
      for (const auto& entry : *files) {
        if (!entry.is_string()) return std::unexpected(malformed("file entries must be strings"));
        res.files.push_back(entry.get<std::string>());
      }
      return message{std::move(res)};
    }
    case message_type::error: {
      auto kind = string_field(j, "kind");
      if (!kind) return std::unexpected(kind.error());
      auto msg = string_field(j, "message");
      if (!msg) return std::unexpected(msg.error());
      return message{error_reply{std::move(*kind), std::move(*msg)}};
    }
    case message_type::ping:
      return message{ping_message{}};
    case message_type::pong:
      return message{pong_message{}};
  }
  return std::unexpected(malformed("unknown message type " + std::to_string(f->header.type)));
}

auto make_error_reply(const core::error& e) -> error_reply {
  return error_reply{std::string(core::error_code_name(e.code)), e.message};
}

auto to_error(const error_reply& reply) -> core::error {
  auto code = core::error_code_from_name(reply.kind).value_or(core::error_code::internal);
  return core::error{code, reply.message, "server"};
}

} // namespace bloomdb::protocol
