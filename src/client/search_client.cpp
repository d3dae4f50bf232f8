#include "bloomdb/client/search_client.hpp"

#include "bloomdb/net/socket.hpp"

namespace bloomdb::client {

auto SearchClient::exchange(const protocol::message& request) const
    -> std::expected<protocol::message, core::error> {
  auto bytes = protocol::encode_message(request);
  if (!bytes) return std::unexpected(bytes.error());

  auto sock = net::Socket::connect(config_.host, config_.port, config_.timeout_ms);
  if (!sock) return std::unexpected(sock.error());
  if (config_.timeout_ms != 0) {
    if (auto ok = sock->set_timeouts(config_.timeout_ms); !ok) return std::unexpected(ok.error());
  }
  if (auto sent = sock->send_all(*bytes); !sent) return std::unexpected(sent.error());

  auto frame = sock->recv_frame(protocol::WIRE_MAGIC, config_.max_message_bytes);
  if (!frame) return std::unexpected(frame.error());
  auto reply = protocol::decode_message(*frame);
  if (!reply) return std::unexpected(reply.error());
  if (const auto* err = std::get_if<protocol::error_reply>(&*reply)) {
    return std::unexpected(protocol::to_error(*err));
  }
  return reply;
}

auto SearchClient::send(const protocol::search_request& request) const
    -> std::expected<std::vector<std::string>, core::error> {
  auto reply = exchange(request);
  if (!reply) return std::unexpected(reply.error());
  auto* result = std::get_if<protocol::search_result>(&*reply);
  if (result == nullptr) {
    return std::unexpected(core::error{core::error_code::protocol, "expected a search result", "client"});
  }
  return std::move(result->files);
}

auto SearchClient::ping() const -> std::expected<void, core::error> {
  auto reply = exchange(protocol::ping_message{});
  if (!reply) return std::unexpected(reply.error());
  if (!std::holds_alternative<protocol::pong_message>(*reply)) {
    return std::unexpected(core::error{core::error_code::protocol, "expected a pong", "client"});
  }
  return {};
}

} // namespace bloomdb::client
