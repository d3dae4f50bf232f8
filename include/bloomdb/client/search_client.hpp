#pragma once

/** \file search_client.hpp
 *  \brief Blocking client for the search protocol: one connection per call.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

#include "bloomdb/error.hpp"
#include "bloomdb/protocol/wire.hpp"

namespace bloomdb::client {

struct ClientConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{8888};
  std::uint32_t timeout_ms{30000};
  std::size_t max_message_bytes{16u << 20};
};

class SearchClient {
public:
  explicit SearchClient(ClientConfig config) : config_(std::move(config)) {}

  /** \brief Send one search and wait for the answer.
   *
   * \return candidate source paths; connection on transport failure, protocol
   *         on a malformed response, or the server's reported error
   */
  auto send(const protocol::search_request& request) const
      -> std::expected<std::vector<std::string>, core::error>;

  /** \brief Round-trip a ping. */
  auto ping() const -> std::expected<void, core::error>;

  [[nodiscard]] auto config() const noexcept -> const ClientConfig& { return config_; }

private:
  auto exchange(const protocol::message& request) const -> std::expected<protocol::message, core::error>;

  ClientConfig config_;
};

} // namespace bloomdb::client
