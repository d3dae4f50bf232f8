#pragma once

/** \file search_server.hpp
 *  \brief TCP front end: one request and one response per connection.
 *
 * Connection lifecycle:
 *   await_request -> parse_request -> resolve_files -> load_indexes -> evaluate
 *     -> respond_and_close
 * Any failure along the way moves to respond_error, which sends an error reply
 * and closes. A ping is answered with a pong. Connections are handled on a
 * worker pool; the accept loop runs on its own thread.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <thread>

#include "bloomdb/cache/index_cache.hpp"
#include "bloomdb/error.hpp"
#include "bloomdb/net/socket.hpp"
#include "bloomdb/server/search_service.hpp"
#include "bloomdb/server/server_config.hpp"
#include "bloomdb/server/thread_pool.hpp"

namespace bloomdb::server {

enum class connection_state : std::uint8_t {
  await_request,
  parse_request,
  resolve_files,
  load_indexes,
  evaluate,
  respond_and_close,
  respond_error,
};

auto state_name(connection_state s) -> const char*;

struct ServerStats {
  std::uint64_t connections{0};
  std::uint64_t searches{0};
  std::uint64_t errors{0};
};

class SearchServer {
public:
  explicit SearchServer(ServerConfig config);
  ~SearchServer();

  SearchServer(const SearchServer&) = delete;
  SearchServer& operator=(const SearchServer&) = delete;

  /** \brief Bind, listen and start accepting; connection error if the bind fails. */
  auto start() -> std::expected<void, core::error>;

  /** \brief Stop accepting, finish in-flight connections, join threads. Idempotent. */
  auto stop() -> void;

  /** \brief Block until stop() has completed. */
  auto wait() -> void;

  /** \brief Bound port; meaningful after start(). */
  [[nodiscard]] auto port() const noexcept -> std::uint16_t { return port_.load(); }
  [[nodiscard]] auto running() const noexcept -> bool { return running_.load(); }
  [[nodiscard]] auto stats() const -> ServerStats;
  [[nodiscard]] auto cache() const noexcept -> const cache::IndexCache& { return *cache_; }
  [[nodiscard]] auto config() const noexcept -> const ServerConfig& { return config_; }

private:
  auto accept_loop() -> void;
  auto handle_connection(net::Socket conn) -> void;
  auto respond(net::Socket& conn, const protocol::message& reply) -> void;

  ServerConfig config_;
  std::shared_ptr<cache::IndexCache> cache_;
  SearchService service_;
  net::Socket listener_;
  std::unique_ptr<ThreadPool> pool_;
  std::thread accept_thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint16_t> port_{0};
  std::atomic<std::uint64_t> connections_{0};
  std::atomic<std::uint64_t> searches_{0};
  std::atomic<std::uint64_t> errors_{0};
  std::mutex lifecycle_mutex_;
  std::condition_variable stopped_cv_;
  bool stopped_{true};
};

} // namespace bloomdb::server
