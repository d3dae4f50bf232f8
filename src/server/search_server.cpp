#include "bloomdb/server/search_server.hpp"

#include <iostream>

#include "bloomdb/core/platform_utils.hpp"
#include "bloomdb/protocol/wire.hpp"

namespace bloomdb::server {

namespace {

auto trace(connection_state s, const std::string& peer) -> void {
  if (core::debug_enabled()) {
    std::cerr << "[SERVER][" << state_name(s) << "] " << peer << std::endl;
  }
}

} // namespace

auto state_name(connection_state s) -> const char* {
  switch (s) {
    case connection_state::await_request: return "await_request";
    case connection_state::parse_request: return "parse_request";
    case connection_state::resolve_files: return "resolve_files";
    case connection_state::load_indexes: return "load_indexes";
    case connection_state::evaluate: return "evaluate";
    case connection_state::respond_and_close: return "respond_and_close";
    case connection_state::respond_error: return "respond_error";
  }
  return "unknown";
}

SearchServer::SearchServer(ServerConfig config)
    : config_(std::move(config)),
      cache_(std::make_shared<cache::IndexCache>(config_.cache_capacity)),
      service_(config_.index_root, cache_, storage::IndexStore{storage::IndexStore::options_from_env()}) {}

SearchServer::~SearchServer() { stop(); }

auto SearchServer::start() -> std::expected<void, core::error> {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_.load()) {
    return std::unexpected(core::error{core::error_code::precondition_failed, "server already running", "server"});
  }
  if (auto ok = validate(config_); !ok) return std::unexpected(ok.error());
  auto listener = net::Socket::listen(config_.host, config_.port);
  if (!listener) return std::unexpected(listener.error());
  listener_ = std::move(*listener);
  port_.store(listener_.local_port());
  pool_ = std::make_unique<ThreadPool>(config_.worker_threads);
  running_.store(true);
  stopped_ = false;
  accept_thread_ = std::thread([this] { accept_loop(); });
  std::cerr << "[SERVER] listening on " << config_.host << ":" << port_.load()
            << " (root " << config_.index_root << ", " << pool_->size() << " workers)" << std::endl;
  return {};
}

auto SearchServer::stop() -> void {
  std::unique_lock<std::mutex> lock(lifecycle_mutex_);
  if (stopped_) return;
  running_.store(false);
  listener_.shutdown();
  if (accept_thread_.joinable()) accept_thread_.join();
  listener_.close();
  pool_.reset();  // drains queued connections
  stopped_ = true;
  lock.unlock();
  stopped_cv_.notify_all();
  std::cerr << "[SERVER] stopped" << std::endl;
}

auto SearchServer::wait() -> void {
  std::unique_lock<std::mutex> lock(lifecycle_mutex_);
  stopped_cv_.wait(lock, [this] { return stopped_; });
}

auto SearchServer::stats() const -> ServerStats {
  return ServerStats{connections_.load(), searches_.load(), errors_.load()};
}

auto SearchServer::accept_loop() -> void {
  while (running_.load()) {
    auto conn = listener_.accept();
    if (!conn) {
      if (conn.error().code == core::error_code::cancelled || !running_.load()) break;
      std::cerr << "[SERVER] accept failed: " << core::describe(conn.error()) << std::endl;
      continue;
    }
    connections_.fetch_add(1);
    auto shared = std::make_shared<net::Socket>(std::move(*conn));
    try {
      pool_->submit([this, shared] { handle_connection(std::move(*shared)); });
    } catch (const std::runtime_error& e) {
      std::cerr << "[SERVER] dropping connection: " << e.what() << std::endl;
    }
  }
}

auto SearchServer::respond(net::Socket& conn, const protocol::message& reply) -> void {
  auto bytes = protocol::encode_message(reply);
  if (!bytes) {
    std::cerr << "[SERVER] encode failed: " << core::describe(bytes.error()) << std::endl;
    bytes = protocol::encode_message(protocol::make_error_reply(bytes.error()));
    if (!bytes) return;
  }
  if (auto sent = conn.send_all(*bytes); !sent) {
    std::cerr << "[SERVER] send failed: " << core::describe(sent.error()) << std::endl;
  }
}

auto SearchServer::handle_connection(net::Socket conn) -> void {
  const auto peer = conn.peer_name();
  auto fail = [&](const core::error& e) {
    errors_.fetch_add(1);
    trace(connection_state::respond_error, peer);
    std::cerr << "[SERVER] " << peer << ": " << core::describe(e) << std::endl;
    respond(conn, protocol::make_error_reply(e));
    conn.close();
  };

  trace(connection_state::await_request, peer);
  if (config_.io_timeout_ms != 0) {
    if (auto ok = conn.set_timeouts(config_.io_timeout_ms); !ok) return fail(ok.error());
  }
  auto frame = conn.recv_frame(protocol::WIRE_MAGIC, config_.max_message_bytes);
  if (!frame) {
    // Nobody to answer when the peer vanished.
    if (frame.error().code == core::error_code::connection) {
      std::cerr << "[SERVER] " << peer << ": " << core::describe(frame.error()) << std::endl;
      return;
    }
    return fail(frame.error());
  }

  trace(connection_state::parse_request, peer);
  auto msg = protocol::decode_message(*frame);
  if (!msg) return fail(msg.error());
  if (std::holds_alternative<protocol::ping_message>(*msg)) {
    trace(connection_state::respond_and_close, peer);
    respond(conn, protocol::pong_message{});
    conn.close();
    return;
  }
  const auto* request = std::get_if<protocol::search_request>(&*msg);
  if (request == nullptr) {
    return fail(core::error{core::error_code::protocol, "expected a search request", "server"});
  }

  searches_.fetch_add(1);
  trace(connection_state::resolve_files, peer);
  auto locations = service_.resolve(request->index_source, request->file_pattern);
  if (!locations) return fail(locations.error());

  trace(connection_state::load_indexes, peer);
  auto loaded = service_.load(*locations, [&conn] { return conn.peer_closed(); });
  if (!loaded) {
    if (loaded.error().code == core::error_code::cancelled) {
      std::cerr << "[SERVER] " << peer << ": request abandoned by client" << std::endl;
      return;
    }
    return fail(loaded.error());
  }

  trace(connection_state::evaluate, peer);
  auto files = SearchService::evaluate(request->query, *loaded);

  trace(connection_state::respond_and_close, peer);
  respond(conn, protocol::search_result{std::move(files)});
  conn.close();
}

} // namespace bloomdb::server
