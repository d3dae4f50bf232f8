#include "bloomdb/server/server_config.hpp"

#include <charconv>
#include <limits>

#include "bloomdb/core/platform_utils.hpp"

namespace bloomdb::server {

namespace {

auto invalid(const std::string& what) -> core::error {
  return core::error{core::error_code::config_invalid, what, "server.config"};
}

template <typename T>
auto parse_unsigned(const char* name, const std::string& text, T max) -> std::expected<T, core::error> {
  std::uint64_t v{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
  if (ec != std::errc{} || ptr != text.data() + text.size() || v > static_cast<std::uint64_t>(max)) {
    return std::unexpected(invalid(std::string(name) + " is not a valid number: '" + text + "'"));
  }
  return static_cast<T>(v);
}

} // namespace

auto config_from_env(ServerConfig base) -> std::expected<ServerConfig, core::error> {
  if (auto v = core::safe_getenv("BLOOMDB_HOST")) base.host = *v;
  if (auto v = core::safe_getenv("BLOOMDB_INDEX_ROOT")) base.index_root = *v;
  if (auto v = core::safe_getenv("BLOOMDB_PORT")) {
    auto p = parse_unsigned<std::uint16_t>("BLOOMDB_PORT", *v, std::numeric_limits<std::uint16_t>::max());
    if (!p) return std::unexpected(p.error());
    base.port = *p;
  }
  if (auto v = core::safe_getenv("BLOOMDB_WORKERS")) {
    auto w = parse_unsigned<std::size_t>("BLOOMDB_WORKERS", *v, 1024);
    if (!w) return std::unexpected(w.error());
    base.worker_threads = *w;
  }
  if (auto v = core::safe_getenv("BLOOMDB_CACHE_CAPACITY")) {
    auto c = parse_unsigned<std::size_t>("BLOOMDB_CACHE_CAPACITY", *v, std::numeric_limits<std::size_t>::max());
    if (!c) return std::unexpected(c.error());
    base.cache_capacity = *c;
  }
  if (auto v = core::safe_getenv("BLOOMDB_IO_TIMEOUT_MS")) {
    auto t = parse_unsigned<std::uint32_t>("BLOOMDB_IO_TIMEOUT_MS", *v, std::numeric_limits<std::uint32_t>::max());
    if (!t) return std::unexpected(t.error());
    base.io_timeout_ms = *t;
  }
  if (auto ok = validate(base); !ok) return std::unexpected(ok.error());
  return base;
}

auto validate(const ServerConfig& config) -> std::expected<void, core::error> {
  if (config.index_root.empty()) return std::unexpected(invalid("index_root must not be empty"));
  if (config.worker_threads > 1024) return std::unexpected(invalid("worker_threads exceeds 1024"));
  if (config.max_message_bytes < 64) return std::unexpected(invalid("max_message_bytes below 64"));
  return {};
}

} // namespace bloomdb::server
