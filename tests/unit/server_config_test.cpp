#include <catch2/catch_all.hpp>
#include <bloomdb/server/server_config.hpp>

#include <cstdlib>

using namespace bloomdb;
using namespace bloomdb::server;

namespace {

struct EnvGuard {
  explicit EnvGuard(const char* name, const char* v) : name_(name) { ::setenv(name, v, 1); }
  ~EnvGuard() { ::unsetenv(name_); }
  const char* name_;
};

} // namespace

TEST_CASE("server config defaults", "[config]") {
  const ServerConfig c;
  REQUIRE(c.host == "127.0.0.1");
  REQUIRE(c.port == 8888);
  REQUIRE(c.cache_capacity == 256);
  REQUIRE(c.io_timeout_ms == 30000);
  REQUIRE(validate(c).has_value());
}

TEST_CASE("environment overrides server config", "[config]") {
  EnvGuard port("BLOOMDB_PORT", "9100");
  EnvGuard root("BLOOMDB_INDEX_ROOT", "/srv/indexes");
  EnvGuard cache("BLOOMDB_CACHE_CAPACITY", "0");
  auto c = config_from_env();
  REQUIRE(c.has_value());
  REQUIRE(c->port == 9100);
  REQUIRE(c->index_root == "/srv/indexes");
  REQUIRE(c->cache_capacity == 0);
}

TEST_CASE("unparsable environment is a configuration error", "[config]") {
  {
    EnvGuard port("BLOOMDB_PORT", "70000");
    auto c = config_from_env();
    REQUIRE_FALSE(c.has_value());
    REQUIRE(c.error().code == core::error_code::config_invalid);
  }
  {
    EnvGuard workers("BLOOMDB_WORKERS", "four");
    REQUIRE_FALSE(config_from_env().has_value());
  }
  ServerConfig empty_root;
  empty_root.index_root.clear();
  REQUIRE_FALSE(validate(empty_root).has_value());
}
