#include <catch2/catch_all.hpp>
#include <bloomdb/cache/index_cache.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace bloomdb;
using namespace bloomdb::cache;

namespace {

auto counting_loader(std::atomic<int>& calls) -> IndexLoader {
  return [&calls](const std::string& loc) -> std::expected<FileIndex, core::error> {
    calls.fetch_add(1);
    if (loc.find("bad") != std::string::npos) {
      return std::unexpected(core::error{core::error_code::store_read, "corrupt", "test"});
    }
    return FileIndex(loc, index::BuildConfig{}, {});
  };
}

} // namespace

TEST_CASE("cache loads once and then hits", "[cache]") {
  IndexCache cache(8, 2);
  std::atomic<int> calls{0};
  auto loader = counting_loader(calls);

  auto a = cache.get_or_load("a.bdx", loader);
  REQUIRE(a.has_value());
  auto again = cache.get_or_load("a.bdx", loader);
  REQUIRE(again.has_value());
  REQUIRE(a->get() == again->get());
  REQUIRE(calls.load() == 1);

  auto s = cache.stats();
  REQUIRE(s.hits == 1);
  REQUIRE(s.misses == 1);
  REQUIRE(s.inserts == 1);
  REQUIRE(s.hit_rate() == Catch::Approx(0.5));
}

TEST_CASE("load failures are not cached", "[cache]") {
  IndexCache cache(8);
  std::atomic<int> calls{0};
  auto loader = counting_loader(calls);
  REQUIRE_FALSE(cache.get_or_load("bad.bdx", loader).has_value());
  REQUIRE_FALSE(cache.get_or_load("bad.bdx", loader).has_value());
  REQUIRE(calls.load() == 2);
  REQUIRE(cache.size() == 0);
}

TEST_CASE("least recently used entries are evicted", "[cache]") {
  IndexCache cache(2, 1);
  std::atomic<int> calls{0};
  auto loader = counting_loader(calls);
  REQUIRE(cache.get_or_load("a", loader).has_value());
  REQUIRE(cache.get_or_load("b", loader).has_value());
  REQUIRE(cache.get("a") != nullptr);          // a is now most recent
  REQUIRE(cache.get_or_load("c", loader).has_value());
  REQUIRE(cache.size() == 2);
  REQUIRE(cache.get("b") == nullptr);
  REQUIRE(cache.get("a") != nullptr);
  REQUIRE(cache.stats().evictions == 1);
}

TEST_CASE("zero capacity disables caching", "[cache]") {
  IndexCache cache(0);
  std::atomic<int> calls{0};
  auto loader = counting_loader(calls);
  REQUIRE(cache.get_or_load("a", loader).has_value());
  REQUIRE(cache.get_or_load("a", loader).has_value());
  REQUIRE(calls.load() == 2);
  REQUIRE(cache.size() == 0);
  REQUIRE(cache.get("a") == nullptr);
}

TEST_CASE("concurrent readers share loaded indexes", "[cache][concurrency]") {
  IndexCache cache(64, 1);
  std::atomic<int> calls{0};
  auto loader = counting_loader(calls);
  std::vector<std::thread> threads;
  std::atomic<int> failures{0};
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 200; ++i) {
        auto key = "f" + std::to_string((i + t) % 16);
        auto r = cache.get_or_load(key, loader);
        if (!r || (*r)->source_path() != key) failures.fetch_add(1);
      }
    });
  }
  for (auto& th : threads) th.join();
  REQUIRE(failures.load() == 0);
  REQUIRE(cache.size() == 16);
  // Racing misses may load a key more than once, but never more than once per thread.
  REQUIRE(calls.load() <= 16 * 8);
}
