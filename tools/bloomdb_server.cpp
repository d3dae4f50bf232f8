// bloomdb_server: serve searches over an index root until SIGINT/SIGTERM.
//
//   bloomdb_server [--host=H] [--port=N] [--index_root=DIR] [--workers=N] [--cache=N]
//                  [--io_timeout_ms=N]
// Flags override BLOOMDB_* environment variables.

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "bloomdb/server/search_server.hpp"

using namespace bloomdb;

static std::atomic<bool> g_stop{false};

extern "C" void on_signal(int) { g_stop.store(true); }

static std::optional<std::string> eat_arg(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

int main(int argc, char** argv) {
    auto config = server::config_from_env();
    if (!config) { std::cerr << core::describe(config.error()) << std::endl; return 2; }

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a(argv[i]);
            if (auto v = eat_arg(a, "--host=")) config->host = *v;
            else if (auto v = eat_arg(a, "--port=")) config->port = static_cast<std::uint16_t>(std::stoul(*v));
            else if (auto v = eat_arg(a, "--index_root=")) config->index_root = *v;
            else if (auto v = eat_arg(a, "--workers=")) config->worker_threads = std::stoull(*v);
            else if (auto v = eat_arg(a, "--cache=")) config->cache_capacity = std::stoull(*v);
            else if (auto v = eat_arg(a, "--io_timeout_ms=")) config->io_timeout_ms = static_cast<std::uint32_t>(std::stoul(*v));
            else {
                std::cerr << "unknown argument: " << a << "\nUsage: " << argv[0]
                          << " [--host=H] [--port=N] [--index_root=DIR] [--workers=N] [--cache=N] [--io_timeout_ms=N]"
                          << std::endl;
                return 2;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "invalid argument: " << e.what() << std::endl;
        return 2;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    server::SearchServer srv(*config);
    if (auto ok = srv.start(); !ok) {
        std::cerr << core::describe(ok.error()) << std::endl;
        return 1;
    }
    while (!g_stop.load()) std::this_thread::sleep_for(std::chrono::milliseconds(100));
    srv.stop();

    const auto s = srv.stats();
    const auto c = srv.cache().stats();
    std::cerr << "[SERVER] connections=" << s.connections << " searches=" << s.searches
              << " errors=" << s.errors << " cache_hit_rate=" << c.hit_rate() << std::endl;
    return 0;
}
