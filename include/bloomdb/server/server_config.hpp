#pragma once

/** \file server_config.hpp
 *  \brief Search server configuration and environment overrides.
 */

#include <cstdint>
#include <expected>
#include <string>

#include "bloomdb/error.hpp"

namespace bloomdb::server {

struct ServerConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t port{8888};                    /**< 0 = ephemeral */
    std::string index_root{"."};                 /**< location holding index sources */
    std::size_t worker_threads{0};               /**< 0 = hardware concurrency */
    std::size_t cache_capacity{256};             /**< loaded indexes kept; 0 disables */
    std::uint32_t io_timeout_ms{30000};          /**< per-socket send/recv timeout; 0 = none */
    std::size_t max_message_bytes{16u << 20};
};

/** \brief Apply BLOOMDB_HOST, BLOOMDB_PORT, BLOOMDB_INDEX_ROOT, BLOOMDB_WORKERS,
 *         BLOOMDB_CACHE_CAPACITY and BLOOMDB_IO_TIMEOUT_MS on top of base.
 *
 * \return config_invalid when a variable does not parse or is out of range
 */
auto config_from_env(ServerConfig base = {}) -> std::expected<ServerConfig, core::error>;

/** \brief Check ranges and required fields. */
auto validate(const ServerConfig& config) -> std::expected<void, core::error>;

} // namespace bloomdb::server
