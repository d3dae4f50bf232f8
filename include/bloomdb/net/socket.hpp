#pragma once

/** \file socket.hpp
 *  \brief Blocking TCP socket with RAII ownership and framed message I/O.
 *
 * Thread-safety: a Socket is used by one thread at a time, except shutdown(),
 * which may be called concurrently to unblock accept()/recv().
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

#include "bloomdb/error.hpp"

namespace bloomdb::net {

class Socket {
public:
    Socket() = default;
    explicit Socket(int fd) noexcept : fd_(fd) {}
    ~Socket();

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    /** \brief Connect to host:port; connection error on resolution or connect failure. */
    static auto connect(const std::string& host, std::uint16_t port, std::uint32_t timeout_ms)
        -> std::expected<Socket, core::error>;

    /** \brief Bind and listen; port 0 picks an ephemeral port (see local_port()). */
    static auto listen(const std::string& host, std::uint16_t port, int backlog = 64)
        -> std::expected<Socket, core::error>;

    /** \brief Next inbound connection; cancelled once shutdown() was called. */
    auto accept() -> std::expected<Socket, core::error>;

    auto set_timeouts(std::uint32_t timeout_ms) -> std::expected<void, core::error>;

    auto send_all(std::span<const std::uint8_t> bytes) -> std::expected<void, core::error>;

    /** \brief Exactly n bytes; connection error on EOF or failure. */
    auto recv_exact(std::size_t n) -> std::expected<std::vector<std::uint8_t>, core::error>;

    /** \brief Read one codec frame with the given magic, at most max_bytes long. */
    auto recv_frame(std::uint32_t magic, std::size_t max_bytes)
        -> std::expected<std::vector<std::uint8_t>, core::error>;

    /** \brief Non-blocking check whether the connection was reset or fully shut.
     *  A peer that only half-closed (shut its write side) is not closed. */
    [[nodiscard]] auto peer_closed() const -> bool;

    auto shutdown() noexcept -> void;
    /** \brief Signal end of request; the read side stays open for the reply. */
    auto shutdown_write() noexcept -> void;
    auto close() noexcept -> void;

    [[nodiscard]] auto local_port() const -> std::uint16_t;
    [[nodiscard]] auto peer_name() const -> std::string;
    [[nodiscard]] auto valid() const noexcept -> bool { return fd_ >= 0; }
    [[nodiscard]] auto fd() const noexcept -> int { return fd_; }

private:
    int fd_{-1};
};

} // namespace bloomdb::net
