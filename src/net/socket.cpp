#include "bloomdb/net/socket.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "bloomdb/codec/frame.hpp"

namespace bloomdb::net {

namespace {

auto sys_error(core::error_code code, const std::string& what, int err) -> core::error {
  return core::error{code, what + ": " + std::strerror(err), "net.socket"};
}

struct AddrInfo {
  addrinfo* head{nullptr};
  ~AddrInfo() { if (head) ::freeaddrinfo(head); }
};

auto resolve(const std::string& host, std::uint16_t port, bool passive, AddrInfo& out)
    -> std::expected<void, core::error> {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  if (passive) hints.ai_flags = AI_PASSIVE;
  const std::string service = std::to_string(port);
  const int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &out.head);
  if (rc != 0) {
    return std::unexpected(core::error{core::error_code::connection,
        "cannot resolve " + host + ": " + ::gai_strerror(rc), "net.socket"});
  }
  return {};
}

} // namespace

Socket::~Socket() { close(); }

Socket::Socket(Socket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Socket& Socket::operator=(Socket&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

auto Socket::connect(const std::string& host, std::uint16_t port, std::uint32_t timeout_ms)
    -> std::expected<Socket, core::error> {
  AddrInfo ai;
  if (auto r = resolve(host, port, false, ai); !r) return std::unexpected(r.error());
  int last_err = ECONNREFUSED;
  for (addrinfo* p = ai.head; p != nullptr; p = p->ai_next) {
    Socket s(::socket(p->ai_family, p->ai_socktype, p->ai_protocol));
    if (!s.valid()) { last_err = errno; continue; }
    if (timeout_ms > 0) {
      if (auto t = s.set_timeouts(timeout_ms); !t) return std::unexpected(t.error());
    }
    if (::connect(s.fd_, p->ai_addr, p->ai_addrlen) == 0) {
      int one = 1;
      (void)::setsockopt(s.fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
      return s;
    }
    last_err = errno;
  }
  return std::unexpected(sys_error(core::error_code::connection,
      "connect to " + host + ":" + std::to_string(port) + " failed", last_err));
}

auto Socket::listen(const std::string& host, std::uint16_t port, int backlog)
    -> std::expected<Socket, core::error> {
  AddrInfo ai;
  if (auto r = resolve(host, port, true, ai); !r) return std::unexpected(r.error());
  int last_err = EADDRNOTAVAIL;
  for (addrinfo* p = ai.head; p != nullptr; p = p->ai_next) {
    Socket s(::socket(p->ai_family, p->ai_socktype, p->ai_protocol));
    if (!s.valid()) { last_err = errno; continue; }
    int opt = 1;
    // Allow immediate rebinding after a restart.
    (void)::setsockopt(s.fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    if (::bind(s.fd_, p->ai_addr, p->ai_addrlen) < 0) { last_err = errno; continue; }
    if (::listen(s.fd_, backlog) < 0) { last_err = errno; continue; }
    return s;
  }
  return std::unexpected(sys_error(core::error_code::connection,
      "listen on " + host + ":" + std::to_string(port) + " failed", last_err));
}

auto Socket::accept() -> std::expected<Socket, core::error> {
  for (;;) {
    const int fd = ::accept(fd_, nullptr, nullptr);
    if (fd >= 0) return Socket(fd);
    if (errno == EINTR || errno == ECONNABORTED) continue;
    if (errno == EINVAL || errno == EBADF) {
      return std::unexpected(core::error{core::error_code::cancelled, "listener shut down", "net.socket"});
    }
    return std::unexpected(sys_error(core::error_code::connection, "accept failed", errno));
  }
}

auto Socket::set_timeouts(std::uint32_t timeout_ms) -> std::expected<void, core::error> {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout_ms / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000) * 1000);
  if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
      ::setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
    return std::unexpected(sys_error(core::error_code::connection, "setsockopt timeout failed", errno));
  }
  return {};
}

auto Socket::send_all(std::span<const std::uint8_t> bytes) -> std::expected<void, core::error> {
  std::size_t sent = 0;
  while (sent < bytes.size()) {
    const ssize_t n = ::send(fd_, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return std::unexpected(sys_error(core::error_code::connection, "send failed", errno));
    }
    sent += static_cast<std::size_t>(n);
  }
  return {};
}

auto Socket::recv_exact(std::size_t n) -> std::expected<std::vector<std::uint8_t>, core::error> {
  std::vector<std::uint8_t> buf(n);
  std::size_t got = 0;
  while (got < n) {
    const ssize_t r = ::recv(fd_, buf.data() + got, n - got, 0);
    if (r == 0) {
      return std::unexpected(core::error{core::error_code::connection, "peer closed the connection", "net.socket"});
    }
    if (r < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return std::unexpected(core::error{core::error_code::connection, "receive timed out", "net.socket"});
      }
      return std::unexpected(sys_error(core::error_code::connection, "recv failed", errno));
    }
    got += static_cast<std::size_t>(r);
  }
  return buf;
}

auto Socket::recv_frame(std::uint32_t magic, std::size_t max_bytes)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  auto head = recv_exact(codec::FRAME_HEADER_SIZE);
  if (!head) return std::unexpected(head.error());
  auto h = codec::decode_header(*head, magic);
  if (!h) {
    return std::unexpected(core::error{core::error_code::protocol, h.error().message, "net.socket"});
  }
  if (h->len > max_bytes) {
    return std::unexpected(core::error{core::error_code::protocol,
        "message of " + std::to_string(h->len) + " bytes exceeds limit of " + std::to_string(max_bytes),
        "net.socket"});
  }
  auto rest = recv_exact(h->len - codec::FRAME_HEADER_SIZE);
  if (!rest) return std::unexpected(rest.error());
  head->insert(head->end(), rest->begin(), rest->end());
  return head;
}

// A FIN alone (POLLRDHUP) only ends the peer's sending side; it may still read
// the reply. Only a reset or a fully shut connection counts as gone.
auto Socket::peer_closed() const -> bool {
  pollfd p{};
  p.fd = fd_;
  p.events = 0;
  const int r = ::poll(&p, 1, 0);
  if (r < 0) return errno != EINTR;
  return r > 0 && (p.revents & (POLLHUP | POLLERR | POLLNVAL)) != 0;
}

auto Socket::shutdown() noexcept -> void {
  if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
}

auto Socket::shutdown_write() noexcept -> void {
  if (fd_ >= 0) ::shutdown(fd_, SHUT_WR);
}

auto Socket::close() noexcept -> void {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

auto Socket::local_port() const -> std::uint16_t {
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) return 0;
  if (addr.ss_family == AF_INET) return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
  if (addr.ss_family == AF_INET6) return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
  return 0;
}

auto Socket::peer_name() const -> std::string {
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (::getpeername(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) return "?";
  char host[NI_MAXHOST];
  char serv[NI_MAXSERV];
  if (::getnameinfo(reinterpret_cast<sockaddr*>(&addr), len, host, sizeof(host), serv, sizeof(serv),
                    NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
    return "?";
  }
  return std::string(host) + ":" + serv;
}

} // namespace bloomdb::net
