#pragma once

#include "storysync/error.hpp"

#include <arpa/inet.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <optional>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <utility>

namespace storysync {

using steady_clock = std::chrono::steady_clock;

/// Bound on a blocking socket operation. When `cancelled` is set the wait is
/// cut into `slice`-long polls so that a stop request is noticed.
struct io_deadline {
  steady_clock::time_point at;
  const std::atomic<bool> *cancelled = nullptr;
  std::chrono::milliseconds slice{100};

  static io_deadline after(std::chrono::milliseconds budget,
                           const std::atomic<bool> *cancelled = nullptr) {
    return io_deadline{steady_clock::now() + budget, cancelled,
                       std::chrono::milliseconds(100)};
  }
};

inline std::string errno_text(const char *what) {
  return std::string(what) + ": " + std::strerror(errno);
}

/// Block until `fd` is ready for `events`. Throws sync_error(timeout) when the
/// deadline passes and sync_error(connection_failed) on cancellation.
inline void wait_ready(int fd, short events, const io_deadline &deadline) {
  for (;;) {
    if (deadline.cancelled != nullptr && deadline.cancelled->load())
      throw sync_error(error_kind::connection_failed, "cancelled");

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline.at - steady_clock::now());
    if (remaining.count() <= 0)
      throw sync_error(error_kind::timeout, "timed out");

    auto wait = remaining;
    if (deadline.cancelled != nullptr && deadline.slice < wait)
      wait = deadline.slice;

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = events;
    int rc = ::poll(&pfd, 1, static_cast<int>(wait.count()));
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      throw sync_error(error_kind::connection_failed, errno_text("poll"));
    }
    if (rc > 0)
      return;
  }
}

inline void send_all(int fd, const void *data, size_t size,
                     const io_deadline &deadline) {
  const auto *ptr = static_cast<const uint8_t *>(data);
  size_t sent = 0;
  while (sent < size) {
    wait_ready(fd, POLLOUT, deadline);
    ssize_t n = ::send(fd, ptr + sent, size - sent, MSG_NOSIGNAL | MSG_DONTWAIT);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
        continue;
      throw sync_error(error_kind::connection_failed, errno_text("send"));
    }
    sent += static_cast<size_t>(n);
  }
}

/// Read whatever is available, at most `n` bytes. Returns 0 at end of stream.
inline size_t recv_some(int fd, void *buf, size_t n,
                        const io_deadline &deadline) {
  for (;;) {
    wait_ready(fd, POLLIN, deadline);
    ssize_t got = ::recv(fd, buf, n, MSG_DONTWAIT);
    if (got < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
        continue;
      throw sync_error(error_kind::connection_failed, errno_text("recv"));
    }
    return static_cast<size_t>(got);
  }
}

/// Owning wrapper for a socket descriptor.
class socket_handle {
public:
  socket_handle() = default;
  explicit socket_handle(int fd) : fd_(fd) {}
  ~socket_handle() { reset(); }

  socket_handle(const socket_handle &) = delete;
  socket_handle &operator=(const socket_handle &) = delete;

  socket_handle(socket_handle &&other) noexcept : fd_(other.release()) {}
  socket_handle &operator=(socket_handle &&other) noexcept {
    if (this != &other)
      reset(other.release());
    return *this;
  }

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

  int release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }

  void reset(int fd = -1) {
    if (fd_ >= 0)
      ::close(fd_);
    fd_ = fd;
  }

private:
  int fd_ = -1;
};

struct tcp_listener {
  socket_handle socket;
  std::string host;
  uint16_t port = 0;
};

inline in_addr resolve_ipv4(const std::string &host) {
  in_addr addr{};
  if (::inet_pton(AF_INET, host.c_str(), &addr) == 1)
    return addr;

  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *found = nullptr;
  int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &found);
  if (rc != 0 || found == nullptr) {
    throw sync_error(error_kind::connection_failed,
                     "cannot resolve host " + host + ": " + ::gai_strerror(rc));
  }
  addr = reinterpret_cast<sockaddr_in *>(found->ai_addr)->sin_addr;
  ::freeaddrinfo(found);
  return addr;
}

/// Bind and listen on host:port. Port 0 picks an ephemeral port; the
/// returned listener carries the port actually bound.
inline tcp_listener listen_tcp(const std::string &host, uint16_t port) {
  socket_handle sock(::socket(AF_INET, SOCK_STREAM, 0));
  if (!sock.valid())
    throw sync_error(error_kind::bind_failure, errno_text("socket"));

  int one = 1;
  ::setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (host.empty() || host == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    throw sync_error(error_kind::bind_failure, "invalid bind host: " + host);
  }

  if (::bind(sock.get(), reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0)
    throw sync_error(error_kind::bind_failure, errno_text("bind"));
  if (::listen(sock.get(), 16) < 0)
    throw sync_error(error_kind::bind_failure, errno_text("listen"));

  sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  if (::getsockname(sock.get(), reinterpret_cast<sockaddr *>(&bound), &len) < 0)
    throw sync_error(error_kind::bind_failure, errno_text("getsockname"));

  return tcp_listener{std::move(sock), host, ntohs(bound.sin_port)};
}

/// Wait up to `wait` for one inbound connection. Returns an empty handle
/// when nothing arrived in time.
inline socket_handle accept_for(tcp_listener &lis,
                                std::chrono::milliseconds wait) {
  pollfd pfd{};
  pfd.fd = lis.socket.get();
  pfd.events = POLLIN;
  int rc = ::poll(&pfd, 1, static_cast<int>(wait.count()));
  if (rc < 0) {
    if (errno == EINTR)
      return socket_handle();
    throw std::runtime_error(errno_text("poll(listener)"));
  }
  if (rc == 0)
    return socket_handle();
  if ((pfd.revents & (POLLERR | POLLNVAL)) != 0)
    throw std::runtime_error("listener closed");

  int fd = ::accept(lis.socket.get(), nullptr, nullptr);
  if (fd < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR ||
        errno == ECONNABORTED)
      return socket_handle();
    throw std::runtime_error(errno_text("accept"));
  }
  return socket_handle(fd);
}

inline void close_listener(tcp_listener &lis) {
  if (lis.socket.valid()) {
    ::shutdown(lis.socket.get(), SHUT_RDWR);
    lis.socket.reset();
  }
}

/// Open a TCP connection to host:port within the deadline.
inline socket_handle connect_tcp(const std::string &host, uint16_t port,
                                 const io_deadline &deadline) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr = resolve_ipv4(host);

  socket_handle sock(::socket(AF_INET, SOCK_STREAM, 0));
  if (!sock.valid())
    throw sync_error(error_kind::connection_failed, errno_text("socket"));

  int flags = ::fcntl(sock.get(), F_GETFL, 0);
  ::fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK);

  if (::connect(sock.get(), reinterpret_cast<sockaddr *>(&addr),
                sizeof(addr)) != 0) {
    if (errno != EINPROGRESS)
      throw sync_error(error_kind::connection_failed, errno_text("connect"));

    wait_ready(sock.get(), POLLOUT, deadline);

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    ::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &so_error, &len);
    if (so_error != 0) {
      throw sync_error(error_kind::connection_failed,
                       std::string("connect: ") + std::strerror(so_error));
    }
  }
  return sock;
}

/// First up, non-loopback IPv4 address of this host.
inline std::string local_ip() {
  ifaddrs *list = nullptr;
  if (::getifaddrs(&list) != 0)
    throw sync_error(error_kind::bind_failure, errno_text("getifaddrs"));

  std::string found;
  for (ifaddrs *it = list; it != nullptr; it = it->ifa_next) {
    if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET)
      continue;
    if ((it->ifa_flags & IFF_UP) == 0 || (it->ifa_flags & IFF_LOOPBACK) != 0)
      continue;

    char text[INET_ADDRSTRLEN] = {0};
    auto *sin = reinterpret_cast<sockaddr_in *>(it->ifa_addr);
    if (::inet_ntop(AF_INET, &sin->sin_addr, text, sizeof(text)) != nullptr) {
      found = text;
      break;
    }
  }
  ::freeifaddrs(list);

  if (found.empty())
    throw sync_error(error_kind::bind_failure,
                     "Failed to get local IP: no network interface is up");
  return found;
}

} // namespace storysync
