#pragma once

#include <arpa/inet.h>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace hapticlink {

constexpr const char *kLimitedBroadcast = "255.255.255.255";

/// Remote service address.
struct endpoint {
  std::string host;
  int port = 0;

  bool operator==(const endpoint &other) const {
    return host == other.host && port == other.port;
  }
  bool operator!=(const endpoint &other) const { return !(*this == other); }

  std::string str() const { return host + ":" + std::to_string(port); }
};

enum class recv_status { ok, timeout, transient, fatal };

/// Dotted-quad IPv4 address; host names are not resolved.
inline bool is_ipv4_literal(const std::string &host) {
  in_addr addr{};
  return ::inet_pton(AF_INET, host.c_str(), &addr) == 1;
}

inline sockaddr_in to_sockaddr(const endpoint &ep) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(ep.port));
  if (::inet_pton(AF_INET, ep.host.c_str(), &addr.sin_addr) != 1)
    throw std::invalid_argument("invalid IPv4 host: " + ep.host);
  return addr;
}

inline endpoint from_sockaddr(const sockaddr_in &addr) {
  char buf[INET_ADDRSTRLEN] = {0};
  ::inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf));
  return {buf, ntohs(addr.sin_port)};
}

/// Open an IPv4 datagram socket. bind_port < 0 leaves it unbound,
/// 0 binds an ephemeral port on bind_host.
inline int open_udp_socket(int bind_port = -1, bool broadcast = false,
                           const std::string &bind_host = "0.0.0.0") {
  int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0)
    throw std::runtime_error("socket() failed: " +
                             std::string(std::strerror(errno)));

  int one = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
  if (broadcast &&
      ::setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &one, sizeof(one)) != 0) {
    ::close(fd);
    throw std::runtime_error("SO_BROADCAST failed: " +
                             std::string(std::strerror(errno)));
  }

  if (bind_port >= 0) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(bind_port));
    if (bind_host == "0.0.0.0") {
      addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (::inet_pton(AF_INET, bind_host.c_str(), &addr.sin_addr) != 1) {
      ::close(fd);
      throw std::invalid_argument("invalid bind host: " + bind_host);
    }
    if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
      int err = errno;
      ::close(fd);
      throw std::runtime_error("bind(" + std::to_string(bind_port) +
                               ") failed: " + std::strerror(err));
    }
  }
  return fd;
}

/// Restrict a socket to one peer so ICMP errors from it surface on recv.
inline void connect_udp_socket(int fd, const endpoint &ep) {
  auto addr = to_sockaddr(ep);
  if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0)
    throw std::runtime_error("connect(" + ep.str() + ") failed: " +
                             std::strerror(errno));
}

inline int bound_port(int fd) {
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len) != 0)
    return -1;
  return ntohs(addr.sin_port);
}

inline bool send_datagram(int fd, const std::string &payload) {
  ssize_t n = ::send(fd, payload.data(), payload.size(), 0);
  return n == static_cast<ssize_t>(payload.size());
}

inline bool send_datagram_to(int fd, const endpoint &ep,
                             const std::string &payload) {
  sockaddr_in addr{};
  try {
    addr = to_sockaddr(ep);
  } catch (const std::invalid_argument &) {
    return false;
  }
  ssize_t n = ::sendto(fd, payload.data(), payload.size(), 0,
                       reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
  return n == static_cast<ssize_t>(payload.size());
}

/// Errors after which a socket will not deliver anything useful again.
inline bool is_fatal_socket_error(int err) {
  switch (err) {
  case ECONNREFUSED:
  case ENETUNREACH:
  case ENETDOWN:
  case EHOSTUNREACH:
  case EBADF:
  case ENOTSOCK:
  case ENOTCONN:
    return true;
  default:
    return false;
  }
}

/// Wait up to timeout_ms for one datagram. `err` receives errno on
/// transient/fatal results.
inline recv_status recv_datagram(int fd, int timeout_ms, std::string &out,
                                 endpoint *from = nullptr, int *err = nullptr) {
  out.clear();
  pollfd pfd{fd, POLLIN, 0};
  int rc = ::poll(&pfd, 1, timeout_ms);
  if (rc == 0)
    return recv_status::timeout;
  if (rc < 0) {
    if (err)
      *err = errno;
    return errno == EINTR ? recv_status::transient : recv_status::fatal;
  }
  if ((pfd.revents & POLLNVAL) != 0) {
    if (err)
      *err = EBADF;
    return recv_status::fatal;
  }

  char buf[65536];
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  ssize_t n = ::recvfrom(fd, buf, sizeof(buf), MSG_DONTWAIT,
                         reinterpret_cast<sockaddr *>(&addr), &len);
  if (n < 0) {
    int e = errno;
    if (err)
      *err = e;
    if (e == EAGAIN || e == EWOULDBLOCK || e == EINTR)
      return recv_status::transient;
    return is_fatal_socket_error(e) ? recv_status::fatal
                                    : recv_status::transient;
  }
  out.assign(buf, static_cast<size_t>(n));
  if (from)
    *from = from_sockaddr(addr);
  return recv_status::ok;
}

/// Wake any reader blocked on fd, then release it.
inline void close_udp_socket(int &fd) {
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
    fd = -1;
  }
}

/// Broadcast addresses of every up, non-loopback IPv4 interface, followed
/// by the limited broadcast address.
inline std::vector<std::string> local_broadcast_addresses() {
  std::vector<std::string> out;
  ifaddrs *list = nullptr;
  if (::getifaddrs(&list) == 0) {
    for (auto *ifa = list; ifa != nullptr; ifa = ifa->ifa_next) {
      if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET)
        continue;
      if ((ifa->ifa_flags & IFF_UP) == 0 || (ifa->ifa_flags & IFF_LOOPBACK) != 0)
        continue;

      in_addr bcast{};
      if ((ifa->ifa_flags & IFF_BROADCAST) != 0 && ifa->ifa_broadaddr != nullptr) {
        bcast = reinterpret_cast<sockaddr_in *>(ifa->ifa_broadaddr)->sin_addr;
      } else if (ifa->ifa_netmask != nullptr) {
        auto ip = reinterpret_cast<sockaddr_in *>(ifa->ifa_addr)->sin_addr.s_addr;
        auto mask =
            reinterpret_cast<sockaddr_in *>(ifa->ifa_netmask)->sin_addr.s_addr;
        bcast.s_addr = ip | ~mask;
      } else {
        continue;
      }

      char buf[INET_ADDRSTRLEN] = {0};
      ::inet_ntop(AF_INET, &bcast, buf, sizeof(buf));
      std::string addr(buf);
      bool seen = false;
      for (const auto &a : out)
        seen = seen || a == addr;
      if (!seen && addr != kLimitedBroadcast)
        out.push_back(addr);
    }
    ::freeifaddrs(list);
  }
  out.emplace_back(kLimitedBroadcast);
  return out;
}

} // namespace hapticlink
