#include "jazzy/socket.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

#include "jazzy/base-fd.hpp"
#include "jazzy/errno-throw.hpp"
#include "jazzy/log.hpp"

namespace jazzy {

namespace {

int ToSocketType(Socket::Type type) {
  switch (type) {
    case Socket::Type::Stream:
      return SOCK_STREAM;
    case Socket::Type::Datagram:
      return SOCK_DGRAM;
  }
  std::unreachable();
}

}  // namespace

Socket::Socket(Type type) : _baseFd(::socket(AF_INET, ToSocketType(type) | SOCK_CLOEXEC, 0)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

void Socket::bindAndListen(bool reusePort, int backlog, uint16_t& port) {
  const int fd = _baseFd.fd();
  static constexpr int kEnable = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) == -1) {
    throw_errno("setsockopt(SO_REUSEADDR) failed");
  }
  if (reusePort && ::setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &kEnable, sizeof(kEnable)) == -1) {
    log::warn("setsockopt(SO_REUSEPORT) failed on fd # {}", fd);
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port);
  if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == -1) {
    throw_errno("bind failed on port {}", port);
  }
  if (::listen(fd, backlog) == -1) {
    throw_errno("listen failed on port {}", port);
  }
  if (port == 0) {
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == -1) {
      throw_errno("getsockname failed");
    }
    port = ntohs(addr.sin_port);
  }
}

std::optional<Socket> Socket::acceptFor(std::chrono::milliseconds timeout) const {
  pollfd pfd{_baseFd.fd(), POLLIN, 0};
  const int nbReady = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (nbReady == -1) {
    if (errno == EINTR) {
      return std::nullopt;
    }
    throw_errno("poll on listening socket failed");
  }
  if (nbReady == 0) {
    return std::nullopt;
  }
  if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
    // listener was shut down from another thread
    return std::nullopt;
  }
  const int cfd = ::accept4(_baseFd.fd(), nullptr, nullptr, SOCK_CLOEXEC);
  if (cfd == -1) {
    if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED || errno == EINVAL) {
      return std::nullopt;
    }
    throw_errno("accept failed on fd # {}", _baseFd.fd());
  }
  log::debug("Connection fd # {} accepted", cfd);
  return Socket(BaseFd(cfd));
}

bool Socket::setTcpNoDelay() const noexcept {
  static constexpr int kEnable = 1;
  return ::setsockopt(_baseFd.fd(), IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) == 0;
}

long Socket::readSome(char* buf, std::size_t len) const noexcept {
  while (true) {
    const auto nbRead = ::recv(_baseFd.fd(), buf, len, 0);
    if (nbRead == -1 && errno == EINTR) {
      continue;
    }
    return static_cast<long>(nbRead);
  }
}

bool Socket::writeAll(std::string_view data) const noexcept {
  while (!data.empty()) {
    const auto nbWritten = ::send(_baseFd.fd(), data.data(), data.size(), MSG_NOSIGNAL);
    if (nbWritten == -1) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(nbWritten));
  }
  return true;
}

}  // namespace jazzy
