#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

#include "jazzy/base-fd.hpp"

namespace jazzy {

// RAII wrapper of a blocking IPv4 socket. Listening, accepting and TCP options only apply to Stream sockets.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, Datagram };

  Socket() noexcept = default;

  // Creates a new socket of the given type.
  // Throws std::system_error on failure.
  explicit Socket(Type type);

  // Takes ownership of an already opened socket descriptor (typically returned by accept).
  explicit Socket(BaseFd baseFd) noexcept : _baseFd(std::move(baseFd)) {}

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Bind to INADDR_ANY on the given port and start listening. If port is 0, an ephemeral port is chosen and
  // written back into the argument.
  // Throws std::system_error on failure.
  void bindAndListen(bool reusePort, int backlog, uint16_t& port);

  // Waits at most timeout for a pending connection, then accepts it.
  // Returns std::nullopt on timeout or when the wait was interrupted (EINTR).
  // Throws std::system_error on any other failure.
  std::optional<Socket> acceptFor(std::chrono::milliseconds timeout) const;

  // Disables Nagle's algorithm. Returns true on success.
  bool setTcpNoDelay() const noexcept;

  // Reads at most len bytes, blocking until at least one is available.
  // Returns the number of bytes read, 0 on orderly shutdown by the peer, -1 on error (errno is set).
  [[nodiscard]] long readSome(char* buf, std::size_t len) const noexcept;

  // Writes all of data, retrying on partial writes and EINTR.
  // Returns false if the peer went away or on another write error (errno is set).
  [[nodiscard]] bool writeAll(std::string_view data) const noexcept;

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace jazzy
