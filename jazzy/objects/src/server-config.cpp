#include "jazzy/server-config.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>

namespace jazzy {

void ServerConfig::validate() const {
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("Poll interval should be strictly positive");
  }
  if (std::cmp_less(std::numeric_limits<int>::max(), pollInterval.count())) {
    throw std::invalid_argument("Poll interval value is too large");
  }
  if (listenBacklog <= 0) {
    throw std::invalid_argument("Listen backlog should be strictly positive");
  }
}

ServerConfig& ServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

ServerConfig& ServerConfig::withMetrics(bool on) {
  this->enableMetrics = on;
  return *this;
}

ServerConfig& ServerConfig::withReusePort(bool on) {
  this->reusePort = on;
  return *this;
}

ServerConfig& ServerConfig::withTcpNoDelay(bool on) {
  this->tcpNoDelay = on;
  return *this;
}

ServerConfig& ServerConfig::withPollInterval(std::chrono::milliseconds interval) {
  this->pollInterval = interval;
  return *this;
}

ServerConfig& ServerConfig::withListenBacklog(int backlog) {
  this->listenBacklog = backlog;
  return *this;
}

}  // namespace jazzy
