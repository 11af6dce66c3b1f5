#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace jazzy {

// Point in time copy of the request counters.
struct MetricsSnapshot {
  // Floor of totalResponseTimeMs / totalRequests, 0 when no request was received.
  [[nodiscard]] uint64_t averageResponseTimeMs() const noexcept {
    return totalRequests == 0 ? 0 : totalResponseTimeMs / totalRequests;
  }

  // Plain text report, one "Label: value" line per counter, served by the /metrics endpoint.
  [[nodiscard]] std::string report() const;

  // Serialize this snapshot to JSON (single object).
  [[nodiscard]] std::string json_str() const;

  template <class F>
  void for_each_field(F&& fun) const {
    fun("totalRequests", totalRequests);
    fun("successfulRequests", successfulRequests);
    fun("failedRequests", failedRequests);
    fun("totalResponseTimeMs", totalResponseTimeMs);
  }

  uint64_t totalRequests{};
  uint64_t successfulRequests{};
  uint64_t failedRequests{};
  uint64_t totalResponseTimeMs{};
};

// Request counters of one server, updated concurrently by all its connection threads.
// The four counters are independent: a snapshot taken while requests are in flight may be momentarily
// inconsistent (for instance total < successful + failed is possible).
class Metrics {
 public:
  // Called when a connection starts to be processed.
  void onRequestStart() noexcept { _totalRequests.fetch_add(1, std::memory_order_relaxed); }

  // Called once a response produced by a request handler has been fully written.
  void onRequestSuccess(std::chrono::milliseconds responseTime) noexcept {
    _successfulRequests.fetch_add(1, std::memory_order_relaxed);
    _totalResponseTimeMs.fetch_add(static_cast<uint64_t>(responseTime.count()), std::memory_order_relaxed);
  }

  // Called when an unexpected fault escaped request processing.
  void onRequestFailure() noexcept { _failedRequests.fetch_add(1, std::memory_order_relaxed); }

  [[nodiscard]] MetricsSnapshot snapshot() const noexcept;

  void reset() noexcept;

 private:
  std::atomic<uint64_t> _totalRequests{};
  std::atomic<uint64_t> _successfulRequests{};
  std::atomic<uint64_t> _failedRequests{};
  std::atomic<uint64_t> _totalResponseTimeMs{};
};

}  // namespace jazzy
