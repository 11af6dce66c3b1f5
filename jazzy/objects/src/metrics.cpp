#include "jazzy/metrics.hpp"

#include <fmt/format.h>

#include <atomic>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>

namespace jazzy {

std::string MetricsSnapshot::report() const {
  return fmt::format("Total Requests: {}\nTotal Failed Requests: {}\nAverage Response Time (ms): {}\n", totalRequests,
                     failedRequests, averageResponseTimeMs());
}

std::string MetricsSnapshot::json_str() const {
  std::string out;
  out.reserve(128UL);
  out.push_back('{');
  for_each_field([&out](std::string_view name, uint64_t value) {
    if (out.size() > 1) {
      out.push_back(',');
    }
    fmt::format_to(std::back_inserter(out), "\"{}\":{}", name, value);
  });
  out.push_back('}');
  return out;
}

MetricsSnapshot Metrics::snapshot() const noexcept {
  MetricsSnapshot snapshot;
  snapshot.totalRequests = _totalRequests.load(std::memory_order_relaxed);
  snapshot.successfulRequests = _successfulRequests.load(std::memory_order_relaxed);
  snapshot.failedRequests = _failedRequests.load(std::memory_order_relaxed);
  snapshot.totalResponseTimeMs = _totalResponseTimeMs.load(std::memory_order_relaxed);
  return snapshot;
}

void Metrics::reset() noexcept {
  _totalRequests.store(0, std::memory_order_relaxed);
  _successfulRequests.store(0, std::memory_order_relaxed);
  _failedRequests.store(0, std::memory_order_relaxed);
  _totalResponseTimeMs.store(0, std::memory_order_relaxed);
}

}  // namespace jazzy
