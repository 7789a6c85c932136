#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace guardway {

// Latency histogram with fixed buckets (in milliseconds).
// Prometheus-compatible: cumulative counts per bucket + _sum + _count.
struct LatencyHistogram {
  // Upper bounds in milliseconds: 10, 50, 100, 250, 500, 1000, 2500, 5000,
  // 10000, 30000, +Inf
  static constexpr std::array<double, 10> kBuckets{
      10.0, 50.0, 100.0, 250.0, 500.0, 1000.0, 2500.0, 5000.0, 10000.0, 30000.0};
  std::array<std::atomic<uint64_t>, 11> counts{}; // 10 finite + 1 +Inf
  std::atomic<uint64_t> sum_ms{0};
  std::atomic<uint64_t> total{0};

  void Record(double ms);
};

class MetricsRegistry {
public:
  void SetService(const std::string &service);

  // Terminal outcome of one inbound request ("completed", "blocked",
  // "rate_limited", ...).
  void RecordRequestOutcome(const std::string &outcome);
  void RecordLatency(double ms);
  void IncrementConnections();
  void DecrementConnections();

  // Guardrails.
  void RecordRedaction();
  void RecordInjection(const std::string &signature);
  void RecordRedactorFallback();

  // Upstream. `attempts` is the number of HTTP attempts a dispatch used.
  void RecordUpstreamAttempts(int attempts);
  void RecordUpstreamFailure(const std::string &reason);

  // Estimated token usage (billing simulation).
  void RecordTokenEstimates(int prompt_tokens, int completion_tokens);

  std::string RenderPrometheus() const;

private:
  mutable std::mutex service_mutex_;
  std::string service_{"guardway"};

  std::atomic<uint64_t> redacted_requests_{0};
  std::atomic<uint64_t> redactor_fallbacks_{0};
  std::atomic<uint64_t> upstream_attempts_{0};
  std::atomic<uint64_t> upstream_retries_{0};
  std::atomic<uint64_t> prompt_tokens_{0};
  std::atomic<uint64_t> completion_tokens_{0};
  std::atomic<int> active_connections_{0};

  LatencyHistogram request_latency_;

  mutable std::mutex labelled_mutex_;
  std::map<std::string, uint64_t> outcomes_;
  std::map<std::string, uint64_t> injections_;
  std::map<std::string, uint64_t> upstream_failures_;
};

MetricsRegistry &GlobalMetrics();

} // namespace guardway
