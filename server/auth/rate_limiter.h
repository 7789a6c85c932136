#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace guardway {

// Per-key token bucket: each key may burst up to requests_per_minute and
// refills continuously at requests_per_minute / 60 per second. A limit of 0
// disables limiting.
class RateLimiter {
 public:
  using Clock = std::chrono::steady_clock;

  explicit RateLimiter(int requests_per_minute);

  // Consumes one request for `key`. When denied and `retry_after_seconds` is
  // non-null it receives the whole seconds until one request is available
  // again (at least 1).
  bool Allow(const std::string& key, int* retry_after_seconds = nullptr);
  bool Allow(const std::string& key, Clock::time_point now, int* retry_after_seconds);

  bool Enabled() const;
  void UpdateLimit(int requests_per_minute);
  int CurrentLimit() const;

  // The counters live in process memory; the backend is reachable whenever
  // the process is.
  bool Healthy() const { return true; }
  std::size_t TrackedKeys() const;

  // Fully refilled buckets are pruned once more keys than this are tracked.
  static constexpr std::size_t kPruneThreshold = 10000;

 private:
  struct Entry {
    double tokens{0.0};
    Clock::time_point last;
  };

  void PruneLocked(Clock::time_point now);

  double requests_per_minute_;
  double refill_per_second_;
  std::unordered_map<std::string, Entry> entries_;
  mutable std::mutex mutex_;
};

}  // namespace guardway
