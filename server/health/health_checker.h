#pragma once

#include <nlohmann/json.hpp>

namespace guardway {

class RateLimiter;
class UpstreamDispatcher;

struct HealthStatus {
  bool ok{false};
  bool upstream_ok{false};
  bool rate_limiter_ok{false};
  nlohmann::json details;
};

// Aggregates upstream reachability (GET /v1/models answers below 500) and
// rate-limiter backend status. Each Check() probes afresh.
class HealthChecker {
 public:
  HealthChecker(const UpstreamDispatcher* dispatcher, const RateLimiter* limiter);

  HealthStatus Check() const;

 private:
  nlohmann::json CheckUpstream() const;
  nlohmann::json CheckRateLimiter() const;

  const UpstreamDispatcher* dispatcher_;
  const RateLimiter* limiter_;
};

// {"ok", "upstream_ok", "rate_limiter_ok", "details"}
nlohmann::json ToJson(const HealthStatus& status);

}  // namespace guardway
