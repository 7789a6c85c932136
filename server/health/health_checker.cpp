#include "server/health/health_checker.h"

#include "gateway/upstream_dispatcher.h"
#include "server/auth/rate_limiter.h"
#include "server/logging/logger.h"

using json = nlohmann::json;

namespace guardway {

HealthChecker::HealthChecker(const UpstreamDispatcher* dispatcher, const RateLimiter* limiter)
    : dispatcher_(dispatcher), limiter_(limiter) {}

json HealthChecker::CheckUpstream() const {
  if (!dispatcher_) {
    return {{"reachable", false}, {"error", "upstream not configured"}};
  }
  try {
    HttpResponse resp = dispatcher_->ListModels();
    return {{"reachable", resp.status < 500}, {"status_code", resp.status}};
  } catch (const HttpError& ex) {
    log::Warn("health", "upstream probe failed", std::string("error=") + ex.what());
    return {{"reachable", false}, {"error", ex.what()}};
  }
}

json HealthChecker::CheckRateLimiter() const {
  if (!limiter_) {
    return {{"reachable", false}, {"error", "rate limiter not configured"}};
  }
  return {{"reachable", limiter_->Healthy()},
          {"backend", "in_process"},
          {"requests_per_minute", limiter_->CurrentLimit()}};
}

HealthStatus HealthChecker::Check() const {
  HealthStatus status;
  json upstream = CheckUpstream();
  json limiter = CheckRateLimiter();
  status.upstream_ok = upstream.value("reachable", false);
  status.rate_limiter_ok = limiter.value("reachable", false);
  status.ok = status.upstream_ok && status.rate_limiter_ok;
  status.details = {{"upstream", std::move(upstream)}, {"rate_limiter", std::move(limiter)}};
  return status;
}

json ToJson(const HealthStatus& status) {
  return {{"ok", status.ok},
          {"upstream_ok", status.upstream_ok},
          {"rate_limiter_ok", status.rate_limiter_ok},
          {"details", status.details}};
}

}  // namespace guardway
