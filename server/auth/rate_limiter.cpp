#include "server/auth/rate_limiter.h"

#include <algorithm>
#include <cmath>

namespace guardway {

RateLimiter::RateLimiter(int requests_per_minute)
    : requests_per_minute_(requests_per_minute > 0 ? requests_per_minute : 0),
      refill_per_second_(requests_per_minute > 0 ? requests_per_minute / 60.0 : 0.0) {}

bool RateLimiter::Allow(const std::string& key, int* retry_after_seconds) {
  return Allow(key, Clock::now(), retry_after_seconds);
}

bool RateLimiter::Allow(const std::string& key, Clock::time_point now, int* retry_after_seconds) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (requests_per_minute_ <= 0) {
    return true;
  }
  auto found = entries_.find(key);
  if (found == entries_.end()) {
    if (entries_.size() >= kPruneThreshold) {
      PruneLocked(now);
    }
    found = entries_.emplace(key, Entry{requests_per_minute_, now}).first;
  }
  auto& entry = found->second;
  auto elapsed = std::chrono::duration_cast<std::chrono::duration<double>>(now - entry.last).count();
  if (elapsed > 0) {
    entry.tokens = std::min<double>(requests_per_minute_, entry.tokens + elapsed * refill_per_second_);
    entry.last = now;
  }
  if (entry.tokens >= 1.0) {
    entry.tokens -= 1.0;
    return true;
  }
  if (retry_after_seconds) {
    double wait = (1.0 - entry.tokens) / refill_per_second_;
    *retry_after_seconds = std::max(1, static_cast<int>(std::ceil(wait)));
  }
  return false;
}

void RateLimiter::PruneLocked(Clock::time_point now) {
  for (auto it = entries_.begin(); it != entries_.end();) {
    auto elapsed =
        std::chrono::duration_cast<std::chrono::duration<double>>(now - it->second.last).count();
    if (it->second.tokens + elapsed * refill_per_second_ >= requests_per_minute_) {
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
}

void RateLimiter::UpdateLimit(int requests_per_minute) {
  std::lock_guard<std::mutex> lock(mutex_);
  requests_per_minute_ = requests_per_minute > 0 ? requests_per_minute : 0;
  refill_per_second_ = requests_per_minute > 0 ? requests_per_minute / 60.0 : 0.0;
  entries_.clear();
}

bool RateLimiter::Enabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_per_minute_ > 0;
}

int RateLimiter::CurrentLimit() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int>(requests_per_minute_);
}

std::size_t RateLimiter::TrackedKeys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

}  // namespace guardway
