#pragma once

#include "net/http_client.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace guardway {

struct DispatcherConfig {
  std::string base_url{"https://api.openai.com"};
  // Sent as "Authorization: Bearer <key>" only when non-empty.
  std::string api_key;
  std::chrono::milliseconds timeout{30000};
  std::chrono::milliseconds retry_backoff{400};
  std::string request_id_header{"X-Request-Id"};
  std::string client_id_header{"X-Client-Id"};
};

enum class DispatchResult {
  kSuccess,             // 2xx response
  kNonTransientStatus,  // any other response, passed through unchanged
  kTimeout,             // every attempt ended in a transport failure, the last a timeout
  kNetworkError,        // every attempt ended in a transport failure, the last a network error
};

const char* DispatchResultName(DispatchResult result);

struct DispatchOutcome {
  DispatchResult result{DispatchResult::kNetworkError};
  HttpResponse response;  // valid when HasResponse()
  int attempts{0};
  std::string error;      // transport error message of the last attempt

  bool HasResponse() const {
    return result == DispatchResult::kSuccess || result == DispatchResult::kNonTransientStatus;
  }
};

constexpr int kMaxUpstreamAttempts = 3;

// Forwards sanitized chat completion payloads to the upstream provider.
//
// Up to kMaxUpstreamAttempts attempts are made. Transient statuses (408, 429,
// 500, 502, 503, 504) and transport failures are retried after sleeping
// retry_backoff * attempt; the last attempt's result is returned as is.
// Stateless apart from its configuration, so one instance serves every worker.
class UpstreamDispatcher {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  // `sleeper` defaults to std::this_thread::sleep_for.
  UpstreamDispatcher(DispatcherConfig config, const HttpTransport* transport,
                     Sleeper sleeper = {});

  DispatchOutcome Dispatch(const nlohmann::json& payload, const std::string& request_id,
                           const std::string& client_id,
                           std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

  // GET {base_url}/v1/models, single attempt. Throws HttpError on transport
  // failure.
  HttpResponse ListModels() const;

  static bool IsTransientStatus(int status);

  std::string ChatCompletionsUrl() const { return base_url_ + "/v1/chat/completions"; }
  std::string ModelsUrl() const { return base_url_ + "/v1/models"; }
  const DispatcherConfig& Config() const { return config_; }

 private:
  HttpHeaders AuthHeaders() const;

  DispatcherConfig config_;
  std::string base_url_;  // without trailing '/'
  const HttpTransport* transport_;
  Sleeper sleeper_;
};

}  // namespace guardway
