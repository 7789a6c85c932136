#include "gateway/upstream_dispatcher.h"

#include "server/logging/logger.h"

#include <stdexcept>
#include <thread>

namespace guardway {

const char* DispatchResultName(DispatchResult result) {
  switch (result) {
    case DispatchResult::kSuccess:
      return "success";
    case DispatchResult::kNonTransientStatus:
      return "non_transient_status";
    case DispatchResult::kTimeout:
      return "timeout";
    case DispatchResult::kNetworkError:
      return "network_error";
  }
  return "network_error";
}

UpstreamDispatcher::UpstreamDispatcher(DispatcherConfig config, const HttpTransport* transport,
                                       Sleeper sleeper)
    : config_(std::move(config)), transport_(transport), sleeper_(std::move(sleeper)) {
  if (!transport_) {
    throw std::invalid_argument("UpstreamDispatcher requires an HTTP transport");
  }
  base_url_ = config_.base_url;
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

bool UpstreamDispatcher::IsTransientStatus(int status) {
  switch (status) {
    case 408:
    case 429:
    case 500:
    case 502:
    case 503:
    case 504:
      return true;
    default:
      return false;
  }
}

HttpHeaders UpstreamDispatcher::AuthHeaders() const {
  HttpHeaders headers;
  if (!config_.api_key.empty()) {
    headers["Authorization"] = "Bearer " + config_.api_key;
  }
  return headers;
}

DispatchOutcome UpstreamDispatcher::Dispatch(
    const nlohmann::json& payload, const std::string& request_id, const std::string& client_id,
    std::optional<std::chrono::milliseconds> timeout) const {
  const std::string url = ChatCompletionsUrl();
  const std::string body = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  HttpHeaders headers = AuthHeaders();
  headers["Content-Type"] = "application/json";
  headers[config_.request_id_header] = request_id;
  headers[config_.client_id_header] = client_id;
  const auto attempt_timeout = timeout.value_or(config_.timeout);

  DispatchOutcome outcome;
  for (int attempt = 1; attempt <= kMaxUpstreamAttempts; ++attempt) {
    outcome.attempts = attempt;
    const bool last = attempt == kMaxUpstreamAttempts;
    try {
      outcome.response = transport_->Post(url, body, headers, attempt_timeout);
      outcome.error.clear();
      if (IsTransientStatus(outcome.response.status) && !last) {
        log::Warn("upstream", "transient upstream status, retrying",
                  "request_id=" + request_id + " status=" +
                      std::to_string(outcome.response.status) +
                      " attempt=" + std::to_string(attempt));
        sleeper_(config_.retry_backoff * attempt);
        continue;
      }
      bool ok = outcome.response.status >= 200 && outcome.response.status < 300;
      outcome.result = ok ? DispatchResult::kSuccess : DispatchResult::kNonTransientStatus;
      return outcome;
    } catch (const HttpTimeoutError& ex) {
      outcome.result = DispatchResult::kTimeout;
      outcome.error = ex.what();
    } catch (const HttpError& ex) {
      outcome.result = DispatchResult::kNetworkError;
      outcome.error = ex.what();
    }
    outcome.response = HttpResponse{};
    log::Warn("upstream", "upstream request failed",
              "request_id=" + request_id + " attempt=" + std::to_string(attempt) +
                  " error=" + outcome.error);
    if (!last) {
      sleeper_(config_.retry_backoff * attempt);
    }
  }
  return outcome;
}

HttpResponse UpstreamDispatcher::ListModels() const {
  return transport_->Get(ModelsUrl(), AuthHeaders(), config_.timeout);
}

}  // namespace guardway
