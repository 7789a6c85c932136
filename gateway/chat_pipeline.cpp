#include "gateway/chat_pipeline.h"

#include "gateway/redaction.h"
#include "gateway/upstream_dispatcher.h"
#include "model/tokenizer/token_estimator.h"
#include "server/logging/audit_logger.h"
#include "server/logging/event_log.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"
#include "server/policy/guardrail.h"

#include <stdexcept>

using json = nlohmann::json;

namespace guardway {

namespace {

std::string JoinSignatures(const std::set<std::string>& signatures) {
  std::string out;
  for (const auto& s : signatures) {
    if (!out.empty()) out += ",";
    out += s;
  }
  return out;
}

// choices[0].message.content when it is a string, empty otherwise.
std::string CompletionText(const nlohmann::ordered_json& body) {
  if (!body.is_object()) return {};
  auto choices = body.find("choices");
  if (choices == body.end() || !choices->is_array() || choices->empty()) return {};
  const auto& first = (*choices)[0];
  if (!first.is_object()) return {};
  auto message = first.find("message");
  if (message == first.end() || !message->is_object()) return {};
  auto content = message->find("content");
  if (content == message->end() || !content->is_string()) return {};
  return content->get<std::string>();
}

}  // namespace

const char* PipelineStateName(PipelineState state) {
  switch (state) {
    case PipelineState::kValidated:
      return "validated";
    case PipelineState::kScanning:
      return "scanning";
    case PipelineState::kBlocked:
      return "blocked";
    case PipelineState::kRedacting:
      return "redacting";
    case PipelineState::kEstimating:
      return "estimating";
    case PipelineState::kDispatching:
      return "dispatching";
    case PipelineState::kUpstreamUnreachable:
      return "upstream_unreachable";
    case PipelineState::kUpstreamInvalidResponse:
      return "invalid_upstream_response";
    case PipelineState::kCompleted:
      return "completed";
  }
  return "unknown";
}

json MakeErrorBody(const std::string& message, const std::string& type, const json& param,
                   const std::string& code) {
  json error;
  error["message"] = message;
  error["type"] = type;
  error["param"] = param;
  error["code"] = code;
  return json{{"error", error}};
}

ChatPipeline::ChatPipeline(PipelineOptions options, const Guardrail* guardrail,
                           const UpstreamDispatcher* dispatcher,
                           const TokenEstimator* estimator, ObservationSink* sink,
                           AuditLogger* audit, MetricsRegistry* metrics)
    : options_(std::move(options)),
      guardrail_(guardrail),
      dispatcher_(dispatcher),
      estimator_(estimator),
      sink_(sink),
      audit_(audit),
      metrics_(metrics) {
  if (!guardrail_ || !dispatcher_ || !estimator_) {
    throw std::invalid_argument("ChatPipeline requires a guardrail, dispatcher and estimator");
  }
}

void ChatPipeline::EmitBilling(const std::string& request_id, const std::string& client_id,
                               const std::string& model, int prompt_tokens,
                               std::optional<int> completion_tokens) const {
  if (!sink_) {
    return;
  }
  try {
    sink_->Emit(MakeBillingEvent(request_id, client_id, model, prompt_tokens, completion_tokens));
  } catch (const std::exception& ex) {
    log::Warn("pipeline", "billing event dropped",
              "request_id=" + request_id + " error=" + ex.what());
  }
}

PipelineResult ChatPipeline::Process(const ChatCompletionsRequest& request,
                                     const std::string& request_id,
                                     const std::string& client_id) const {
  PipelineResult result;
  result.state = PipelineState::kScanning;

  const std::string joined = NormalizeMessagesToText(ExtractMessageTexts(request));
  GuardrailResult scan = guardrail_->Run(joined);
  result.signatures = scan.injection_signatures;
  if (metrics_) {
    for (const auto& sig : scan.injection_signatures) {
      metrics_->RecordInjection(sig);
    }
  }

  if (scan.injection_detected) {
    const std::string extra = "request_id=" + request_id + " client_id=" + client_id +
                              " signatures=" + JoinSignatures(scan.injection_signatures);
    if (options_.block_on_prompt_injection) {
      log::Info("pipeline", "request blocked: prompt injection detected", extra);
      if (audit_) {
        audit_->LogDecision("blocked", request_id, client_id, request.model,
                            scan.injection_signatures, joined);
      }
      json body = MakeErrorBody("Prompt injection detected. Request blocked by security policy.",
                                "invalid_request_error", "messages", "prompt_injection_detected");
      body["error"]["signatures"] = scan.injection_signatures;
      body["error"]["request_id"] = request_id;
      result.status_code = 400;
      result.body = std::move(body);
      result.state = PipelineState::kBlocked;
      if (metrics_) metrics_->RecordRequestOutcome("blocked");
      return result;
    }
    log::Warn("pipeline", "prompt injection detected, blocking disabled", extra);
    if (audit_) {
      audit_->LogDecision("flagged", request_id, client_id, request.model,
                          scan.injection_signatures, joined);
    }
  }

  result.state = PipelineState::kRedacting;
  bool redacted = false;
  ChatCompletionsRequest sanitized = RedactRequest(request, *guardrail_, &redacted);
  result.redacted = redacted;
  if (redacted) {
    log::Debug("pipeline", "PII redacted", "request_id=" + request_id);
    if (metrics_) metrics_->RecordRedaction();
    if (audit_) {
      audit_->LogDecision("redacted", request_id, client_id, request.model, {}, joined);
    }
  }
  if (sanitized.model.empty()) {
    sanitized.model = options_.default_model;
  }

  result.state = PipelineState::kEstimating;
  const std::string prompt_text = NormalizeMessagesToText(ExtractMessageTexts(sanitized));
  const int prompt_tokens = estimator_->Estimate(sanitized.model, prompt_text);
  EmitBilling(request_id, client_id, sanitized.model, prompt_tokens, std::nullopt);

  result.state = PipelineState::kDispatching;
  DispatchOutcome outcome = dispatcher_->Dispatch(ToJson(sanitized), request_id, client_id);
  result.upstream_attempts = outcome.attempts;
  if (metrics_) metrics_->RecordUpstreamAttempts(outcome.attempts);

  if (!outcome.HasResponse()) {
    log::Error("pipeline", "upstream unreachable",
               "request_id=" + request_id + " result=" + DispatchResultName(outcome.result) +
                   " attempts=" + std::to_string(outcome.attempts) + " error=" + outcome.error);
    json body = MakeErrorBody("Upstream provider request failed.", "upstream_error", nullptr,
                              "upstream_unreachable");
    body["error"]["details"] = outcome.error;
    body["error"]["request_id"] = request_id;
    result.status_code = 502;
    result.body = std::move(body);
    result.state = PipelineState::kUpstreamUnreachable;
    if (metrics_) {
      metrics_->RecordUpstreamFailure(DispatchResultName(outcome.result));
      metrics_->RecordRequestOutcome("upstream_unreachable");
    }
    return result;
  }

  auto data = nlohmann::ordered_json::parse(outcome.response.body, nullptr, false);
  if (data.is_discarded()) {
    log::Error("pipeline", "upstream returned non-JSON response",
               "request_id=" + request_id +
                   " status=" + std::to_string(outcome.response.status));
    json body = MakeErrorBody("Upstream returned non-JSON response.", "upstream_error", nullptr,
                              "invalid_upstream_response");
    body["error"]["status_code"] = outcome.response.status;
    body["error"]["request_id"] = request_id;
    result.status_code = 502;
    result.body = std::move(body);
    result.state = PipelineState::kUpstreamInvalidResponse;
    if (metrics_) {
      metrics_->RecordUpstreamFailure("invalid_response");
      metrics_->RecordRequestOutcome("invalid_upstream_response");
    }
    return result;
  }

  int completion_tokens = 0;
  const std::string completion = CompletionText(data);
  if (!completion.empty()) {
    completion_tokens = estimator_->Estimate(sanitized.model, completion);
    EmitBilling(request_id, client_id, sanitized.model, prompt_tokens, completion_tokens);
  }
  if (metrics_) {
    metrics_->RecordTokenEstimates(prompt_tokens, completion_tokens);
    metrics_->RecordRequestOutcome("completed");
  }

  result.status_code = outcome.response.status;
  result.body = std::move(data);
  result.state = PipelineState::kCompleted;
  return result;
}

}  // namespace guardway
