#pragma once

#include "gateway/chat_request.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <set>
#include <string>

namespace guardway {

class AuditLogger;
class Guardrail;
class MetricsRegistry;
class ObservationSink;
class TokenEstimator;
class UpstreamDispatcher;

enum class PipelineState {
  kValidated,
  kScanning,
  kBlocked,
  kRedacting,
  kEstimating,
  kDispatching,
  kUpstreamUnreachable,
  kUpstreamInvalidResponse,
  kCompleted,
};

const char* PipelineStateName(PipelineState state);

// {"error": {"message", "type", "param", "code"}}; callers add extra members
// under "error".
nlohmann::json MakeErrorBody(const std::string& message, const std::string& type,
                             const nlohmann::json& param, const std::string& code);

struct PipelineResult {
  int status_code{200};
  // Upstream bodies keep their member order.
  nlohmann::ordered_json body;
  // Terminal state: kBlocked, kUpstreamUnreachable, kUpstreamInvalidResponse
  // or kCompleted.
  PipelineState state{PipelineState::kValidated};
  std::set<std::string> signatures;
  bool redacted{false};
  int upstream_attempts{0};
};

struct PipelineOptions {
  bool block_on_prompt_injection{true};
  std::string default_model{"gpt-4o-mini"};
};

// Runs one validated chat completion request through the gateway:
// scan, block or redact, estimate prompt tokens, dispatch upstream, estimate
// completion tokens. Every collaborator is borrowed and must outlive the
// pipeline; the sink, audit logger and metrics registry are optional.
class ChatPipeline {
 public:
  ChatPipeline(PipelineOptions options, const Guardrail* guardrail,
               const UpstreamDispatcher* dispatcher, const TokenEstimator* estimator,
               ObservationSink* sink, AuditLogger* audit = nullptr,
               MetricsRegistry* metrics = nullptr);

  PipelineResult Process(const ChatCompletionsRequest& request, const std::string& request_id,
                         const std::string& client_id) const;

 private:
  void EmitBilling(const std::string& request_id, const std::string& client_id,
                   const std::string& model, int prompt_tokens,
                   std::optional<int> completion_tokens) const;

  PipelineOptions options_;
  const Guardrail* guardrail_;
  const UpstreamDispatcher* dispatcher_;
  const TokenEstimator* estimator_;
  ObservationSink* sink_;
  AuditLogger* audit_;
  MetricsRegistry* metrics_;
};

}  // namespace guardway
