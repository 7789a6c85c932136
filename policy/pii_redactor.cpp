#include "policy/pii_redactor.h"

#include "policy/delegated_redactor.h"
#include "policy/pattern_redactor.h"
#include "server/logging/logger.h"

#include <chrono>
#include <stdexcept>

namespace guardway {

std::unique_ptr<PiiRedactor> MakePiiRedactor(const DelegatedRedactorConfig& config,
                                             const HttpTransport* transport) {
  if (config.enabled) {
    try {
      auto delegated = std::make_unique<DelegatedRedactor>(
          config.endpoint, transport, std::chrono::milliseconds(config.timeout_ms));
      log::Info("guardrail", "delegated PII redactor enabled", "endpoint=" + config.endpoint);
      return delegated;
    } catch (const std::invalid_argument& ex) {
      log::Warn("guardrail", "delegated PII redactor unavailable, using pattern redactor",
                ex.what());
    }
  }
  return std::make_unique<PatternRedactor>();
}

}  // namespace guardway
