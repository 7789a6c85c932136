#include "server/policy/guardrail.h"

#include "policy/injection_scanner.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <exception>

namespace guardway {

Guardrail::Guardrail() : preferred_(std::make_unique<PatternRedactor>()) {}

Guardrail::Guardrail(std::unique_ptr<PiiRedactor> preferred, MetricsRegistry* metrics)
    : preferred_(std::move(preferred)), metrics_(metrics) {
  if (!preferred_) {
    preferred_ = std::make_unique<PatternRedactor>();
  }
}

std::string Guardrail::RedactorName() const { return preferred_->Name(); }

RedactionResult Guardrail::Redact(const std::string& text) const {
  try {
    return preferred_->Redact(text);
  } catch (const std::exception& ex) {
    log::Warn("guardrail", "preferred redactor failed, falling back to pattern redactor",
              "redactor=" + preferred_->Name() + " error=" + ex.what());
    if (metrics_) {
      metrics_->RecordRedactorFallback();
    }
  }
  return fallback_.Redact(text);
}

GuardrailResult Guardrail::Run(const std::string& text) const {
  GuardrailResult result;
  result.injection_signatures = DetectInjection(text);
  result.injection_detected = !result.injection_signatures.empty();
  auto redaction = Redact(text);
  result.redacted_text = std::move(redaction.text);
  result.was_redacted = redaction.redacted;
  return result;
}

}  // namespace guardway
