#pragma once

#include "policy/pattern_redactor.h"
#include "policy/pii_redactor.h"

#include <memory>
#include <set>
#include <string>

namespace guardway {

class MetricsRegistry;

struct GuardrailResult {
  std::string redacted_text;
  bool was_redacted{false};
  bool injection_detected{false};
  std::set<std::string> injection_signatures;
};

// Guardrail runs injection scanning and PII redaction over one text
// fragment. The preferred redactor may be the delegated one; when it throws,
// the pattern redactor is used for that fragment instead, so redaction is
// never skipped.
//
// Immutable after construction and safe to share between workers.
class Guardrail {
 public:
  Guardrail();
  explicit Guardrail(std::unique_ptr<PiiRedactor> preferred, MetricsRegistry* metrics = nullptr);

  GuardrailResult Run(const std::string& text) const;

  // Redaction only, with the same fallback as Run().
  RedactionResult Redact(const std::string& text) const;

  // Name of the preferred redactor ("pattern" or "delegated").
  std::string RedactorName() const;

 private:
  std::unique_ptr<PiiRedactor> preferred_;
  PatternRedactor fallback_;
  MetricsRegistry* metrics_{nullptr};
};

}  // namespace guardway
