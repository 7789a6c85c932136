#pragma once

#include <memory>
#include <string>

namespace guardway {

class HttpTransport;

// Replacement tokens. None of them contain digits or '@', so a later
// detector never re-matches a token inserted by an earlier one.
inline constexpr const char* kRedactedEmail = "[REDACTED_EMAIL]";
inline constexpr const char* kRedactedIp = "[REDACTED_IP]";
inline constexpr const char* kRedactedCreditCard = "[REDACTED_CREDIT_CARD]";
inline constexpr const char* kRedactedDefault = "[REDACTED]";

struct RedactionResult {
  std::string text;
  bool redacted{false};
};

// PiiRedactor is the strategy interface for PII removal. There are two
// implementations: PatternRedactor (local, always available) and
// DelegatedRedactor (external analyzer service).
//
// Redact() may throw; callers that hold a delegated redactor must catch and
// fall back to the pattern path.
//
// Thread safety: Redact() must be safe to call concurrently.
class PiiRedactor {
 public:
  virtual ~PiiRedactor() = default;

  virtual RedactionResult Redact(const std::string& text) const = 0;
  virtual std::string Name() const = 0;
};

struct DelegatedRedactorConfig {
  bool enabled{false};
  std::string endpoint;
  int timeout_ms{2000};
};

// Builds the preferred redactor for the given configuration. When the
// delegated redactor is disabled or cannot be constructed the pattern
// redactor is returned instead.
std::unique_ptr<PiiRedactor> MakePiiRedactor(const DelegatedRedactorConfig& config,
                                             const HttpTransport* transport);

}  // namespace guardway
