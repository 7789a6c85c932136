#pragma once

#include "policy/pii_redactor.h"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace guardway {

class HttpTransport;

// One entity reported by the analyzer. Offsets are Unicode code points into
// the analyzed text, end exclusive.
struct AnalyzerFinding {
  std::string entity_type;
  std::size_t start{0};
  std::size_t end{0};
};

// Parses an analyzer response: a JSON array of
// {"entity_type", "start", "end", "score"} objects. Throws on anything else.
std::vector<AnalyzerFinding> ParseAnalyzerResponse(const std::string& body);

// Replaces every finding (overlaps merged) with the token for its entity
// type. Throws std::out_of_range when an offset falls outside the text.
std::string ApplyAnalyzerFindings(const std::string& text, std::vector<AnalyzerFinding> findings);

// Sentinel used for a given analyzer entity type.
const char* SentinelForEntity(const std::string& entity_type);

// PII redaction delegated to a Presidio-analyzer compatible HTTP service:
//   POST <endpoint> {"text": ..., "language": "en", "entities": [...]}
// Every failure (transport, status, body) surfaces as an exception; the
// guardrail engine owns the fallback.
class DelegatedRedactor : public PiiRedactor {
 public:
  // Throws std::invalid_argument when the endpoint is empty or not http(s),
  // or when no transport is supplied.
  DelegatedRedactor(std::string endpoint, const HttpTransport* transport,
                    std::chrono::milliseconds timeout);

  RedactionResult Redact(const std::string& text) const override;
  std::string Name() const override { return "delegated"; }
  const std::string& Endpoint() const { return endpoint_; }

 private:
  std::string endpoint_;
  const HttpTransport* transport_;
  std::chrono::milliseconds timeout_;
};

}  // namespace guardway
