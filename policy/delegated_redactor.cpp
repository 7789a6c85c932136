#include "policy/delegated_redactor.h"

#include "net/http_client.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;

namespace guardway {

namespace {

const std::vector<std::string>& AnalyzedEntities() {
  static const std::vector<std::string> entities = {"EMAIL_ADDRESS", "IP_ADDRESS", "CREDIT_CARD"};
  return entities;
}

// Byte offset of every code point start, plus text.size() as the final entry.
std::vector<std::size_t> CodePointOffsets(const std::string& text) {
  std::vector<std::size_t> offsets;
  offsets.reserve(text.size() + 1);
  for (std::size_t i = 0; i < text.size(); ++i) {
    if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
      offsets.push_back(i);
    }
  }
  offsets.push_back(text.size());
  return offsets;
}

}  // namespace

const char* SentinelForEntity(const std::string& entity_type) {
  if (entity_type == "EMAIL_ADDRESS") return kRedactedEmail;
  if (entity_type == "IP_ADDRESS") return kRedactedIp;
  if (entity_type == "CREDIT_CARD") return kRedactedCreditCard;
  return kRedactedDefault;
}

std::vector<AnalyzerFinding> ParseAnalyzerResponse(const std::string& body) {
  json j;
  try {
    j = json::parse(body);
  } catch (const json::parse_error& ex) {
    throw std::runtime_error(std::string("analyzer returned invalid JSON: ") + ex.what());
  }
  if (!j.is_array()) {
    throw std::runtime_error("analyzer response is not an array");
  }
  std::vector<AnalyzerFinding> findings;
  findings.reserve(j.size());
  for (const auto& item : j) {
    if (!item.is_object() || !item.contains("entity_type") || !item["entity_type"].is_string() ||
        !item.contains("start") || !item["start"].is_number_unsigned() || !item.contains("end") ||
        !item["end"].is_number_unsigned()) {
      throw std::runtime_error("malformed analyzer finding");
    }
    AnalyzerFinding finding;
    finding.entity_type = item["entity_type"].get<std::string>();
    finding.start = item["start"].get<std::size_t>();
    finding.end = item["end"].get<std::size_t>();
    if (finding.end <= finding.start) {
      throw std::runtime_error("analyzer finding has an empty range");
    }
    findings.push_back(std::move(finding));
  }
  return findings;
}

std::string ApplyAnalyzerFindings(const std::string& text, std::vector<AnalyzerFinding> findings) {
  if (findings.empty()) {
    return text;
  }
  std::sort(findings.begin(), findings.end(),
            [](const AnalyzerFinding& a, const AnalyzerFinding& b) {
              return a.start < b.start || (a.start == b.start && a.end > b.end);
            });
  std::vector<AnalyzerFinding> merged;
  for (auto& finding : findings) {
    if (!merged.empty() && finding.start < merged.back().end) {
      merged.back().end = std::max(merged.back().end, finding.end);
      continue;
    }
    merged.push_back(std::move(finding));
  }

  auto offsets = CodePointOffsets(text);
  const std::size_t code_points = offsets.size() - 1;
  if (merged.back().end > code_points) {
    throw std::out_of_range("analyzer finding beyond end of text");
  }

  std::string out;
  out.reserve(text.size());
  std::size_t emitted = 0;
  for (const auto& finding : merged) {
    std::size_t begin = offsets[finding.start];
    std::size_t end = offsets[finding.end];
    out.append(text, emitted, begin - emitted);
    out.append(SentinelForEntity(finding.entity_type));
    emitted = end;
  }
  out.append(text, emitted, std::string::npos);
  return out;
}

DelegatedRedactor::DelegatedRedactor(std::string endpoint, const HttpTransport* transport,
                                     std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), transport_(transport), timeout_(timeout) {
  if (endpoint_.empty()) {
    throw std::invalid_argument("delegated redactor endpoint is empty");
  }
  if (endpoint_.rfind("http://", 0) != 0 && endpoint_.rfind("https://", 0) != 0) {
    throw std::invalid_argument("delegated redactor endpoint must be http(s): " + endpoint_);
  }
  if (!transport_) {
    throw std::invalid_argument("delegated redactor requires an HTTP transport");
  }
}

RedactionResult DelegatedRedactor::Redact(const std::string& text) const {
  json payload = {{"text", text}, {"language", "en"}, {"entities", AnalyzedEntities()}};
  auto response = transport_->Post(endpoint_, payload.dump(),
                                   {{"Content-Type", "application/json"}}, timeout_);
  if (response.status < 200 || response.status >= 300) {
    throw std::runtime_error("analyzer HTTP error: " + std::to_string(response.status));
  }
  auto findings = ParseAnalyzerResponse(response.body);
  if (findings.empty()) {
    return {text, false};
  }
  RedactionResult result;
  result.text = ApplyAnalyzerFindings(text, std::move(findings));
  result.redacted = result.text != text;
  return result;
}

}  // namespace guardway
