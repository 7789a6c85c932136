#pragma once

#include <fstream>
#include <mutex>
#include <set>
#include <string>

namespace guardway {

// Append-only JSON-lines record of guardrail decisions.
class AuditLogger {
 public:
  AuditLogger() = default;

  // path: log file path; debug_mode: when true, log the raw normalized prompt
  // instead of its SHA-256 hash.
  explicit AuditLogger(const std::string& path, bool debug_mode = false);

  bool Enabled() const { return stream_.is_open(); }

  // decision is one of "blocked" (injection, request rejected), "flagged"
  // (injection, blocking disabled) or "redacted" (PII removed).
  void LogDecision(const std::string& decision,
                   const std::string& request_id,
                   const std::string& client_id,
                   const std::string& model,
                   const std::set<std::string>& signatures,
                   const std::string& prompt);

  // Hash a string to its SHA-256 hex representation (64 chars).
  static std::string HashContent(const std::string& content);

 private:
  std::ofstream stream_;
  std::mutex mutex_;
  bool debug_mode_{false};
};

}  // namespace guardway
