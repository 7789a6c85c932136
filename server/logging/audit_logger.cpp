#include "server/logging/audit_logger.h"

#include <nlohmann/json.hpp>
#include <openssl/sha.h>

#include <chrono>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace guardway {

AuditLogger::AuditLogger(const std::string& path, bool debug_mode)
    : debug_mode_(debug_mode) {
  if (!path.empty()) {
    stream_.open(path, std::ios::app);
  }
}

std::string AuditLogger::HashContent(const std::string& content) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(content.data()), content.size(), hash);
  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
    hex << std::setw(2) << static_cast<int>(hash[i]);
  }
  return hex.str();
}

void AuditLogger::LogDecision(const std::string& decision,
                              const std::string& request_id,
                              const std::string& client_id,
                              const std::string& model,
                              const std::set<std::string>& signatures,
                              const std::string& prompt) {
  if (!Enabled()) {
    return;
  }
  auto now = std::chrono::system_clock::now();
  auto ts = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
  json j;
  j["timestamp"] = ts;
  j["decision"] = decision;
  j["request_id"] = request_id;
  j["client_id"] = client_id;
  j["model"] = model;
  j["signatures"] = signatures;
  if (debug_mode_) {
    j["prompt"] = prompt;
  } else {
    // Never write the raw prompt to disk outside debug mode.
    j["prompt_sha256"] = HashContent(prompt);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  stream_ << j.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
  stream_.flush();
}

}  // namespace guardway
