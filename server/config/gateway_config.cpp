#include "server/config/gateway_config.h"

#include "server/logging/logger.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace guardway {

namespace {

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string Trim(const std::string& input) {
  auto start = input.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  auto end = input.find_last_not_of(" \t\r\n");
  return input.substr(start, end - start + 1);
}

bool ParseBoolText(const std::string& text, bool* out) {
  auto lowered = ToLower(Trim(text));
  if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
    *out = true;
    return true;
  }
  if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
    *out = false;
    return true;
  }
  return false;
}

bool ParseIntText(const std::string& text, int* out) {
  auto trimmed = Trim(text);
  if (trimmed.empty()) {
    return false;
  }
  try {
    std::size_t used = 0;
    int value = std::stoi(trimmed, &used);
    if (used != trimmed.size()) {
      return false;
    }
    *out = value;
    return true;
  } catch (const std::logic_error&) {
    return false;
  }
}

void OverrideString(const EnvLookup& getenv_fn, const char* name, std::string* field) {
  if (const char* value = getenv_fn(name)) {
    *field = value;
  }
}

void OverrideInt(const EnvLookup& getenv_fn, const char* name, int* field) {
  if (const char* value = getenv_fn(name)) {
    if (!ParseIntText(value, field)) {
      log::Warn("config", "ignoring malformed integer override",
                std::string(name) + "=" + value);
    }
  }
}

void OverrideBool(const EnvLookup& getenv_fn, const char* name, bool* field) {
  if (const char* value = getenv_fn(name)) {
    if (!ParseBoolText(value, field)) {
      log::Warn("config", "ignoring malformed boolean override",
                std::string(name) + "=" + value);
    }
  }
}

}  // namespace

bool ApplyYamlConfig(const std::string& yaml_text, GatewayConfig* config) {
  try {
    YAML::Node root = YAML::Load(yaml_text);
    if (!root || root.IsNull()) {
      return true;
    }

    if (auto server = root["server"]) {
      if (server["service_name"]) config->server.service_name = server["service_name"].as<std::string>();
      if (server["environment"]) config->server.environment = server["environment"].as<std::string>();
      if (server["host"]) config->server.host = server["host"].as<std::string>();
      if (server["http_port"]) config->server.http_port = server["http_port"].as<int>();
      if (server["workers"]) config->server.workers = server["workers"].as<int>();
    }

    if (auto upstream = root["upstream"]) {
      if (upstream["base_url"]) config->upstream.base_url = upstream["base_url"].as<std::string>();
      if (upstream["api_key"]) config->upstream.api_key = upstream["api_key"].as<std::string>();
      if (upstream["timeout_seconds"]) config->upstream.timeout_seconds = upstream["timeout_seconds"].as<int>();
      if (upstream["retry_backoff_ms"]) config->upstream.retry_backoff_ms = upstream["retry_backoff_ms"].as<int>();
      if (upstream["default_model"]) config->upstream.default_model = upstream["default_model"].as<std::string>();
    }

    if (root["rate_limit"] && root["rate_limit"]["requests_per_minute"]) {
      config->rate_limit_rpm = root["rate_limit"]["requests_per_minute"].as<int>();
    }

    if (auto guardrails = root["guardrails"]) {
      if (guardrails["block_on_prompt_injection"]) {
        config->guardrails.block_on_prompt_injection = guardrails["block_on_prompt_injection"].as<bool>();
      }
      if (auto delegated = guardrails["delegated_redactor"]) {
        if (delegated["enabled"]) config->guardrails.delegated_enabled = delegated["enabled"].as<bool>();
        if (delegated["endpoint"]) config->guardrails.delegated_endpoint = delegated["endpoint"].as<std::string>();
        if (delegated["timeout_ms"]) config->guardrails.delegated_timeout_ms = delegated["timeout_ms"].as<int>();
      }
    }

    if (auto headers = root["headers"]) {
      if (headers["request_id"]) config->headers.request_id = headers["request_id"].as<std::string>();
      if (headers["client_id"]) config->headers.client_id = headers["client_id"].as<std::string>();
    }

    if (auto logging = root["logging"]) {
      if (logging["format"]) config->logging.format = ToLower(logging["format"].as<std::string>());
      if (logging["level"]) config->logging.level = ToLower(logging["level"].as<std::string>());
      if (logging["events_path"]) config->logging.events_path = logging["events_path"].as<std::string>();
      if (logging["audit_log"]) config->logging.audit_log = logging["audit_log"].as<std::string>();
      if (logging["audit_debug"]) config->logging.audit_debug = logging["audit_debug"].as<bool>();
    }

    if (auto tls = root["tls"]) {
      if (tls["enabled"]) config->tls.enabled = tls["enabled"].as<bool>();
      if (tls["cert_path"]) config->tls.cert_path = tls["cert_path"].as<std::string>();
      if (tls["key_path"]) config->tls.key_path = tls["key_path"].as<std::string>();
    }
  } catch (const YAML::Exception& e) {
    log::Error("config", "error parsing configuration", e.what());
    return false;
  }
  return true;
}

bool LoadConfigFile(const std::string& path, GatewayConfig* config) {
  if (!std::filesystem::exists(path)) {
    log::Info("config", "config file not found, using defaults", "path=" + path);
    return true;
  }
  std::ifstream in(path);
  if (!in.good()) {
    log::Error("config", "cannot read config file", "path=" + path);
    return false;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return ApplyYamlConfig(buffer.str(), config);
}

void ApplyEnvOverrides(const EnvLookup& getenv_fn, GatewayConfig* config) {
  OverrideString(getenv_fn, "GUARDWAY_SERVICE_NAME", &config->server.service_name);
  OverrideString(getenv_fn, "GUARDWAY_ENVIRONMENT", &config->server.environment);
  OverrideString(getenv_fn, "GUARDWAY_HOST", &config->server.host);
  OverrideInt(getenv_fn, "GUARDWAY_PORT", &config->server.http_port);
  OverrideInt(getenv_fn, "GUARDWAY_HTTP_WORKERS", &config->server.workers);

  OverrideString(getenv_fn, "GUARDWAY_UPSTREAM_BASE_URL", &config->upstream.base_url);
  OverrideString(getenv_fn, "GUARDWAY_UPSTREAM_API_KEY", &config->upstream.api_key);
  OverrideInt(getenv_fn, "GUARDWAY_UPSTREAM_TIMEOUT_SECONDS", &config->upstream.timeout_seconds);
  OverrideInt(getenv_fn, "GUARDWAY_UPSTREAM_RETRY_BACKOFF_MS", &config->upstream.retry_backoff_ms);
  OverrideString(getenv_fn, "GUARDWAY_UPSTREAM_MODEL_DEFAULT", &config->upstream.default_model);

  OverrideInt(getenv_fn, "GUARDWAY_RATE_LIMIT_RPM", &config->rate_limit_rpm);

  OverrideBool(getenv_fn, "GUARDWAY_BLOCK_ON_PROMPT_INJECTION",
               &config->guardrails.block_on_prompt_injection);
  OverrideBool(getenv_fn, "GUARDWAY_DELEGATED_REDACTOR_ENABLED",
               &config->guardrails.delegated_enabled);
  OverrideString(getenv_fn, "GUARDWAY_DELEGATED_REDACTOR_ENDPOINT",
                 &config->guardrails.delegated_endpoint);

  OverrideString(getenv_fn, "GUARDWAY_REQUEST_ID_HEADER", &config->headers.request_id);
  OverrideString(getenv_fn, "GUARDWAY_CLIENT_ID_HEADER", &config->headers.client_id);

  if (const char* format = getenv_fn("GUARDWAY_LOG_FORMAT")) {
    config->logging.format = ToLower(format);
  }
  if (const char* level = getenv_fn("GUARDWAY_LOG_LEVEL")) {
    config->logging.level = ToLower(level);
  }
  OverrideString(getenv_fn, "GUARDWAY_EVENTS_PATH", &config->logging.events_path);
  OverrideString(getenv_fn, "GUARDWAY_AUDIT_LOG", &config->logging.audit_log);
  OverrideBool(getenv_fn, "GUARDWAY_AUDIT_DEBUG", &config->logging.audit_debug);

  OverrideBool(getenv_fn, "GUARDWAY_TLS_ENABLED", &config->tls.enabled);
  OverrideString(getenv_fn, "GUARDWAY_TLS_CERT_PATH", &config->tls.cert_path);
  OverrideString(getenv_fn, "GUARDWAY_TLS_KEY_PATH", &config->tls.key_path);
}

GatewayConfig LoadGatewayConfig(const std::string& path) {
  GatewayConfig config;
  if (!LoadConfigFile(path, &config)) {
    log::Warn("config", "configuration file rejected, remaining keys use defaults", "path=" + path);
  }
  ApplyEnvOverrides([](const char* name) { return std::getenv(name); }, &config);
  return config;
}

}  // namespace guardway
