#pragma once

#include <functional>
#include <string>

namespace guardway {

struct GatewayConfig {
  struct Server {
    std::string service_name{"guardway"};
    std::string environment{"production"};
    std::string host{"0.0.0.0"};
    int http_port{8000};
    int workers{8};
  } server;

  struct Upstream {
    std::string base_url{"https://api.openai.com"};
    std::string api_key;
    int timeout_seconds{30};
    int retry_backoff_ms{400};
    std::string default_model{"gpt-4o-mini"};
  } upstream;

  int rate_limit_rpm{100};

  struct Guardrails {
    bool block_on_prompt_injection{true};
    bool delegated_enabled{false};
    std::string delegated_endpoint;
    int delegated_timeout_ms{2000};
  } guardrails;

  struct Headers {
    std::string request_id{"X-Request-Id"};
    std::string client_id{"X-Client-Id"};
  } headers;

  struct Logging {
    std::string format{"text"};
    std::string level{"info"};
    std::string events_path;
    std::string audit_log;
    bool audit_debug{false};
  } logging;

  struct Tls {
    bool enabled{false};
    std::string cert_path;
    std::string key_path;
  } tls;
};

// Lookup used for environment overrides; std::getenv in the daemon.
using EnvLookup = std::function<const char*(const char*)>;

// Applies the YAML document in `yaml_text` on top of `config`. Keys that are
// absent keep their current value. Returns false (and logs) when the text is
// not valid YAML or a value has the wrong type; keys read before the error
// keep their new values.
bool ApplyYamlConfig(const std::string& yaml_text, GatewayConfig* config);

// Reads `path` and applies it. A missing file leaves the defaults and
// returns true.
bool LoadConfigFile(const std::string& path, GatewayConfig* config);

// Applies GUARDWAY_* variables. Malformed numbers and booleans are logged and
// ignored.
void ApplyEnvOverrides(const EnvLookup& getenv_fn, GatewayConfig* config);

// Defaults, then the file, then the process environment.
GatewayConfig LoadGatewayConfig(const std::string& path);

}  // namespace guardway
