#include "gateway/chat_pipeline.h"
#include "gateway/upstream_dispatcher.h"
#include "model/tokenizer/token_estimator.h"
#include "net/http_client.h"
#include "policy/pii_redactor.h"
#include "server/auth/rate_limiter.h"
#include "server/config/gateway_config.h"
#include "server/health/health_checker.h"
#include "server/http/http_server.h"
#include "server/logging/audit_logger.h"
#include "server/logging/event_log.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"
#include "server/policy/guardrail.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

static std::atomic<bool> g_running{true};

void SignalHandler(int) { g_running = false; }

int main(int argc, char** argv) {
  std::string config_path = "config/guardway.yaml";
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "usage: guardwayd [--config <path>]" << std::endl;
      return 0;
    }
  }

  guardway::GatewayConfig config = guardway::LoadGatewayConfig(config_path);

  guardway::log::SetJsonMode(config.logging.format == "json");
  guardway::log::Level level = guardway::log::Level::INFO;
  if (guardway::log::ParseLevel(config.logging.level, &level)) {
    guardway::log::SetMinLevel(level);
  } else {
    guardway::log::Warn("server", "unknown log level, using info", "level=" + config.logging.level);
  }

  auto& metrics = guardway::GlobalMetrics();
  metrics.SetService(config.server.service_name);

  // One client (and one TLS context) for every outbound call.
  guardway::HttpClient http_client;
  if (!http_client.TlsReady()) {
    guardway::log::Warn("server", "TLS client context unavailable; https upstreams will fail");
  }

  guardway::DelegatedRedactorConfig redactor_config;
  redactor_config.enabled = config.guardrails.delegated_enabled;
  redactor_config.endpoint = config.guardrails.delegated_endpoint;
  redactor_config.timeout_ms = config.guardrails.delegated_timeout_ms;
  guardway::Guardrail guardrail(guardway::MakePiiRedactor(redactor_config, &http_client), &metrics);

  guardway::DispatcherConfig dispatcher_config;
  dispatcher_config.base_url = config.upstream.base_url;
  dispatcher_config.api_key = config.upstream.api_key;
  dispatcher_config.timeout = std::chrono::seconds(config.upstream.timeout_seconds);
  dispatcher_config.retry_backoff = std::chrono::milliseconds(config.upstream.retry_backoff_ms);
  dispatcher_config.request_id_header = config.headers.request_id;
  dispatcher_config.client_id_header = config.headers.client_id;
  guardway::UpstreamDispatcher dispatcher(dispatcher_config, &http_client);

  std::unique_ptr<guardway::EventLog> events;
  if (!config.logging.events_path.empty()) {
    try {
      events = std::make_unique<guardway::EventLog>(config.logging.events_path);
    } catch (const std::runtime_error& ex) {
      guardway::log::Error("server", "cannot open events file, writing events to stdout",
                           ex.what());
    }
  }
  if (!events) {
    events = std::make_unique<guardway::EventLog>(&std::cout);
  }

  guardway::AuditLogger audit_logger(config.logging.audit_log, config.logging.audit_debug);
  if (!config.logging.audit_log.empty() && !audit_logger.Enabled()) {
    guardway::log::Error("server", "cannot open audit log", "path=" + config.logging.audit_log);
  }

  guardway::HeuristicTokenEstimator estimator;
  guardway::PipelineOptions pipeline_options;
  pipeline_options.block_on_prompt_injection = config.guardrails.block_on_prompt_injection;
  pipeline_options.default_model = config.upstream.default_model;
  guardway::ChatPipeline pipeline(pipeline_options, &guardrail, &dispatcher, &estimator,
                                  events.get(),
                                  audit_logger.Enabled() ? &audit_logger : nullptr, &metrics);

  guardway::RateLimiter rate_limiter(config.rate_limit_rpm);
  guardway::HealthChecker health(&dispatcher, &rate_limiter);

  guardway::HttpServer::Options server_options;
  server_options.host = config.server.host;
  server_options.port = config.server.http_port;
  server_options.workers = config.server.workers;
  server_options.request_id_header = config.headers.request_id;
  server_options.client_id_header = config.headers.client_id;
  server_options.tls.enabled = config.tls.enabled;
  server_options.tls.cert_path = config.tls.cert_path;
  server_options.tls.key_path = config.tls.key_path;
  guardway::HttpServer server(server_options, &pipeline, &health, &rate_limiter, &metrics,
                              events.get());

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);
  std::signal(SIGPIPE, SIG_IGN);

  if (!server.Start()) {
    guardway::log::Error("server", "failed to start HTTP server");
    return 1;
  }
  guardway::log::Info(
      "server", "guardway listening",
      "service=" + config.server.service_name + " environment=" + config.server.environment +
          " address=" + config.server.host + ":" + std::to_string(config.server.http_port) +
          (server.TlsEnabled() ? " tls=on" : " tls=off") + " redactor=" +
          guardrail.RedactorName() + " upstream=" + config.upstream.base_url +
          " rate_limit_rpm=" + std::to_string(config.rate_limit_rpm));

  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  server.Stop();
  events->Stop();
  guardway::log::Info("server", "guardway shutting down");
  return 0;
}
