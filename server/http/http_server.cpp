#include "server/http/http_server.h"

#include "gateway/chat_pipeline.h"
#include "gateway/chat_request.h"
#include "server/auth/rate_limiter.h"
#include "server/health/health_checker.h"
#include "server/logging/event_log.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <utility>

#include <openssl/err.h>
#include <openssl/rand.h>
#include <openssl/ssl.h>

using json = nlohmann::json;

namespace guardway {

namespace {

// Per-connection socket read/write timeout.
constexpr int kClientSocketTimeoutSeconds = 60;

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string Trim(const std::string& input) {
  auto start = input.find_first_not_of(" \t");
  if (start == std::string::npos) {
    return "";
  }
  auto end = input.find_last_not_of(" \t\r\n");
  return input.substr(start, end - start + 1);
}

std::string Dump(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

HttpReply JsonReply(int status, const json& body) {
  HttpReply reply;
  reply.status = status;
  reply.body = Dump(body);
  return reply;
}

// Pass-through upstream bodies.
HttpReply JsonReply(int status, const nlohmann::ordered_json& body) {
  HttpReply reply;
  reply.status = status;
  reply.body = body.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
  return reply;
}

long long ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

}  // namespace

std::string HttpRequest::Header(const std::string& name) const {
  auto it = headers.find(ToLower(name));
  return it == headers.end() ? std::string() : it->second;
}

bool ParseRequestHead(const std::string& head, HttpRequest* request) {
  auto first_line_end = head.find("\r\n");
  std::string first_line = head.substr(0, first_line_end);
  auto method_end = first_line.find(' ');
  if (method_end == std::string::npos || method_end == 0) {
    return false;
  }
  auto path_end = first_line.find(' ', method_end + 1);
  if (path_end == std::string::npos || path_end == method_end + 1) {
    return false;
  }
  request->method = first_line.substr(0, method_end);
  std::string target = first_line.substr(method_end + 1, path_end - method_end - 1);
  auto query = target.find('?');
  request->path = query == std::string::npos ? target : target.substr(0, query);

  request->headers.clear();
  if (first_line_end == std::string::npos) {
    return true;
  }
  std::size_t pos = first_line_end + 2;
  while (pos < head.size()) {
    auto end = head.find("\r\n", pos);
    if (end == std::string::npos) {
      end = head.size();
    }
    std::string line = head.substr(pos, end - pos);
    auto colon = line.find(':');
    if (colon != std::string::npos && colon > 0) {
      request->headers[ToLower(Trim(line.substr(0, colon)))] = Trim(line.substr(colon + 1));
    }
    pos = end + 2;
  }
  return true;
}

std::string StatusText(int status) {
  switch (status) {
    case 200: return "OK";
    case 201: return "Created";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 408: return "Request Timeout";
    case 409: return "Conflict";
    case 413: return "Payload Too Large";
    case 422: return "Unprocessable Entity";
    case 429: return "Too Many Requests";
    case 500: return "Internal Server Error";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    case 504: return "Gateway Timeout";
    default: return status < 400 ? "OK" : "Error";
  }
}

std::string GenerateRequestId() {
  unsigned char bytes[16];
  if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
    // Unseeded CSPRNG: derive the id from the clock instead.
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    for (std::size_t i = 0; i < sizeof(bytes); ++i) {
      bytes[i] = static_cast<unsigned char>((now >> ((i % 8) * 8)) ^ (i * 31));
    }
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);  // version 4
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant
  static const char* kHex = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < sizeof(bytes); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    out.push_back(kHex[bytes[i] >> 4]);
    out.push_back(kHex[bytes[i] & 0x0F]);
  }
  return out;
}

HttpServer::HttpServer(Options options, ChatPipeline* pipeline, HealthChecker* health,
                       RateLimiter* limiter, MetricsRegistry* metrics, ObservationSink* events)
    : options_(std::move(options)),
      pipeline_(pipeline),
      health_(health),
      limiter_(limiter),
      metrics_(metrics),
      events_(events) {
  if (options_.workers <= 0) {
    options_.workers = 8;
  }
  const auto& tls = options_.tls;
  if (tls.enabled) {
    if (tls.cert_path.empty() || tls.key_path.empty()) {
      log::Warn("http", "TLS enabled without cert/key; falling back to HTTP");
    } else {
      ssl_ctx_ = SSL_CTX_new(TLS_server_method());
      if (!ssl_ctx_) {
        log::Error("http", "failed to initialize TLS context");
      } else if (SSL_CTX_use_certificate_file(ssl_ctx_, tls.cert_path.c_str(),
                                              SSL_FILETYPE_PEM) <= 0) {
        log::Error("http", "failed to load TLS certificate", "path=" + tls.cert_path);
        SSL_CTX_free(ssl_ctx_);
        ssl_ctx_ = nullptr;
      } else if (SSL_CTX_use_PrivateKey_file(ssl_ctx_, tls.key_path.c_str(),
                                             SSL_FILETYPE_PEM) <= 0) {
        log::Error("http", "failed to load TLS key", "path=" + tls.key_path);
        SSL_CTX_free(ssl_ctx_);
        ssl_ctx_ = nullptr;
      } else {
        tls_enabled_ = true;
        log::Info("http", "TLS enabled", "cert=" + tls.cert_path);
      }
    }
  }
}

HttpServer::~HttpServer() {
  Stop();
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

bool HttpServer::Start() {
  if (running_) {
    return true;
  }
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    log::Error("http", "socket() failed", std::strerror(errno));
    return false;
  }
  int opt = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(options_.port));
  if (::inet_pton(AF_INET, options_.host.c_str(), &addr.sin_addr) != 1) {
    log::Error("http", "invalid listen address", "host=" + options_.host);
    ::close(fd);
    return false;
  }
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    log::Error("http", "bind() failed",
               "port=" + std::to_string(options_.port) + " error=" + std::strerror(errno));
    ::close(fd);
    return false;
  }
  if (::listen(fd, 128) < 0) {
    log::Error("http", "listen() failed", std::strerror(errno));
    ::close(fd);
    return false;
  }
  server_fd_.store(fd);
  running_ = true;
  for (int i = 0; i < options_.workers; ++i) {
    workers_.emplace_back(&HttpServer::WorkerLoop, this);
  }
  accept_thread_ = std::thread(&HttpServer::Run, this);
  return true;
}

void HttpServer::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  // Close the listening socket to unblock the accept() call in Run().
  int fd = server_fd_.exchange(-1);
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
  queue_cv_.notify_all();
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  for (auto& w : workers_) {
    if (w.joinable()) {
      w.join();
    }
  }
  workers_.clear();
  std::lock_guard<std::mutex> lock(queue_mutex_);
  while (!client_queue_.empty()) {
    auto session = std::move(client_queue_.front());
    client_queue_.pop();
    CloseSession(session);
  }
}

void HttpServer::WorkerLoop() {
  while (true) {
    ClientSession session;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] { return !client_queue_.empty() || !running_; });
      if (!running_ && client_queue_.empty()) {
        return;
      }
      session = std::move(client_queue_.front());
      client_queue_.pop();
    }
    if (session.fd >= 0) {
      HandleClient(session);
      CloseSession(session);
    }
  }
}

void HttpServer::Run() {
  int fd = server_fd_.load();
  while (running_) {
    sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_fd = ::accept(fd, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
    if (client_fd < 0) {
      if (errno == EINTR && running_) {
        continue;
      }
      break;  // Socket closed by Stop() or error.
    }
    if (!running_) {
      ::close(client_fd);
      break;
    }
    timeval tv{};
    tv.tv_sec = kClientSocketTimeoutSeconds;
    ::setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    ClientSession session;
    session.fd = client_fd;
    char peer[INET_ADDRSTRLEN] = {0};
    if (::inet_ntop(AF_INET, &client_addr.sin_addr, peer, sizeof(peer))) {
      session.peer = peer;
    }
    if (tls_enabled_) {
      SSL* ssl = SSL_new(ssl_ctx_);
      if (!ssl) {
        ::close(client_fd);
        continue;
      }
      SSL_set_fd(ssl, client_fd);
      if (SSL_accept(ssl) != 1) {
        SSL_free(ssl);
        ::close(client_fd);
        continue;
      }
      session.ssl = ssl;
    }
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      client_queue_.push(std::move(session));
    }
    queue_cv_.notify_one();
  }

  int expected = fd;
  if (server_fd_.compare_exchange_strong(expected, -1)) {
    ::close(fd);
  }
}

void HttpServer::HandleClient(ClientSession& session) {
  struct ConnectionGuard {
    MetricsRegistry* metrics;
    ~ConnectionGuard() {
      if (metrics) {
        metrics->DecrementConnections();
      }
    }
  } guard{metrics_};
  if (metrics_) {
    metrics_->IncrementConnections();
  }

  auto reject = [&](int status, const std::string& message, const std::string& code) {
    HttpReply reply = JsonReply(
        status, MakeErrorBody(message, "invalid_request_error", nullptr, code));
    if (metrics_) {
      metrics_->RecordRequestOutcome(code);
    }
    SendAll(session, SerializeReply(reply, GenerateRequestId()));
  };

  // Phase 1: read until the end-of-headers marker.
  constexpr std::size_t kChunk = 4096;
  std::string request;
  std::size_t header_end_pos = std::string::npos;
  char buffer[kChunk];
  while (header_end_pos == std::string::npos) {
    if (request.size() >= kMaxRequestBytes) {
      reject(413, "Request exceeds the maximum allowed size.", "request_too_large");
      return;
    }
    ssize_t bytes = Receive(session, buffer, sizeof(buffer));
    if (bytes <= 0) {
      return;
    }
    request.append(buffer, static_cast<std::size_t>(bytes));
    header_end_pos = request.find("\r\n\r\n");
  }

  HttpRequest parsed;
  parsed.peer = session.peer;
  if (!ParseRequestHead(request.substr(0, header_end_pos), &parsed)) {
    reject(400, "Malformed HTTP request.", "validation_error");
    return;
  }

  // Phase 2: read the body announced by Content-Length.
  std::size_t content_length = 0;
  std::string cl = parsed.Header("content-length");
  if (!cl.empty()) {
    try {
      content_length = static_cast<std::size_t>(std::stoull(cl));
    } catch (const std::logic_error&) {
      reject(400, "Invalid Content-Length header.", "validation_error");
      return;
    }
  }
  std::size_t body_start = header_end_pos + 4;
  if (content_length > kMaxRequestBytes || body_start + content_length > kMaxRequestBytes) {
    reject(413, "Request exceeds the maximum allowed size.", "request_too_large");
    return;
  }
  std::size_t needed = body_start + content_length;
  while (request.size() < needed) {
    ssize_t bytes = Receive(session, buffer, std::min(sizeof(buffer), needed - request.size()));
    if (bytes <= 0) {
      return;
    }
    request.append(buffer, static_cast<std::size_t>(bytes));
  }
  parsed.body = request.substr(body_start, content_length);

  std::string request_id = parsed.Header(options_.request_id_header);
  if (request_id.empty()) {
    request_id = GenerateRequestId();
    parsed.headers[ToLower(options_.request_id_header)] = request_id;
  }
  HttpReply reply = HandleRequest(parsed);
  SendAll(session, SerializeReply(reply, request_id));
}

HttpReply HttpServer::HandleRequest(const HttpRequest& request) {
  auto start = std::chrono::steady_clock::now();
  std::string request_id = request.Header(options_.request_id_header);
  if (request_id.empty()) {
    request_id = GenerateRequestId();
  }
  std::string client_id = request.Header(options_.client_id_header);
  if (client_id.empty()) {
    client_id = "anonymous";
  }

  HttpReply reply;
  try {
    reply = Route(request, request_id, client_id);
  } catch (const std::exception& ex) {
    log::Error("http", "unhandled error while serving request",
               "request_id=" + request_id + " path=" + request.path + " error=" + ex.what());
    json body = MakeErrorBody("Internal server error.", "server_error", nullptr, "internal_error");
    body["error"]["request_id"] = request_id;
    reply = JsonReply(500, body);
    if (metrics_) {
      metrics_->RecordRequestOutcome("internal_error");
    }
  }
  reply.headers.emplace_back("X-Request-Id", request_id);

  long long latency_ms = ElapsedMs(start);
  if (metrics_) {
    metrics_->RecordLatency(static_cast<double>(latency_ms));
  }
  EmitRequestEvent(request_id, client_id, request, reply.status, latency_ms);
  return reply;
}

HttpReply HttpServer::Route(const HttpRequest& request, const std::string& request_id,
                            const std::string& client_id) {
  const std::string& method = request.method;
  const std::string& path = request.path;

  if (method == "OPTIONS") {
    return Preflight();
  }
  if (method == "GET" && path == "/livez") {
    return JsonReply(200, json{{"status", "ok"}});
  }
  if (method == "GET" && path == "/health") {
    return HandleHealth();
  }
  if (method == "GET" && path == "/metrics") {
    HttpReply reply;
    reply.body = metrics_ ? metrics_->RenderPrometheus() : "";
    reply.content_type = "text/plain; version=0.0.4";
    return reply;
  }
  if (method == "POST" && path == "/v1/chat/completions") {
    return HandleChatCompletions(request, request_id, client_id);
  }

  if (metrics_) {
    metrics_->RecordRequestOutcome("not_found");
  }
  json body = MakeErrorBody("Not found.", "invalid_request_error", nullptr, "not_found");
  body["error"]["request_id"] = request_id;
  return JsonReply(404, body);
}

HttpReply HttpServer::HandleChatCompletions(const HttpRequest& request,
                                            const std::string& request_id,
                                            const std::string& client_id) {
  // Rate limiting runs before any parsing or guardrail work.
  if (limiter_ && limiter_->Enabled()) {
    std::string raw_client = request.Header(options_.client_id_header);
    std::string key = raw_client.empty() ? "ip:" + request.peer : "client:" + raw_client;
    int retry_after = 0;
    if (!limiter_->Allow(key, &retry_after)) {
      log::Info("http", "rate limit exceeded", "key=" + key + " request_id=" + request_id);
      if (metrics_) {
        metrics_->RecordRequestOutcome("rate_limited");
      }
      HttpReply reply = JsonReply(
          429, MakeErrorBody("Rate limit exceeded. Please retry later.", "rate_limit_error",
                             nullptr, "rate_limit_exceeded"));
      reply.headers.emplace_back("Retry-After", std::to_string(retry_after));
      return reply;
    }
  }

  ChatCompletionsRequest chat;
  std::vector<ValidationIssue> issues;
  if (!ParseChatRequest(request.body, &chat, &issues)) {
    if (metrics_) {
      metrics_->RecordRequestOutcome("validation_error");
    }
    json body = MakeErrorBody("Invalid request payload.", "invalid_request_error", nullptr,
                              "validation_error");
    body["error"]["details"] = ValidationDetailsJson(issues);
    body["error"]["request_id"] = request_id;
    return JsonReply(400, body);
  }

  if (!pipeline_) {
    throw std::runtime_error("chat pipeline not configured");
  }
  PipelineResult result = pipeline_->Process(chat, request_id, client_id);
  return JsonReply(result.status_code, result.body);
}

HttpReply HttpServer::HandleHealth() {
  if (!health_) {
    return JsonReply(503, json{{"ok", false}, {"details", "health checker not configured"}});
  }
  HealthStatus status = health_->Check();
  return JsonReply(status.ok ? 200 : 503, ToJson(status));
}

HttpReply HttpServer::Preflight() const {
  HttpReply reply;
  reply.status = 204;
  reply.content_type.clear();
  reply.headers.emplace_back("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
  reply.headers.emplace_back("Access-Control-Allow-Headers",
                             "Content-Type, Authorization, " + options_.request_id_header +
                                 ", " + options_.client_id_header);
  reply.headers.emplace_back("Access-Control-Max-Age", "86400");
  return reply;
}

void HttpServer::EmitRequestEvent(const std::string& request_id, const std::string& client_id,
                                  const HttpRequest& request, int status,
                                  long long latency_ms) {
  if (!events_) {
    return;
  }
  try {
    events_->Emit(
        MakeRequestEvent(request_id, client_id, request.method, request.path, status, latency_ms));
  } catch (const std::exception& ex) {
    log::Warn("http", "request event dropped", "request_id=" + request_id + " error=" + ex.what());
  }
}

std::string HttpServer::SerializeReply(const HttpReply& reply,
                                       const std::string& request_id) const {
  std::string out = "HTTP/1.1 " + std::to_string(reply.status) + " " + StatusText(reply.status) +
                    "\r\n";
  if (!reply.content_type.empty()) {
    out += "Content-Type: " + reply.content_type + "\r\n";
  }
  out += "Access-Control-Allow-Origin: *\r\n";
  bool has_request_id = false;
  for (const auto& [name, value] : reply.headers) {
    if (ToLower(name) == "x-request-id") {
      has_request_id = true;
    }
    out += name + ": " + value + "\r\n";
  }
  if (!has_request_id) {
    out += "X-Request-Id: " + request_id + "\r\n";
  }
  out += "Connection: close\r\n";
  out += "Content-Length: " + std::to_string(reply.body.size()) + "\r\n\r\n";
  return out + reply.body;
}

bool HttpServer::SendAll(ClientSession& session, const std::string& payload) {
  const char* data = payload.c_str();
  std::size_t remaining = payload.size();
  while (remaining > 0) {
    int sent = 0;
    if (session.ssl) {
      sent = SSL_write(session.ssl, data, static_cast<int>(remaining));
      if (sent <= 0) {
        int err = SSL_get_error(session.ssl, sent);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
          continue;
        }
        return false;
      }
    } else {
      sent = static_cast<int>(::send(session.fd, data, remaining, MSG_NOSIGNAL));
      if (sent <= 0) {
        if (errno == EINTR) {
          continue;
        }
        return false;
      }
    }
    data += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

ssize_t HttpServer::Receive(ClientSession& session, char* buffer, std::size_t length) {
  if (session.ssl) {
    while (true) {
      int received = SSL_read(session.ssl, buffer, static_cast<int>(length));
      if (received > 0) {
        return received;
      }
      int err = SSL_get_error(session.ssl, received);
      if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        continue;
      }
      return -1;
    }
  }
  while (true) {
    ssize_t received = ::recv(session.fd, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    return received;
  }
}

void HttpServer::CloseSession(ClientSession& session) {
  if (session.ssl) {
    SSL_shutdown(session.ssl);
    SSL_free(session.ssl);
    session.ssl = nullptr;
  }
  if (session.fd >= 0) {
    ::close(session.fd);
    session.fd = -1;
  }
}

}  // namespace guardway
