#pragma once

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

#include <openssl/ssl.h>

namespace guardway {

class ChatPipeline;
class HealthChecker;
class MetricsRegistry;
class ObservationSink;
class RateLimiter;

// Parsed inbound request. Header names are lower-cased.
struct HttpRequest {
  std::string method;
  std::string path;  // without query string
  std::map<std::string, std::string> headers;
  std::string body;
  std::string peer;  // remote IP address

  // Trimmed value of header `name` (any case), or empty.
  std::string Header(const std::string& name) const;
};

struct HttpReply {
  int status{200};
  std::string body;
  std::string content_type{"application/json"};
  std::vector<std::pair<std::string, std::string>> headers;
};

// Parses the request line and header block (everything before the blank
// line). Returns false on a malformed request line.
bool ParseRequestHead(const std::string& head, HttpRequest* request);

std::string StatusText(int status);

// Random RFC 4122 version 4 UUID.
std::string GenerateRequestId();

// Thread-pool HTTP/1.1 front end of the gateway. One thread accepts and a
// fixed pool of workers serves one connection each (Connection: close), so a
// slow upstream call only holds its own worker.
class HttpServer {
 public:
  struct TlsConfig {
    bool enabled{false};
    std::string cert_path;
    std::string key_path;
  };

  struct Options {
    std::string host{"0.0.0.0"};
    int port{8000};
    int workers{8};
    std::string request_id_header{"X-Request-Id"};
    std::string client_id_header{"X-Client-Id"};
    TlsConfig tls;
  };

  // Collaborators are borrowed. `limiter`, `metrics` and `events` may be null.
  HttpServer(Options options, ChatPipeline* pipeline, HealthChecker* health,
             RateLimiter* limiter, MetricsRegistry* metrics, ObservationSink* events);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds and listens, then starts the accept thread and workers. Returns
  // false when the socket cannot be bound.
  bool Start();
  void Stop();

  // Routes one parsed request. Never throws: unexpected failures become a
  // 500 internal_error reply. Emits the `request` observation event.
  HttpReply HandleRequest(const HttpRequest& request);

  bool TlsEnabled() const { return tls_enabled_; }

  // Largest accepted request (headers plus body).
  static constexpr std::size_t kMaxRequestBytes = 16 * 1024 * 1024;

 private:
  struct ClientSession {
    int fd{-1};
    SSL* ssl{nullptr};
    std::string peer;
  };

  void Run();
  void WorkerLoop();
  void HandleClient(ClientSession& session);

  HttpReply Route(const HttpRequest& request, const std::string& request_id,
                  const std::string& client_id);
  HttpReply HandleChatCompletions(const HttpRequest& request, const std::string& request_id,
                                  const std::string& client_id);
  HttpReply HandleHealth();
  HttpReply Preflight() const;
  void EmitRequestEvent(const std::string& request_id, const std::string& client_id,
                        const HttpRequest& request, int status, long long latency_ms);

  std::string SerializeReply(const HttpReply& reply, const std::string& request_id) const;
  bool SendAll(ClientSession& session, const std::string& payload);
  ssize_t Receive(ClientSession& session, char* buffer, std::size_t length);
  void CloseSession(ClientSession& session);

  Options options_;
  ChatPipeline* pipeline_;
  HealthChecker* health_;
  RateLimiter* limiter_;
  MetricsRegistry* metrics_;
  ObservationSink* events_;

  bool tls_enabled_{false};
  SSL_CTX* ssl_ctx_{nullptr};
  std::atomic<bool> running_{false};
  std::atomic<int> server_fd_{-1};
  std::thread accept_thread_;
  std::vector<std::thread> workers_;
  std::queue<ClientSession> client_queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
};

}  // namespace guardway
