#pragma once

#include <chrono>
#include <map>
#include <stdexcept>
#include <string>

#include <openssl/ssl.h>

namespace guardway {

struct HttpResponse {
  int status{0};
  std::string body;
};

using HttpHeaders = std::map<std::string, std::string>;

// Transport failures. Anything that prevented a complete HTTP response from
// being read is reported as one of these; an HTTP error status is not.
class HttpError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class HttpTimeoutError : public HttpError {
public:
  using HttpError::HttpError;
};

class HttpNetworkError : public HttpError {
public:
  using HttpError::HttpError;
};

// Outbound HTTP seam. The gateway talks to the upstream provider and to the
// delegated PII analyzer only through this interface so tests can substitute
// a scripted transport.
//
// Thread safety: implementations must allow concurrent calls.
class HttpTransport {
public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse Get(const std::string &url, const HttpHeaders &headers,
                           std::chrono::milliseconds timeout) const = 0;
  virtual HttpResponse Post(const std::string &url, const std::string &body,
                            const HttpHeaders &headers,
                            std::chrono::milliseconds timeout) const = 0;
};

// Blocking HTTP/1.1 client over plain sockets or OpenSSL. One instance owns
// the TLS client context and is shared by every dispatch for the lifetime of
// the process; each call opens its own connection.
class HttpClient : public HttpTransport {
public:
  HttpClient();
  ~HttpClient() override;
  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  HttpResponse Get(const std::string &url, const HttpHeaders &headers,
                   std::chrono::milliseconds timeout) const override;
  HttpResponse Post(const std::string &url, const std::string &body,
                    const HttpHeaders &headers,
                    std::chrono::milliseconds timeout) const override;

  bool TlsReady() const { return tls_ready_; }

private:
  HttpResponse Send(const std::string &method, const std::string &url,
                    const std::string &body, const HttpHeaders &headers,
                    std::chrono::milliseconds timeout) const;

  SSL_CTX *ssl_ctx_{nullptr};
  bool tls_ready_{false};
};

} // namespace guardway
