#include "net/http_client.h"

#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>

namespace guardway {
namespace {

using Clock = std::chrono::steady_clock;

struct ParsedUrl {
  std::string scheme{"http"};
  std::string host;
  std::string path{"/"};
  int port{80};
  bool use_tls{false};
};

ParsedUrl ParseUrl(const std::string &url) {
  ParsedUrl parsed;
  std::string remainder = url;
  auto scheme_pos = url.find("://");
  if (scheme_pos != std::string::npos) {
    parsed.scheme = url.substr(0, scheme_pos);
    remainder = url.substr(scheme_pos + 3);
  }
  if (parsed.scheme != "http" && parsed.scheme != "https") {
    throw HttpNetworkError("unsupported URL scheme: " + parsed.scheme);
  }
  parsed.use_tls = (parsed.scheme == "https");
  parsed.port = parsed.use_tls ? 443 : 80;

  auto slash = remainder.find('/');
  std::string host_port =
      slash == std::string::npos ? remainder : remainder.substr(0, slash);
  parsed.path = slash == std::string::npos ? "/" : remainder.substr(slash);

  auto colon = host_port.find(':');
  if (colon == std::string::npos) {
    parsed.host = host_port;
  } else {
    parsed.host = host_port.substr(0, colon);
    try {
      parsed.port = std::stoi(host_port.substr(colon + 1));
    } catch (const std::exception &) {
      throw HttpNetworkError("invalid URL port");
    }
  }
  if (parsed.host.empty()) {
    throw HttpNetworkError("invalid URL host");
  }
  return parsed;
}

// Owns one socket (and its TLS session, if any) for a single request.
struct Connection {
  int sock{-1};
  SSL *ssl{nullptr};

  Connection() = default;
  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;
  ~Connection() {
    if (ssl) {
      SSL_shutdown(ssl);
      SSL_free(ssl);
    }
    if (sock >= 0) {
      ::close(sock);
    }
  }
};

int RemainingMs(Clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                  deadline - Clock::now())
                  .count();
  return left > 0 ? static_cast<int>(left) : 0;
}

void SetSocketTimeouts(int sock, std::chrono::milliseconds timeout) {
  struct timeval tv;
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

// Non-blocking connect bounded by the request deadline.
bool ConnectWithDeadline(int sock, const sockaddr *addr, socklen_t len,
                         Clock::time_point deadline, bool *timed_out) {
  int flags = fcntl(sock, F_GETFL, 0);
  fcntl(sock, F_SETFL, flags | O_NONBLOCK);
  int rc = ::connect(sock, addr, len);
  if (rc != 0 && errno != EINPROGRESS) {
    return false;
  }
  if (rc != 0) {
    pollfd pfd{sock, POLLOUT, 0};
    int ready = 0;
    do {
      ready = ::poll(&pfd, 1, RemainingMs(deadline));
    } while (ready < 0 && errno == EINTR);
    if (ready == 0) {
      *timed_out = true;
      return false;
    }
    if (ready < 0) {
      return false;
    }
    int so_error = 0;
    socklen_t so_len = sizeof(so_error);
    getsockopt(sock, SOL_SOCKET, SO_ERROR, &so_error, &so_len);
    if (so_error != 0) {
      return false;
    }
  }
  fcntl(sock, F_SETFL, flags);
  return true;
}

void OpenSocket(const ParsedUrl &parsed, Clock::time_point deadline,
                Connection *conn) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *result = nullptr;
  if (getaddrinfo(parsed.host.c_str(), std::to_string(parsed.port).c_str(),
                  &hints, &result) != 0) {
    throw HttpNetworkError("failed to resolve host " + parsed.host);
  }
  bool timed_out = false;
  for (addrinfo *rp = result; rp != nullptr; rp = rp->ai_next) {
    int sock = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (sock == -1)
      continue;
    if (ConnectWithDeadline(sock, rp->ai_addr, rp->ai_addrlen, deadline,
                            &timed_out)) {
      conn->sock = sock;
      break;
    }
    ::close(sock);
    if (timed_out)
      break;
  }
  freeaddrinfo(result);
  if (conn->sock == -1) {
    if (timed_out) {
      throw HttpTimeoutError("connect to " + parsed.host + " timed out");
    }
    throw HttpNetworkError("failed to connect to " + parsed.host);
  }
}

bool HasHeader(const HttpHeaders &headers, const std::string &name) {
  for (const auto &[key, value] : headers) {
    if (key.size() == name.size() &&
        std::equal(key.begin(), key.end(), name.begin(), [](char a, char b) {
          return std::tolower(static_cast<unsigned char>(a)) ==
                 std::tolower(static_cast<unsigned char>(b));
        })) {
      return true;
    }
  }
  return false;
}

std::string BuildRequest(const ParsedUrl &parsed, const std::string &method,
                         const std::string &body, const HttpHeaders &headers) {
  std::ostringstream request;
  request << method << " " << parsed.path << " HTTP/1.1\r\n";
  request << "Host: " << parsed.host << "\r\n";
  request << "Content-Length: " << body.size() << "\r\n";
  if (!body.empty() && !HasHeader(headers, "Content-Type")) {
    request << "Content-Type: application/json\r\n";
  }
  for (const auto &[key, value] : headers) {
    request << key << ": " << value << "\r\n";
  }
  request << "Connection: close\r\n\r\n";
  request << body;
  return request.str();
}

std::string LowerCopy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

struct ResponseHead {
  int status{0};
  bool chunked{false};
  bool has_length{false};
  std::size_t content_length{0};
};

ResponseHead ParseHead(const std::string &head) {
  ResponseHead parsed;
  auto line_end = head.find("\r\n");
  std::string status_line = head.substr(0, line_end);
  auto status_pos = status_line.find(' ');
  if (status_pos == std::string::npos) {
    throw HttpNetworkError("malformed HTTP status line");
  }
  try {
    parsed.status = std::stoi(status_line.substr(status_pos + 1));
  } catch (const std::exception &) {
    throw HttpNetworkError("malformed HTTP status code");
  }
  std::string lower = LowerCopy(head);
  auto te = lower.find("\r\ntransfer-encoding:");
  if (te != std::string::npos) {
    auto end = lower.find("\r\n", te + 2);
    parsed.chunked =
        lower.substr(te, end - te).find("chunked") != std::string::npos;
  }
  auto cl = lower.find("\r\ncontent-length:");
  if (cl != std::string::npos) {
    auto start = cl + std::strlen("\r\ncontent-length:");
    auto end = lower.find("\r\n", start);
    try {
      parsed.content_length = static_cast<std::size_t>(
          std::stoull(lower.substr(start, end - start)));
      parsed.has_length = true;
    } catch (const std::exception &) {
      parsed.has_length = false;
    }
  }
  return parsed;
}

// Decodes a chunked body. Returns false while the terminating chunk has not
// been seen yet.
bool DecodeChunked(const std::string &raw, std::string *out) {
  out->clear();
  std::size_t pos = 0;
  while (true) {
    auto line_end = raw.find("\r\n", pos);
    if (line_end == std::string::npos) {
      return false;
    }
    std::size_t size = 0;
    try {
      size = static_cast<std::size_t>(
          std::stoull(raw.substr(pos, line_end - pos), nullptr, 16));
    } catch (const std::exception &) {
      throw HttpNetworkError("malformed chunked encoding");
    }
    pos = line_end + 2;
    if (size == 0) {
      return true;
    }
    if (raw.size() < pos + size + 2) {
      return false;
    }
    out->append(raw, pos, size);
    pos += size + 2;
  }
}

ssize_t ReadSome(Connection &conn, char *buffer, std::size_t length,
                 Clock::time_point deadline) {
  bool pending = conn.ssl && SSL_pending(conn.ssl) > 0;
  if (!pending) {
    pollfd pfd{conn.sock, POLLIN, 0};
    int ready = 0;
    do {
      ready = ::poll(&pfd, 1, RemainingMs(deadline));
    } while (ready < 0 && errno == EINTR);
    if (ready == 0) {
      throw HttpTimeoutError("timed out waiting for response");
    }
    if (ready < 0) {
      throw HttpNetworkError(std::string("poll failed: ") + std::strerror(errno));
    }
  }
  if (conn.ssl) {
    int received = SSL_read(conn.ssl, buffer, static_cast<int>(length));
    if (received > 0) {
      return received;
    }
    int err = SSL_get_error(conn.ssl, received);
    if (err == SSL_ERROR_ZERO_RETURN ||
        (err == SSL_ERROR_SYSCALL && errno == 0)) {
      return 0;
    }
    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
      return -2;
    }
    throw HttpNetworkError("TLS read failed");
  }
  while (true) {
    ssize_t received = ::recv(conn.sock, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    if (received < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      throw HttpTimeoutError("timed out waiting for response");
    }
    if (received < 0) {
      throw HttpNetworkError(std::string("recv failed: ") + std::strerror(errno));
    }
    return received;
  }
}

void WriteAll(Connection &conn, const std::string &payload) {
  const char *send_ptr = payload.c_str();
  std::size_t send_remaining = payload.size();
  while (send_remaining > 0) {
    if (conn.ssl) {
      int sent = SSL_write(conn.ssl, send_ptr, static_cast<int>(send_remaining));
      if (sent <= 0) {
        throw HttpNetworkError("failed to send TLS request");
      }
      send_ptr += sent;
      send_remaining -= static_cast<std::size_t>(sent);
    } else {
      ssize_t sent = ::send(conn.sock, send_ptr, send_remaining, MSG_NOSIGNAL);
      if (sent < 0 && errno == EINTR) {
        continue;
      }
      if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        throw HttpTimeoutError("timed out sending request");
      }
      if (sent <= 0) {
        throw HttpNetworkError("failed to send request");
      }
      send_ptr += sent;
      send_remaining -= static_cast<std::size_t>(sent);
    }
  }
}
} // namespace

HttpClient::HttpClient() {
  OPENSSL_init_ssl(0, nullptr);
  ssl_ctx_ = SSL_CTX_new(TLS_client_method());
  if (ssl_ctx_) {
    SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_default_verify_paths(ssl_ctx_);
    tls_ready_ = true;
  }
}

HttpClient::~HttpClient() {
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

HttpResponse HttpClient::Get(const std::string &url, const HttpHeaders &headers,
                             std::chrono::milliseconds timeout) const {
  return Send("GET", url, "", headers, timeout);
}

HttpResponse HttpClient::Post(const std::string &url, const std::string &body,
                              const HttpHeaders &headers,
                              std::chrono::milliseconds timeout) const {
  return Send("POST", url, body, headers, timeout);
}

HttpResponse HttpClient::Send(const std::string &method, const std::string &url,
                              const std::string &body,
                              const HttpHeaders &headers,
                              std::chrono::milliseconds timeout) const {
  auto parsed = ParseUrl(url);
  auto deadline = Clock::now() + timeout;
  Connection conn;
  OpenSocket(parsed, deadline, &conn);
  SetSocketTimeouts(conn.sock, timeout);

  if (parsed.use_tls) {
    if (!tls_ready_) {
      throw HttpNetworkError("TLS not available in HttpClient");
    }
    conn.ssl = SSL_new(ssl_ctx_);
    if (!conn.ssl) {
      throw HttpNetworkError("failed to allocate TLS context");
    }
    SSL_set_tlsext_host_name(conn.ssl, parsed.host.c_str());
    SSL_set1_host(conn.ssl, parsed.host.c_str());
    SSL_set_fd(conn.ssl, conn.sock);
    if (SSL_connect(conn.ssl) != 1) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        throw HttpTimeoutError("TLS handshake timed out");
      }
      throw HttpNetworkError("TLS handshake failed");
    }
    if (SSL_get_verify_result(conn.ssl) != X509_V_OK) {
      throw HttpNetworkError("TLS certificate verification failed");
    }
  }

  WriteAll(conn, BuildRequest(parsed, method, body, headers));

  std::string response;
  std::size_t header_end = std::string::npos;
  ResponseHead head;
  std::string decoded;
  bool complete = false;
  char buffer[8192];
  while (!complete) {
    ssize_t read_bytes = ReadSome(conn, buffer, sizeof(buffer), deadline);
    if (read_bytes == -2) {
      continue;
    }
    if (read_bytes == 0) {
      break;
    }
    response.append(buffer, buffer + read_bytes);
    if (header_end == std::string::npos) {
      header_end = response.find("\r\n\r\n");
      if (header_end != std::string::npos) {
        head = ParseHead(response.substr(0, header_end));
      }
    }
    if (header_end != std::string::npos) {
      std::size_t body_size = response.size() - header_end - 4;
      if (head.chunked) {
        complete = DecodeChunked(response.substr(header_end + 4), &decoded);
      } else if (head.has_length) {
        complete = body_size >= head.content_length;
      }
    }
  }

  if (header_end == std::string::npos) {
    throw HttpNetworkError("connection closed before response headers");
  }

  HttpResponse http_response;
  http_response.status = head.status;
  if (head.chunked) {
    if (!complete && !DecodeChunked(response.substr(header_end + 4), &decoded)) {
      throw HttpNetworkError("connection closed inside chunked body");
    }
    http_response.body = std::move(decoded);
  } else {
    http_response.body = response.substr(header_end + 4);
    if (head.has_length) {
      if (http_response.body.size() < head.content_length) {
        throw HttpNetworkError("connection closed before full body");
      }
      http_response.body.resize(head.content_length);
    }
  }
  return http_response;
}

} // namespace guardway
