#include <catch2/catch_test_macros.hpp>

#include "net/http_client.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>

using namespace guardway;
using std::chrono::milliseconds;

namespace {

// Listening socket on 127.0.0.1 with an ephemeral port.
struct Listener {
  int fd{-1};
  int port{0};

  Listener() {
    fd = ::socket(AF_INET, SOCK_STREAM, 0);
    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    REQUIRE(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    REQUIRE(::listen(fd, 4) == 0);
    socklen_t len = sizeof(addr);
    getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    port = ntohs(addr.sin_port);
  }
  ~Listener() { Close(); }

  void Close() {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }

  std::string Url(const std::string& path) const {
    return "http://127.0.0.1:" + std::to_string(port) + path;
  }
};

// Accepts one connection, reads one request and answers with `reply`.
void ServeOnce(int listen_fd, const std::string& reply, std::string* request_out) {
  int client = ::accept(listen_fd, nullptr, nullptr);
  if (client < 0) {
    return;
  }
  std::string request;
  char buf[4096];
  std::size_t header_end = std::string::npos;
  std::size_t content_length = 0;
  while (true) {
    ssize_t n = ::recv(client, buf, sizeof(buf), 0);
    if (n <= 0) {
      break;
    }
    request.append(buf, static_cast<std::size_t>(n));
    if (header_end == std::string::npos) {
      header_end = request.find("\r\n\r\n");
      if (header_end != std::string::npos) {
        auto pos = request.find("Content-Length: ");
        if (pos != std::string::npos && pos < header_end) {
          content_length = std::strtoul(request.c_str() + pos + 16, nullptr, 10);
        }
      }
    }
    if (header_end != std::string::npos && request.size() >= header_end + 4 + content_length) {
      break;
    }
  }
  if (request_out) {
    *request_out = request;
  }
  ::send(client, reply.data(), reply.size(), MSG_NOSIGNAL);
  ::close(client);
}

}  // namespace

TEST_CASE("HttpClient reads a content-length response", "[http_client]") {
  Listener listener;
  std::string request;
  std::thread server(ServeOnce, listener.fd,
                     "HTTP/1.1 201 Created\r\nContent-Type: application/json\r\n"
                     "Content-Length: 11\r\n\r\n{\"ok\":true}",
                     &request);

  HttpClient client;
  auto response = client.Post(listener.Url("/v1/chat/completions"), "{\"a\":1}",
                              {{"Authorization", "Bearer sk-1"}, {"X-Request-Id", "r-1"}},
                              milliseconds(2000));
  server.join();

  REQUIRE(response.status == 201);
  REQUIRE(response.body == "{\"ok\":true}");
  REQUIRE(request.rfind("POST /v1/chat/completions HTTP/1.1\r\n", 0) == 0);
  REQUIRE(request.find("Authorization: Bearer sk-1\r\n") != std::string::npos);
  REQUIRE(request.find("X-Request-Id: r-1\r\n") != std::string::npos);
  REQUIRE(request.find("Content-Length: 7\r\n") != std::string::npos);
  REQUIRE(request.substr(request.size() - 7) == "{\"a\":1}");
}

TEST_CASE("HttpClient decodes chunked responses", "[http_client]") {
  Listener listener;
  std::thread server(ServeOnce, listener.fd,
                     "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                     "4\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\n",
                     nullptr);

  HttpClient client;
  auto response = client.Get(listener.Url("/v1/models"), {}, milliseconds(2000));
  server.join();
  REQUIRE(response.status == 200);
  REQUIRE(response.body == "Wikipedia");
}

TEST_CASE("HttpClient reports refused connections as network errors", "[http_client]") {
  Listener listener;
  std::string url = listener.Url("/");
  listener.Close();

  HttpClient client;
  REQUIRE_THROWS_AS(client.Get(url, {}, milliseconds(1000)), HttpNetworkError);
}

TEST_CASE("HttpClient times out on a silent peer", "[http_client]") {
  // The kernel completes the handshake from the backlog; nobody ever answers.
  Listener listener;
  HttpClient client;
  auto started = std::chrono::steady_clock::now();
  REQUIRE_THROWS_AS(client.Post(listener.Url("/slow"), "{}", {}, milliseconds(200)),
                    HttpTimeoutError);
  auto elapsed = std::chrono::steady_clock::now() - started;
  REQUIRE(elapsed < std::chrono::seconds(5));
}

TEST_CASE("HttpClient rejects unsupported URLs", "[http_client]") {
  HttpClient client;
  REQUIRE_THROWS_AS(client.Get("ftp://example.com/", {}, milliseconds(100)), HttpNetworkError);
  REQUIRE_THROWS_AS(client.Get("http://:80/", {}, milliseconds(100)), HttpNetworkError);
}
