#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>
#include <utility>

#include <curl/curl.h>

#include "../services/performer/include/http.hpp"

// Loopback sockets only; nothing here leaves the machine.

static int listenOnLoopback(int *port, bool listening) {
  int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return -1;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  if (bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    close(fd);
    return -1;
  }
  socklen_t len = sizeof(addr);
  getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len);
  *port = ntohs(addr.sin_port);
  if (listening && listen(fd, 4) != 0) {
    close(fd);
    return -1;
  }
  return fd;
}

// Accepts one connection, captures the request and answers with a canned response.
class OneShotServer {
public:
  explicit OneShotServer(std::string response) : response_(std::move(response)) {
    fd_ = listenOnLoopback(&port_, true);
    thread_ = std::thread([this]() { serve(); });
  }
  ~OneShotServer() {
    if (thread_.joinable()) {
      thread_.join();
    }
    if (fd_ >= 0) {
      close(fd_);
    }
  }

  int port() const { return port_; }
  const std::string &request() const { return request_; }
  void join() { thread_.join(); }

private:
  void serve() {
    if (fd_ < 0) {
      return;
    }
    int c = accept(fd_, nullptr, nullptr);
    if (c < 0) {
      return;
    }
    char buf[4096];
    size_t headerEnd = std::string::npos;
    size_t expected = 0;
    while (true) {
      ssize_t n = recv(c, buf, sizeof(buf), 0);
      if (n <= 0) {
        break;
      }
      request_.append(buf, static_cast<size_t>(n));
      if (headerEnd == std::string::npos) {
        headerEnd = request_.find("\r\n\r\n");
        if (headerEnd != std::string::npos) {
          auto pos = request_.find("Content-Length: ");
          if (pos != std::string::npos && pos < headerEnd) {
            expected = std::strtoul(request_.c_str() + pos + 16, nullptr, 10);
          }
        }
      }
      if (headerEnd != std::string::npos && request_.size() >= headerEnd + 4 + expected) {
        break;
      }
    }
    send(c, response_.data(), response_.size(), 0);
    close(c);
  }

  std::string response_;
  std::string request_;
  int fd_{-1};
  int port_{0};
  std::thread thread_;
};

static std::string url(int port) { return "http://127.0.0.1:" + std::to_string(port) + "/chat"; }

TEST(HttpPostJson, returnsStatusAndBody) {
  OneShotServer server("HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 11\r\n"
                       "Connection: close\r\n\r\n{\"ok\":true}");
  HttpResponse r = http_post_json(url(server.port()), "{\"a\":1}", 5000, {"api-key: secret"});
  server.join();

  EXPECT_EQ(200, r.status);
  EXPECT_EQ("{\"ok\":true}", r.body);
  EXPECT_NE(std::string::npos, server.request().find("POST /chat"));
  EXPECT_NE(std::string::npos, server.request().find("api-key: secret"));
  EXPECT_NE(std::string::npos, server.request().find("Content-Type: application/json"));
  EXPECT_NE(std::string::npos, server.request().find("{\"a\":1}"));
}

TEST(HttpPostJson, errorStatusIsNotAnException) {
  OneShotServer server("HTTP/1.1 503 Service Unavailable\r\nContent-Length: 4\r\nConnection: close\r\n\r\nbusy");
  HttpResponse r = http_post_json(url(server.port()), "{}", 5000);
  server.join();
  EXPECT_EQ(503, r.status);
  EXPECT_EQ("busy", r.body);
}

TEST(HttpPostJson, silentPeerTimesOut) {
  // listening but never accepting: the connect succeeds, no response ever arrives
  int port = 0;
  int fd = listenOnLoopback(&port, true);
  ASSERT_GE(fd, 0);

  auto started = std::chrono::steady_clock::now();
  try {
    http_post_json(url(port), "{}", 300);
    FAIL() << "expected a timeout";
  } catch (const HttpError &e) {
    EXPECT_EQ(HttpError::Kind::Timeout, e.kind());
  }
  auto elapsed = std::chrono::steady_clock::now() - started;
  EXPECT_LT(elapsed, std::chrono::seconds(5));
  close(fd);
}

TEST(HttpPostJson, refusedConnectionIsTransportError) {
  // bound but not listening: connect is refused
  int port = 0;
  int fd = listenOnLoopback(&port, false);
  ASSERT_GE(fd, 0);

  try {
    http_post_json(url(port), "{}", 2000);
    FAIL() << "expected a transport error";
  } catch (const HttpError &e) {
    EXPECT_EQ(HttpError::Kind::Transport, e.kind());
  }
  close(fd);
}

int main(int argc, char **argv) {
  // a proxy from the environment must not intercept loopback requests
  setenv("no_proxy", "127.0.0.1,localhost", 1);
  curl_global_init(CURL_GLOBAL_DEFAULT);
  ::testing::InitGoogleTest(&argc, argv);
  int rc = RUN_ALL_TESTS();
  curl_global_cleanup();
  return rc;
}
