#include <gtest/gtest.h>
#include <colourgen/errors.hpp>
#include <colourgen/http_client.hpp>
#include "test_helpers.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <climits>
#include <thread>

using namespace colourgen;

namespace {

/**
 * One-shot HTTP server on 127.0.0.1. Accepts a single connection, captures
 * the request head, writes the canned reply (unless silent) and closes.
 */
class LoopbackServer {
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::thread thread_;
    std::string request_;
    std::atomic<bool> stop_{false};

public:
    LoopbackServer(std::string reply, bool silent = false) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) {
            throw std::runtime_error("socket() failed");
        }
        int yes = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 1) != 0) {
            ::close(listen_fd_);
            throw std::runtime_error("bind/listen failed");
        }
        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this, reply = std::move(reply), silent] {
            int client = ::accept(listen_fd_, nullptr, nullptr);
            if (client < 0) {
                return;
            }
            char buffer[1024];
            while (request_.find("\r\n\r\n") == std::string::npos) {
                ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
                if (n <= 0) {
                    break;
                }
                request_.append(buffer, static_cast<std::size_t>(n));
            }
            if (silent) {
                while (!stop_.load()) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
            } else {
                std::size_t sent = 0;
                while (sent < reply.size()) {
                    ssize_t n = ::send(client, reply.data() + sent, reply.size() - sent, MSG_NOSIGNAL);
                    if (n <= 0) {
                        break;
                    }
                    sent += static_cast<std::size_t>(n);
                }
            }
            ::close(client);
        });
    }

    ~LoopbackServer() {
        stop_.store(true);
        ::shutdown(listen_fd_, SHUT_RDWR);
        if (thread_.joinable()) {
            thread_.join();
        }
        ::close(listen_fd_);
    }

    uint16_t port() const { return port_; }

    // Valid once the client has received its response
    const std::string& request() {
        stop_.store(true);
        if (thread_.joinable()) {
            thread_.join();
        }
        return request_;
    }

    Url url(const std::string& target) const {
        Url url;
        url.scheme = "http";
        url.host = "127.0.0.1";
        url.port = port_;
        url.target = target;
        return url;
    }
};

uint16_t unused_port() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    ::close(fd);
    return ntohs(addr.sin_port);
}

} // namespace

// === URL PARSING ===

TEST(UrlTest, ParsesFullUrl) {
    auto url = Url::parse("HTTP://www.colourlovers.com:8080/api/palette/92095?format=xml");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "http");
    EXPECT_EQ(url->host, "www.colourlovers.com");
    EXPECT_EQ(url->port, 8080);
    EXPECT_EQ(url->target, "/api/palette/92095?format=xml");
}

TEST(UrlTest, DefaultsPortAndTarget) {
    auto http = Url::parse("http://example.com");
    ASSERT_TRUE(http.has_value());
    EXPECT_EQ(http->port, 80);
    EXPECT_EQ(http->target, "/");

    auto https = Url::parse("https://example.com/x.png");
    ASSERT_TRUE(https.has_value());
    EXPECT_EQ(https->port, 443);
}

TEST(UrlTest, RejectsMalformed) {
    EXPECT_FALSE(Url::parse("example.com/x.png").has_value());
    EXPECT_FALSE(Url::parse("http://").has_value());
    EXPECT_FALSE(Url::parse("http://host:99999/").has_value());
    EXPECT_FALSE(Url::parse("http://host:abc/").has_value());
    EXPECT_TRUE(looks_like_url("ftp://x"));
    EXPECT_FALSE(looks_like_url("images/x.png"));
}

TEST(UrlTest, ToStringSpellsOutPort) {
    auto url = Url::parse("https://www.r-project.org/Rlogo.png");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->to_string(), "https://www.r-project.org:443/Rlogo.png");
}

// === TIMEOUTS ===

TEST(TimeoutTest, ClampedToPositiveInt) {
    EXPECT_EQ(clamp_timeout_ms(std::chrono::milliseconds(1500)), 1500);
    EXPECT_EQ(clamp_timeout_ms(std::chrono::milliseconds(0)), 1);
    EXPECT_EQ(clamp_timeout_ms(std::chrono::milliseconds(-20)), 1);
    EXPECT_EQ(clamp_timeout_ms(std::chrono::milliseconds(99999999999999LL)), INT_MAX);
    EXPECT_EQ(clamp_timeout_ms(std::chrono::milliseconds::max()), INT_MAX);
}

// === CURL TRANSPORT ===

TEST(CurlHttpTransportTest, LoopbackRoundTrip) {
    LoopbackServer server("HTTP/1.0 200 OK\r\nContent-Type: text/xml\r\n\r\n<hex>69D2E7</hex>\n");
    CurlHttpTransport transport("colourgen-test");

    HttpResponse response = transport.get(server.url("/api/palette/7"), std::chrono::milliseconds(2000));
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.reason, "OK");
    EXPECT_EQ(response.headers.at("content-type"), "text/xml");
    EXPECT_EQ(response.body, "<hex>69D2E7</hex>\n");
    EXPECT_TRUE(response.is_success());

    const std::string& request = server.request();
    EXPECT_EQ(request.rfind("GET /api/palette/7 HTTP/1.", 0), 0u) << request;
    EXPECT_NE(request.find("Host: 127.0.0.1:" + std::to_string(server.port())), std::string::npos);
    EXPECT_NE(request.find("User-Agent: colourgen-test"), std::string::npos);
}

TEST(CurlHttpTransportTest, DecodesChunkedBody) {
    LoopbackServer server(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\nConnection: close\r\n\r\n"
        "5\r\n<hex>\r\n6\r\nCAF60D\r\n6\r\n</hex>\r\n0\r\n\r\n");
    CurlHttpTransport transport;
    HttpResponse response = transport.get(server.url("/"), std::chrono::milliseconds(2000));
    EXPECT_EQ(response.body, "<hex>CAF60D</hex>");
}

TEST(CurlHttpTransportTest, NonSuccessStatusIsReturned) {
    LoopbackServer server("HTTP/1.0 503 Service Unavailable\r\n\r\n");
    CurlHttpTransport transport;
    HttpResponse response = transport.get(server.url("/"), std::chrono::milliseconds(2000));
    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(response.reason, "Service Unavailable");
    EXPECT_FALSE(response.is_success());
}

TEST(CurlHttpTransportTest, OversizedBodyIsMalformed) {
    std::string reply = "HTTP/1.0 200 OK\r\n\r\n";
    reply.append(CurlHttpTransport::MAX_RESPONSE_BYTES + 4096, 'x');
    LoopbackServer server(std::move(reply));
    CurlHttpTransport transport;
    EXPECT_THROW(transport.get(server.url("/big"), std::chrono::milliseconds(10000)), MalformedSourceError);
}

TEST(CurlHttpTransportTest, HugeTimeoutStillCompletes) {
    LoopbackServer server("HTTP/1.0 200 OK\r\n\r\nok");
    CurlHttpTransport transport;
    HttpResponse response = transport.get(server.url("/"), std::chrono::milliseconds::max());
    EXPECT_EQ(response.body, "ok");
}

TEST(CurlHttpTransportTest, ConnectionRefusedIsUnavailable) {
    CurlHttpTransport transport;
    Url url;
    url.scheme = "http";
    url.host = "127.0.0.1";
    url.port = unused_port();
    try {
        transport.get(url, std::chrono::milliseconds(2000));
        FAIL() << "Expected SourceUnavailableError";
    } catch (const SourceUnavailableError& e) {
        EXPECT_EQ(e.kind(), FailureKind::SourceUnavailable);
    }
}

TEST(CurlHttpTransportTest, SilentServerTimesOut) {
    LoopbackServer server("", true);
    CurlHttpTransport transport;
    EXPECT_THROW(transport.get(server.url("/slow"), std::chrono::milliseconds(200)), SourceUnavailableError);
}

// A plain-HTTP peer never completes the TLS handshake
TEST(CurlHttpTransportTest, HttpsNegotiatesTls) {
    LoopbackServer server("HTTP/1.0 200 OK\r\n\r\nplain");
    CurlHttpTransport transport;
    Url url = server.url("/secure.png");
    url.scheme = "https";
    EXPECT_THROW(transport.get(url, std::chrono::milliseconds(1000)), SourceUnavailableError);
}

TEST(CurlHttpTransportTest, UnsupportedSchemeIsUnavailable) {
    CurlHttpTransport transport;
    auto url = Url::parse("ftp://example.com/palette");
    ASSERT_TRUE(url.has_value());
    EXPECT_THROW(transport.get(*url, std::chrono::milliseconds(100)), SourceUnavailableError);
}

TEST(CurlHttpTransportTest, UnresolvableHostIsUnavailable) {
    CurlHttpTransport transport;
    auto url = Url::parse("http://colourgen-no-such-host.invalid/");
    ASSERT_TRUE(url.has_value());
    EXPECT_THROW(transport.get(*url, std::chrono::milliseconds(2000)), SourceUnavailableError);
}
