#include "infer_bench/cancel_token.hpp"
#include "infer_bench/request_issuer.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using infer_bench::CancelToken;
using infer_bench::CurlRequestIssuer;
using infer_bench::FailureKind;
using infer_bench::HttpIssuerOptions;

namespace {

class CurlEnvironment : public ::testing::Environment {
public:
    void SetUp() override { guard_ = std::make_unique<infer_bench::CurlGlobalGuard>(); }
    void TearDown() override { guard_.reset(); }
private:
    std::unique_ptr<infer_bench::CurlGlobalGuard> guard_;
};

const auto* const kCurlEnv = ::testing::AddGlobalTestEnvironment(new CurlEnvironment);

// Single-threaded HTTP responder on an ephemeral loopback port. Each accepted
// connection gets `reply` (then close), or nothing at all when `reply` is empty.
class LoopbackServer {
public:
    explicit LoopbackServer(std::string reply) : reply_(std::move(reply)) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) throw std::runtime_error(std::string("socket: ") + std::strerror(errno));
        int one = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(fd_, 8) != 0 ||
            ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
            const std::string err = std::strerror(errno);
            ::close(fd_);
            throw std::runtime_error("loopback listener: " + err);
        }
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this] { Serve(); });
    }

    ~LoopbackServer() {
        stop_.store(true);
        thread_.join();
        ::close(fd_);
    }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    std::string Url() const { return "http://127.0.0.1:" + std::to_string(port_) + "/api/generate"; }

    std::string LastRequest() {
        std::lock_guard<std::mutex> lk(mu_);
        return last_request_;
    }

    static std::string Response(int status, const std::string& reason, const std::string& body) {
        return "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n"
               "Content-Type: application/json\r\n"
               "Content-Length: " + std::to_string(body.size()) + "\r\n"
               "Connection: close\r\n\r\n" + body;
    }

private:
    // Waits for `fd` to become readable; false on timeout or shutdown.
    bool Readable(int fd) const {
        pollfd p{fd, POLLIN, 0};
        return !stop_.load() && ::poll(&p, 1, 20) > 0;
    }

    void Serve() {
        while (!stop_.load()) {
            if (!Readable(fd_)) continue;
            const int conn = ::accept(fd_, nullptr, nullptr);
            if (conn < 0) continue;
            Handle(conn);
            ::close(conn);
        }
    }

    void Handle(int conn) {
        std::string request;
        std::size_t expected = std::string::npos;
        while (!stop_.load() && (expected == std::string::npos || request.size() < expected)) {
            if (!Readable(conn)) continue;
            char buf[4096];
            const auto n = ::recv(conn, buf, sizeof(buf), 0);
            if (n <= 0) return;
            request.append(buf, static_cast<std::size_t>(n));
            const auto header_end = request.find("\r\n\r\n");
            if (expected == std::string::npos && header_end != std::string::npos) {
                std::size_t body_len = 0;
                const auto cl = request.find("Content-Length:");
                if (cl != std::string::npos && cl < header_end) {
                    body_len = std::stoul(request.substr(cl + 15, request.find("\r\n", cl) - cl - 15));
                }
                expected = header_end + 4 + body_len;
            }
        }
        {
            std::lock_guard<std::mutex> lk(mu_);
            last_request_ = request;
        }

        if (reply_.empty()) {
            // Hold the connection open without answering.
            while (!stop_.load()) std::this_thread::sleep_for(10ms);
            return;
        }
        std::size_t sent = 0;
        while (sent < reply_.size()) {
            const auto n = ::send(conn, reply_.data() + sent, reply_.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return;
            sent += static_cast<std::size_t>(n);
        }
    }

    std::string reply_;
    int fd_ = -1;
    std::uint16_t port_ = 0;
    std::atomic<bool> stop_{false};
    std::mutex mu_;
    std::string last_request_;
    std::thread thread_;
};

HttpIssuerOptions Local(const LoopbackServer& server, std::chrono::milliseconds request_timeout = 5000ms) {
    HttpIssuerOptions opts;
    opts.endpoint = server.Url();
    opts.request_timeout = request_timeout;
    opts.connect_timeout = 1000ms;
    return opts;
}

HttpIssuerOptions Unreachable() {
    HttpIssuerOptions opts;
    // Port 1 on loopback refuses connections on any sane test host.
    opts.endpoint = "http://127.0.0.1:1/api/generate";
    opts.request_timeout = 2000ms;
    opts.connect_timeout = 1000ms;
    return opts;
}

}

TEST(CurlRequestIssuer, RequestBody) {
    const auto body = nlohmann::json::parse(CurlRequestIssuer::BuildRequestBody("qwen2:7b", "讲个故事"));
    EXPECT_EQ(body.at("model"), "qwen2:7b");
    EXPECT_EQ(body.at("prompt"), "讲个故事");
    EXPECT_FALSE(body.at("stream").get<bool>());
}

TEST(CurlRequestIssuer, RequestBodyEscapesQuotes) {
    const auto raw = CurlRequestIssuer::BuildRequestBody("m", "say \"hi\"\n");
    EXPECT_EQ(nlohmann::json::parse(raw).at("prompt"), "say \"hi\"\n");
}

TEST(CurlRequestIssuer, ConnectionRefusedIsNetworkFailure) {
    CurlRequestIssuer issuer(Unreachable());
    CancelToken token;

    const auto outcome = issuer.Send("m", "p", token);

    EXPECT_FALSE(outcome.succeeded);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, FailureKind::Network);
    EXPECT_FALSE(outcome.error->message.empty());
}

TEST(CurlRequestIssuer, CloneIsIndependent) {
    CurlRequestIssuer issuer(Unreachable());
    auto clone = issuer.Clone();
    ASSERT_NE(clone, nullptr);
    CancelToken token;
    const auto outcome = clone->Send("m", "p", token);
    EXPECT_FALSE(outcome.succeeded);
}

TEST(CurlRequestIssuer, JsonObjectReplySucceeds) {
    LoopbackServer server(LoopbackServer::Response(200, "OK", R"({"response":"x"})"));
    CurlRequestIssuer issuer(Local(server));
    CancelToken token;

    const auto outcome = issuer.Send("llama3:8b", "hello", token);

    EXPECT_TRUE(outcome.succeeded);
    EXPECT_FALSE(outcome.error.has_value());
    EXPECT_GT(outcome.elapsed.count(), 0);

    const auto request = server.LastRequest();
    EXPECT_EQ(request.rfind("POST /api/generate", 0), 0u);
    EXPECT_NE(request.find("application/json"), std::string::npos);
    const auto body = nlohmann::json::parse(request.substr(request.find("\r\n\r\n") + 4));
    EXPECT_EQ(body.at("model"), "llama3:8b");
    EXPECT_EQ(body.at("prompt"), "hello");
    EXPECT_FALSE(body.at("stream").get<bool>());
}

TEST(CurlRequestIssuer, ServerErrorIsHttpStatusFailure) {
    LoopbackServer server(LoopbackServer::Response(500, "Internal Server Error", R"({"error":"boom"})"));
    CurlRequestIssuer issuer(Local(server));
    CancelToken token;

    const auto outcome = issuer.Send("m", "p", token);

    EXPECT_FALSE(outcome.succeeded);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, FailureKind::HttpStatus);
    EXPECT_NE(outcome.error->message.find("500"), std::string::npos);
}

TEST(CurlRequestIssuer, NonJsonBodyIsMalformed) {
    LoopbackServer server(LoopbackServer::Response(200, "OK", "abc"));
    CurlRequestIssuer issuer(Local(server));
    CancelToken token;

    const auto outcome = issuer.Send("m", "p", token);

    EXPECT_FALSE(outcome.succeeded);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, FailureKind::MalformedResponse);
}

TEST(CurlRequestIssuer, JsonArrayBodyIsMalformed) {
    LoopbackServer server(LoopbackServer::Response(200, "OK", "[1, 2]"));
    CurlRequestIssuer issuer(Local(server));
    CancelToken token;

    const auto outcome = issuer.Send("m", "p", token);

    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, FailureKind::MalformedResponse);
}

TEST(CurlRequestIssuer, DeadlineAbortsRequestInFlight) {
    LoopbackServer server(""); // accepts, never answers
    CurlRequestIssuer issuer(Local(server, 10000ms));
    CancelToken token(CancelToken::Clock::now() + 200ms);

    const auto t0 = std::chrono::steady_clock::now();
    const auto outcome = issuer.Send("m", "p", token);
    const auto took = std::chrono::steady_clock::now() - t0;

    EXPECT_FALSE(outcome.succeeded);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, FailureKind::Cancelled);
    EXPECT_TRUE(outcome.Cancelled());
    EXPECT_GE(took, 200ms);
    EXPECT_LT(took, 3s);
}

TEST(CurlRequestIssuer, SilentServerTimesOut) {
    LoopbackServer server("");
    CurlRequestIssuer issuer(Local(server, 300ms));
    CancelToken token; // no deadline: only the request timeout can end the call

    const auto t0 = std::chrono::steady_clock::now();
    const auto outcome = issuer.Send("m", "p", token);
    const auto took = std::chrono::steady_clock::now() - t0;

    EXPECT_FALSE(outcome.succeeded);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, FailureKind::Timeout);
    EXPECT_LT(took, 3s);
}

TEST(CurlRequestIssuer, HandleReusedAcrossRequests) {
    LoopbackServer server(LoopbackServer::Response(200, "OK", R"({"response":"ok"})"));
    CurlRequestIssuer issuer(Local(server));
    CancelToken token;

    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(issuer.Send("m", "p" + std::to_string(i), token).succeeded);
    }
    EXPECT_NE(server.LastRequest().find("p2"), std::string::npos);
}
