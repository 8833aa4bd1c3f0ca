#include "fake_remote.h"
#include "test_util.h"
#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <core/network/server/http_server.h>
#include <core/transfer/transfer_orchestrator.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace sftpgate::core;
using namespace sftpgate::core::testing;
namespace net = boost::asio;
namespace http = boost::beast::http;
using json = nlohmann::json;

namespace {

class HttpServerTest : public ::testing::Test {
protected:
    HttpServerTest()
        : remote_(std::make_shared<FakeRemoteState>())
        , orchestrator_(CredentialDefaults{"svc", "svc-secret", ""},
                        SessionFactory(),
                        std::make_shared<FakeConnector>(remote_)) {
        settings_.rate_limit.requests = 100;
    }

    HttpServer& server() {
        if (!server_) {
            server_ = std::make_unique<HttpServer>(io_context_, settings_, orchestrator_);
        }
        return *server_;
    }

    HttpResponse dispatch(http::verb method,
                          std::string target,
                          std::string body = {},
                          std::string client = "127.0.0.1") {
        StringRequest request{method, target, 11};
        request.set(http::field::content_type, "application/json");
        request.body() = std::move(body);
        request.prepare_payload();

        HttpResponse response;
        bool done = false;
        net::co_spawn(io_context_,
                      server().Dispatch(std::move(request), std::move(client)),
                      [&](std::exception_ptr e, HttpResponse res) {
                          if (e) {
                              std::rethrow_exception(e);
                          }
                          response = std::move(res);
                          done = true;
                      });
        io_context_.restart();
        io_context_.run();
        EXPECT_TRUE(done);
        return response;
    }

    static json body(const HttpResponse& response) { return json::parse(response.body()); }

    std::string transferBody(const std::string& source, const std::string& target) {
        return json{
            {"target_host", "10.0.0.5"},
            {"source_file_path", source},
            {"target_file_path", target},
        }
            .dump();
    }

    net::io_context io_context_;
    Settings settings_;
    std::shared_ptr<FakeRemoteState> remote_;
    TransferOrchestrator orchestrator_;
    std::unique_ptr<HttpServer> server_;
    TempDir tmp_;
};

TEST_F(HttpServerTest, HealthReportsOk) {
    auto res = dispatch(http::verb::get, "/health");

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/json; charset=utf-8");
    auto j = body(res);
    EXPECT_EQ(j["status"], "ok");
    EXPECT_TRUE(j["timestamp"].is_string());
}

TEST_F(HttpServerTest, TransferSucceeds) {
    auto source = tmp_.Write("a.txt", "hello");

    auto res = dispatch(http::verb::post,
                        "/api/v1/transfers",
                        transferBody(source.string(), "/remote/dir/a.txt"));

    ASSERT_EQ(res.result(), http::status::ok) << res.body();
    auto j = body(res);
    EXPECT_EQ(j["status"], "completed");
    EXPECT_EQ(j["bytes_written"], 5);
    EXPECT_EQ(j["target_host"], "10.0.0.5");
    EXPECT_FALSE(j.contains("error"));
    EXPECT_EQ(remote_->files["/remote/dir/a.txt"], "hello");
}

TEST_F(HttpServerTest, FailedTransferReturnsResultWith500) {
    remote_->fail_at = TransferErrc::kConnect;
    auto source = tmp_.Write("a.txt", "hello");

    auto res = dispatch(http::verb::post,
                        "/api/v1/transfers",
                        transferBody(source.string(), "/remote/a.txt"));

    EXPECT_EQ(res.result(), http::status::internal_server_error);
    auto j = body(res);
    EXPECT_EQ(j["status"], "failed");
    EXPECT_EQ(j["bytes_written"], 0);
    EXPECT_EQ(j["error"].get<std::string>().rfind("failed to connect to SSH server", 0), 0u);
}

TEST_F(HttpServerTest, InvalidPayloadIs400) {
    auto res = dispatch(http::verb::post,
                        "/api/v1/transfers",
                        R"({"target_host":"h","source_file_path":"/a"})");

    EXPECT_EQ(res.result(), http::status::bad_request);
    auto j = body(res);
    EXPECT_EQ(j["code"], 400);
    EXPECT_EQ(j["message"], "Invalid request payload");
    EXPECT_NE(j["details"].get<std::string>().find("target_file_path"), std::string::npos);
    EXPECT_EQ(remote_->dials, 0);
}

TEST_F(HttpServerTest, MalformedJsonIs400) {
    auto res = dispatch(http::verb::post, "/api/v1/transfers", "{not json");
    EXPECT_EQ(res.result(), http::status::bad_request);
}

TEST_F(HttpServerTest, StatusStubEchoesId) {
    auto res = dispatch(http::verb::get, "/api/v1/transfers/transfer-42-deadbeef?verbose=1");

    EXPECT_EQ(res.result(), http::status::ok);
    auto j = body(res);
    EXPECT_EQ(j["id"], "transfer-42-deadbeef");
    EXPECT_EQ(j["status"], "completed");
    EXPECT_EQ(j["bytes_transferred"], 1024);
}

TEST_F(HttpServerTest, UnknownPathIs404) {
    auto res = dispatch(http::verb::get, "/api/v2/nothing");

    EXPECT_EQ(res.result(), http::status::not_found);
    EXPECT_EQ(body(res)["code"], 404);
}

TEST_F(HttpServerTest, WrongMethodIs405) {
    auto res = dispatch(http::verb::get, "/api/v1/transfers");

    EXPECT_EQ(res.result(), http::status::method_not_allowed);
    EXPECT_EQ(body(res)["code"], 405);
}

TEST_F(HttpServerTest, RateLimitIs429PerClient) {
    settings_.rate_limit.requests = 2;

    EXPECT_EQ(dispatch(http::verb::get, "/health", {}, "10.1.1.1").result(), http::status::ok);
    EXPECT_EQ(dispatch(http::verb::get, "/health", {}, "10.1.1.1").result(), http::status::ok);
    auto limited = dispatch(http::verb::get, "/health", {}, "10.1.1.1");
    EXPECT_EQ(limited.result(), http::status::too_many_requests);
    auto j = body(limited);
    EXPECT_EQ(j["code"], 429);
    EXPECT_EQ(j["message"], "Rate limit exceeded");

    EXPECT_EQ(dispatch(http::verb::get, "/health", {}, "10.1.1.2").result(), http::status::ok);
}

TEST_F(HttpServerTest, HandlerExceptionIs500) {
    server().AddRoute("/boom", http::verb::get, [](const StringRequest&, const RouteParams&)
                          -> net::awaitable<HttpResponse> {
        throw std::runtime_error("kaboom");
        co_return HttpResponse{};
    });

    auto res = dispatch(http::verb::get, "/boom");

    EXPECT_EQ(res.result(), http::status::internal_server_error);
    auto j = body(res);
    EXPECT_EQ(j["message"], "Internal server error");
    EXPECT_EQ(j["details"], "kaboom");
}

TEST(RouteMatchTest, CapturesPlaceholders) {
    std::vector<std::string> segments{"api", "v1", "transfers", "{id}"};
    RouteParams params;

    EXPECT_TRUE(HttpServer::MatchRoute(segments, "/api/v1/transfers/abc", params));
    EXPECT_EQ(params["id"], "abc");
    EXPECT_TRUE(HttpServer::MatchRoute(segments, "/api/v1/transfers/abc/", params));
    EXPECT_FALSE(HttpServer::MatchRoute(segments, "/api/v1/transfers", params));
    EXPECT_FALSE(HttpServer::MatchRoute(segments, "/api/v1/transfers/abc/def", params));
    EXPECT_FALSE(HttpServer::MatchRoute(segments, "/api/v2/transfers/abc", params));
}

} // namespace
