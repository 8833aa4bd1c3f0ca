#pragma once

#include <atomic>
#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <core/network/server/rate_limiter.h>
#include <core/util/config.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sftpgate::core {

class CommonController;
class TransferController;
class TransferOrchestrator;

using StringRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// Values captured by "{name}" segments of a route pattern.
using RouteParams = std::unordered_map<std::string, std::string>;

using RouteHandler
    = std::function<boost::asio::awaitable<HttpResponse>(const StringRequest&, const RouteParams&)>;

// 路由信息结构体
struct RouteInfo {
    std::string pattern;
    std::vector<std::string> segments;
    boost::beast::http::verb method;
    RouteHandler handler;
};

// HTTP(S) 服务器类
class HttpServer {
public:
    HttpServer(boost::asio::io_context& io_context,
               const Settings& settings,
               TransferOrchestrator& orchestrator);

    ~HttpServer();

    // Patterns are literal paths whose segments may be "{name}" placeholders.
    void AddRoute(std::string_view pattern,
                  boost::beast::http::verb method,
                  RouteHandler&& handler);

    // Logs and leaves running() false if the port cannot be bound.
    void Start(uint16_t port);

    void Stop();

    bool running() const { return running_; }

    /**
     * @brief Run one request through the middleware chain and the matching route
     *
     * Order: access log, error handler, rate limiter, router. Never throws.
     */
    boost::asio::awaitable<HttpResponse> Dispatch(StringRequest request, std::string client_ip);

    // Matches path (without query string) against pattern segments, filling params.
    static bool MatchRoute(const std::vector<std::string>& segments,
                           std::string_view path,
                           RouteParams& params);

    static HttpResponse Json(boost::beast::http::status status,
                             unsigned int version,
                             bool keep_alive,
                             const nlohmann::json& body);
    static HttpResponse Ok(unsigned int version, bool keep_alive, const nlohmann::json& body);
    // Body is an ApiError carrying the numeric status as its code.
    static HttpResponse Error(boost::beast::http::status status,
                              unsigned int version,
                              bool keep_alive,
                              std::string_view message,
                              std::string_view details = {});
    static HttpResponse NotFound(unsigned int version,
                                 bool keep_alive,
                                 std::string_view error_message = "Not Found");
    static HttpResponse BadRequest(unsigned int version,
                                   bool keep_alive,
                                   std::string_view error_message = "Bad Request",
                                   std::string_view details = {});
    static HttpResponse InternalServerError(
        unsigned int version,
        bool keep_alive,
        std::string_view error_message = "Internal Server Error",
        std::string_view details = {});
    static HttpResponse MethodNotAllowed(unsigned int version,
                                         bool keep_alive,
                                         std::string_view error_message = "Method Not Allowed");
    static HttpResponse TooManyRequests(unsigned int version,
                                        bool keep_alive,
                                        std::string_view error_message = "Rate limit exceeded");

private:
    // 接受连接
    boost::asio::awaitable<void> acceptConnections();

    // 处理连接
    boost::asio::awaitable<void> handleConnection(boost::asio::ip::tcp::socket socket);

    template<typename Stream>
    boost::asio::awaitable<void> serveRequests(Stream& stream, const std::string& client_ip);

    // 处理请求
    boost::asio::awaitable<HttpResponse> route(const StringRequest& request);

    static std::vector<std::string> splitPath(std::string_view path);

    boost::asio::io_context& io_context_;
    ServerSettings settings_;
    std::optional<boost::asio::ssl::context> ssl_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::atomic<bool> running_;
    RateLimiter rate_limiter_;
    std::vector<RouteInfo> routes_;
    std::unique_ptr<CommonController> common_controller_;
    std::unique_ptr<TransferController> transfer_controller_;
};

} // namespace sftpgate::core
