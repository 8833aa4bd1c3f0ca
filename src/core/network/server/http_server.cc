#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <core/model/api_error.h>
#include <core/network/server/controller/common_controller.h>
#include <core/network/server/controller/transfer_controller.h>
#include <core/network/server/http_server.h>
#include <core/security/open_ssl_provider.h>
#include <core/util/time.h>
#include <spdlog/spdlog.h>

namespace sftpgate::core {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace {

bool isConnectionClosed(const beast::error_code& ec) {
    return ec == http::error::end_of_stream || ec == beast::error::timeout
           || ec == net::error::eof || ec == net::error::operation_aborted
           || ec == net::error::connection_reset || ec == ssl::error::stream_truncated;
}

std::string_view stripQuery(std::string_view target) {
    auto pos = target.find('?');
    return pos == std::string_view::npos ? target : target.substr(0, pos);
}

} // namespace

HttpServer::HttpServer(net::io_context& io_context,
                       const Settings& settings,
                       TransferOrchestrator& orchestrator)
    : io_context_(io_context)
    , settings_(settings.server)
    , acceptor_(io_context)
    , running_(false)
    , rate_limiter_(settings.rate_limit.requests, settings.rate_limit.duration) {
    if (settings_.https()) {
        ssl_context_.emplace(OpenSSLProvider::LoadServerContext(settings_.tls_cert_file,
                                                                settings_.tls_key_file));
    }
    common_controller_ = std::make_unique<CommonController>(*this);
    transfer_controller_ = std::make_unique<TransferController>(*this, orchestrator);
    spdlog::info("HttpServer created.");
}

HttpServer::~HttpServer() {
    if (running_) {
        Stop();
    }
    spdlog::info("HttpServer destroyed.");
}

void HttpServer::AddRoute(std::string_view pattern, http::verb method, RouteHandler&& handler) {
    routes_.push_back(RouteInfo{
        .pattern = std::string(pattern),
        .segments = splitPath(pattern),
        .method = method,
        .handler = std::move(handler),
    });
    spdlog::info("Added route: {} {}", std::string(http::to_string(method)), pattern);
}

void HttpServer::Start(uint16_t port) {
    if (running_) {
        spdlog::warn("Server is already running.");
        return;
    }

    try {
        tcp::endpoint endpoint(tcp::v4(), port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
        running_ = true;
        spdlog::info("{} Server started on port {}", ssl_context_ ? "HTTPS" : "HTTP", port);

        net::co_spawn(io_context_, acceptConnections(), net::detached);

    } catch (const std::exception& e) {
        spdlog::error("Failed to start server on port {}: {}", port, e.what());
        running_ = false;
        if (acceptor_.is_open()) {
            beast::error_code ec;
            acceptor_.close(ec);
        }
    }
}

void HttpServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    beast::error_code ec;
    acceptor_.cancel(ec);
    if (acceptor_.is_open()) {
        acceptor_.close(ec);
    }
    spdlog::info("Server stopped.");
}

HttpResponse HttpServer::Json(http::status status,
                              unsigned int version,
                              bool keep_alive,
                              const json& body) {
    HttpResponse res{status, version};
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.keep_alive(keep_alive);
    res.set(http::field::content_type, "application/json; charset=utf-8");
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

HttpResponse HttpServer::Ok(unsigned int version, bool keep_alive, const json& body) {
    return Json(http::status::ok, version, keep_alive, body);
}

HttpResponse HttpServer::Error(http::status status,
                               unsigned int version,
                               bool keep_alive,
                               std::string_view message,
                               std::string_view details) {
    ApiError error{
        .code = static_cast<int>(status),
        .message = std::string(message),
        .details = std::string(details),
    };
    return Json(status, version, keep_alive, error);
}

HttpResponse HttpServer::NotFound(unsigned int version,
                                  bool keep_alive,
                                  std::string_view error_message) {
    return Error(http::status::not_found, version, keep_alive, error_message);
}

HttpResponse HttpServer::BadRequest(unsigned int version,
                                    bool keep_alive,
                                    std::string_view error_message,
                                    std::string_view details) {
    return Error(http::status::bad_request, version, keep_alive, error_message, details);
}

HttpResponse HttpServer::InternalServerError(unsigned int version,
                                             bool keep_alive,
                                             std::string_view error_message,
                                             std::string_view details) {
    return Error(http::status::internal_server_error, version, keep_alive, error_message, details);
}

HttpResponse HttpServer::MethodNotAllowed(unsigned int version,
                                          bool keep_alive,
                                          std::string_view error_message) {
    return Error(http::status::method_not_allowed, version, keep_alive, error_message);
}

HttpResponse HttpServer::TooManyRequests(unsigned int version,
                                         bool keep_alive,
                                         std::string_view error_message) {
    return Error(http::status::too_many_requests, version, keep_alive, error_message);
}

std::vector<std::string> HttpServer::splitPath(std::string_view path) {
    std::vector<std::string> segments;
    std::size_t pos = 0;
    while (pos < path.size()) {
        auto next = path.find('/', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }
        if (next > pos) {
            segments.emplace_back(path.substr(pos, next - pos));
        }
        pos = next + 1;
    }
    return segments;
}

bool HttpServer::MatchRoute(const std::vector<std::string>& segments,
                            std::string_view path,
                            RouteParams& params) {
    auto parts = splitPath(stripQuery(path));
    if (parts.size() != segments.size()) {
        return false;
    }
    RouteParams captured;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const auto& segment = segments[i];
        if (segment.size() > 2 && segment.front() == '{' && segment.back() == '}') {
            captured[segment.substr(1, segment.size() - 2)] = parts[i];
        } else if (segment != parts[i]) {
            return false;
        }
    }
    params = std::move(captured);
    return true;
}

net::awaitable<void> HttpServer::acceptConnections() {
    while (running_) {
        beast::error_code ec;
        tcp::socket socket = co_await acceptor_.async_accept(net::make_strand(io_context_),
                                                             net::redirect_error(net::use_awaitable,
                                                                                 ec));
        if (ec == net::error::operation_aborted) {
            spdlog::info("Accept operation cancelled.");
            break;
        }
        if (ec) {
            spdlog::error("Error accepting connection: {}", ec.message());
            continue;
        }
        auto executor = socket.get_executor();
        net::co_spawn(executor, handleConnection(std::move(socket)), net::detached);
    }
    spdlog::info("Stopped accepting connections.");
}

net::awaitable<void> HttpServer::handleConnection(tcp::socket socket) {
    beast::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    std::string client_ip = ec ? "unknown" : endpoint.address().to_string();
    spdlog::debug("New connection from: {}:{}", client_ip, ec ? 0 : endpoint.port());

    try {
        if (!ssl_context_) {
            beast::tcp_stream stream(std::move(socket));
            co_await serveRequests(stream, client_ip);
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } else {
            beast::ssl_stream<beast::tcp_stream> stream(beast::tcp_stream(std::move(socket)),
                                                        *ssl_context_);
            beast::get_lowest_layer(stream).expires_after(settings_.read_timeout);
            co_await stream.async_handshake(ssl::stream_base::server,
                                            net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                spdlog::debug("SSL handshake with {} failed: {}", client_ip, ec.message());
                co_return;
            }
            co_await serveRequests(stream, client_ip);
            beast::get_lowest_layer(stream).expires_after(settings_.write_timeout);
            co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
        }
        if (ec && !isConnectionClosed(ec) && ec != net::error::not_connected) {
            spdlog::debug("Shutdown notice: {}", ec.message());
        }
    } catch (const std::exception& e) {
        spdlog::error("Session error with {}: {}", client_ip, e.what());
    }
    spdlog::debug("Connection handling finished for {}.", client_ip);
}

template<typename Stream>
net::awaitable<void> HttpServer::serveRequests(Stream& stream, const std::string& client_ip) {
    beast::flat_buffer buffer;
    bool keep_alive = true;

    while (keep_alive) {
        beast::error_code ec;
        http::request_parser<http::string_body> parser;
        parser.body_limit(settings_.max_request_size);

        beast::get_lowest_layer(stream).expires_after(settings_.read_timeout);
        co_await http::async_read(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
        if (isConnectionClosed(ec)) {
            spdlog::debug("Connection closed by peer {}: {}", client_ip, ec.message());
            break;
        }
        if (ec) {
            spdlog::warn("Failed to read request from {}: {}", client_ip, ec.message());
            auto res = ec == http::error::body_limit
                           ? Error(http::status::payload_too_large,
                                   11,
                                   false,
                                   "Request body too large",
                                   ec.message())
                           : BadRequest(11, false, "Malformed HTTP request", ec.message());
            beast::get_lowest_layer(stream).expires_after(settings_.write_timeout);
            co_await http::async_write(stream, res, net::redirect_error(net::use_awaitable, ec));
            break;
        }

        StringRequest req = parser.release();
        keep_alive = req.keep_alive();

        // A transfer may run far longer than the read timeout.
        beast::get_lowest_layer(stream).expires_never();
        HttpResponse res = co_await Dispatch(std::move(req), client_ip);
        res.keep_alive(keep_alive);

        beast::get_lowest_layer(stream).expires_after(settings_.write_timeout);
        co_await http::async_write(stream, res, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            spdlog::debug("Failed to write response to {}: {}", client_ip, ec.message());
            break;
        }
    }
}

net::awaitable<HttpResponse> HttpServer::Dispatch(StringRequest request, std::string client_ip) {
    const auto started = std::chrono::steady_clock::now();
    const std::string method(request.method_string());
    const std::string path(
        stripQuery(std::string_view(request.target().data(), request.target().size())));
    const auto version = request.version();
    const bool keep_alive = request.keep_alive();

    HttpResponse res;
    bool failed = false;
    std::string failure;
    try {
        if (!rate_limiter_.Allow(client_ip)) {
            spdlog::warn("Rate limit exceeded for {}", client_ip);
            res = TooManyRequests(version, keep_alive);
        } else {
            res = co_await route(request);
        }
    } catch (const std::exception& e) {
        failed = true;
        failure = e.what();
    }
    if (failed) {
        spdlog::error("Error executing handler for {} {}: {}", method, path, failure);
        res = InternalServerError(version, keep_alive, "Internal server error", failure);
    }

    auto latency = std::chrono::steady_clock::now() - started;
    spdlog::info("[API] {} | {} | {} | {}",
                 method,
                 path,
                 std::string(http::obsolete_reason(res.result())),
                 timeutil::FormatDuration(latency));
    co_return res;
}

net::awaitable<HttpResponse> HttpServer::route(const StringRequest& request) {
    const std::string_view target(request.target().data(), request.target().size());
    bool path_matched = false;

    for (const auto& route_info : routes_) {
        RouteParams params;
        if (!MatchRoute(route_info.segments, target, params)) {
            continue;
        }
        path_matched = true;
        if (route_info.method != request.method()) {
            continue;
        }
        co_return co_await route_info.handler(request, params);
    }

    if (path_matched) {
        spdlog::warn("Method not allowed: {} {}",
                     std::string(request.method_string()),
                     std::string(stripQuery(target)));
        co_return MethodNotAllowed(request.version(), request.keep_alive());
    }
    spdlog::warn("Route not found: {}", std::string(stripQuery(target)));
    co_return NotFound(request.version(), request.keep_alive());
}

} // namespace sftpgate::core
