#include <chrono>
#include <core/constant/route.h>
#include <core/network/server/controller/common_controller.h>
#include <core/util/time.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace net = boost::asio;
namespace http = boost::beast::http;
using json = nlohmann::json;

namespace sftpgate::core {

CommonController::CommonController(HttpServer& server) {
    installRoutes(server);
}

net::awaitable<HttpResponse> CommonController::onHealth(const StringRequest& req,
                                                        const RouteParams&) {
    spdlog::debug("CommonController::onHealth");
    json body{
        {"status", "ok"},
        {"timestamp", timeutil::FormatRfc3339(std::chrono::system_clock::now())},
    };
    co_return HttpServer::Ok(req.version(), req.keep_alive(), body);
}

void CommonController::installRoutes(HttpServer& server) {
    server.AddRoute(ApiRoute::kHealth,
                    http::verb::get,
                    std::bind(&CommonController::onHealth,
                              this,
                              std::placeholders::_1,
                              std::placeholders::_2));
}

} // namespace sftpgate::core
