#include <core/constant/route.h>
#include <core/model/transfer_progress.h>
#include <core/model/transfer_request.h>
#include <core/network/server/controller/transfer_controller.h>
#include <core/transfer/transfer_orchestrator.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <system_error>

namespace net = boost::asio;
namespace http = boost::beast::http;
using json = nlohmann::json;

namespace sftpgate::core {

TransferController::TransferController(HttpServer& server, TransferOrchestrator& orchestrator)
    : orchestrator_(orchestrator) {
    installRoutes(server);
}

net::awaitable<HttpResponse> TransferController::onTransfer(const StringRequest& req,
                                                            const RouteParams&) {
    spdlog::debug("TransferController::onTransfer");
    TransferRequest request;
    try {
        request = ParseTransferRequest(req.body());
    } catch (const RequestValidationError& e) {
        spdlog::info("Rejected transfer request: {}", e.what());
        co_return HttpServer::BadRequest(req.version(),
                                         req.keep_alive(),
                                         "Invalid request payload",
                                         e.what());
    }

    spdlog::info("Transfer {} -> {}:{}{}",
                 request.source_file_path,
                 request.target_host,
                 request.EffectivePort(),
                 request.target_file_path);

    std::error_code ec;
    TransferResult result = orchestrator_.Transfer(request, ec);
    if (ec) {
        co_return HttpServer::Json(http::status::internal_server_error,
                                   req.version(),
                                   req.keep_alive(),
                                   result);
    }
    co_return HttpServer::Ok(req.version(), req.keep_alive(), result);
}

net::awaitable<HttpResponse> TransferController::onTransferStatus(const StringRequest& req,
                                                                  const RouteParams& params) {
    auto it = params.find("id");
    if (it == params.end() || it->second.empty()) {
        co_return HttpServer::BadRequest(req.version(), req.keep_alive(), "missing transfer id");
    }
    spdlog::debug("TransferController::onTransferStatus {}", it->second);
    co_return HttpServer::Ok(req.version(),
                             req.keep_alive(),
                             TransferProgress::Synthetic(it->second));
}

void TransferController::installRoutes(HttpServer& server) {
    server.AddRoute(ApiRoute::kTransfers,
                    http::verb::post,
                    std::bind(&TransferController::onTransfer,
                              this,
                              std::placeholders::_1,
                              std::placeholders::_2));
    server.AddRoute(ApiRoute::kTransferStatus,
                    http::verb::get,
                    std::bind(&TransferController::onTransferStatus,
                              this,
                              std::placeholders::_1,
                              std::placeholders::_2));
}

} // namespace sftpgate::core
