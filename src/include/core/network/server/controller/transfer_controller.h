#pragma once

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <core/network/server/http_server.h>

namespace sftpgate::core {

class TransferOrchestrator;

class TransferController {
public:
    TransferController(HttpServer& server, TransferOrchestrator& orchestrator);
    ~TransferController() = default;

private:
    // POST /api/v1/transfers. Runs the whole transfer before responding.
    boost::asio::awaitable<HttpResponse> onTransfer(const StringRequest& req,
                                                    const RouteParams& params);

    // GET /api/v1/transfers/{id}. Not backed by any store; always reports completion.
    boost::asio::awaitable<HttpResponse> onTransferStatus(const StringRequest& req,
                                                          const RouteParams& params);

    void installRoutes(HttpServer& server);

    TransferOrchestrator& orchestrator_;
};

} // namespace sftpgate::core
