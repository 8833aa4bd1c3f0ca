#pragma once

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <core/network/server/http_server.h>

namespace sftpgate::core {

// Service-level endpoints that do not touch a remote host.
class CommonController {
public:
    explicit CommonController(HttpServer& server);
    ~CommonController() = default;

private:
    boost::asio::awaitable<HttpResponse> onHealth(const StringRequest& req,
                                                  const RouteParams& params);

    void installRoutes(HttpServer& server);
};

} // namespace sftpgate::core
