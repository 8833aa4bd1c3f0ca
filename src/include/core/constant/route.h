#pragma once

#include <string_view>

namespace sftpgate::core {

class ApiRoute {
public:
    static constexpr std::string_view kHealth = "/health";
    static constexpr std::string_view kTransfers = "/api/v1/transfers";
    static constexpr std::string_view kTransferStatus = "/api/v1/transfers/{id}";
};

} // namespace sftpgate::core
