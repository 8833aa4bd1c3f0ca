#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace sftpgate::core {

// Status report returned by GET /api/v1/transfers/{id}.
// Transfers are not persisted, so the report is a synthetic stub.
struct TransferProgress {
    std::string id;
    std::string status;
    double percent_complete = 0.0;
    std::int64_t bytes_transferred = 0;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point last_updated;
    std::string error;

    static TransferProgress Synthetic(const std::string& id);
};

void to_json(nlohmann::json& j, const TransferProgress& progress);

} // namespace sftpgate::core
