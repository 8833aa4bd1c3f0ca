#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace sftpgate::core {

struct TransferRequest;

enum class TransferStatus {
    kCompleted,
    kFailed,
};

NLOHMANN_JSON_SERIALIZE_ENUM(TransferStatus,
                             {
                                 {TransferStatus::kCompleted, "completed"},
                                 {TransferStatus::kFailed, "failed"},
                             })

struct TransferResult {
    using Clock = std::chrono::system_clock;

    std::string id;
    TransferStatus status = TransferStatus::kFailed;
    std::string source_file;
    std::string target_file;
    std::string target_host;
    std::int64_t bytes_written = 0;
    Clock::time_point start_time;
    Clock::time_point end_time;
    std::string error; // empty unless status is kFailed

    // Starts the clock and echoes the request's paths and host.
    static TransferResult Begin(const TransferRequest& request);

    std::chrono::nanoseconds duration() const { return end_time - start_time; }
    bool completed() const { return status == TransferStatus::kCompleted; }
};

// "transfer-<unix nanos>-<8 hex>", derived from the given completion time.
std::string GenerateTransferId(TransferResult::Clock::time_point completed_at);

void to_json(nlohmann::json& j, const TransferResult& result);

} // namespace sftpgate::core
