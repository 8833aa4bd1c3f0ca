#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <core/model/transfer_request.h>
#include <core/model/transfer_result.h>
#include <core/util/time.h>

using json = nlohmann::json;

namespace sftpgate::core {

TransferResult TransferResult::Begin(const TransferRequest& request) {
    TransferResult result;
    result.status = TransferStatus::kFailed;
    result.source_file = request.source_file_path;
    result.target_file = request.target_file_path;
    result.target_host = request.target_host;
    result.start_time = Clock::now();
    result.end_time = result.start_time;
    return result;
}

std::string GenerateTransferId(TransferResult::Clock::time_point completed_at) {
    // random_generator is not thread-safe, one per thread
    thread_local boost::uuids::random_generator uuid_gen;
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
                     completed_at.time_since_epoch())
                     .count();
    std::string random_part = boost::uuids::to_string(uuid_gen()).substr(0, 8);
    return "transfer-" + std::to_string(nanos) + "-" + random_part;
}

void to_json(json& j, const TransferResult& result) {
    j = json{
        {"id", result.id},
        {"status", result.status},
        {"source_file", result.source_file},
        {"target_file", result.target_file},
        {"target_host", result.target_host},
        {"bytes_written", result.bytes_written},
        {"start_time", timeutil::FormatRfc3339(result.start_time)},
        {"end_time", timeutil::FormatRfc3339(result.end_time)},
        {"duration", timeutil::FormatDuration(result.duration())},
    };
    if (!result.error.empty()) {
        j["error"] = result.error;
    }
}

} // namespace sftpgate::core
