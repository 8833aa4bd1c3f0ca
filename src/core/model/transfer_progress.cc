#include <core/model/transfer_progress.h>
#include <core/util/time.h>

using json = nlohmann::json;

namespace sftpgate::core {

TransferProgress TransferProgress::Synthetic(const std::string& id) {
    auto now = std::chrono::system_clock::now();
    return TransferProgress{
        .id = id,
        .status = "completed",
        .percent_complete = 100.0,
        .bytes_transferred = 1024,
        .start_time = now - std::chrono::minutes(1),
        .last_updated = now,
        .error = {},
    };
}

void to_json(json& j, const TransferProgress& progress) {
    j = json{
        {"id", progress.id},
        {"status", progress.status},
        {"percent_complete", progress.percent_complete},
        {"bytes_transferred", progress.bytes_transferred},
        {"start_time", timeutil::FormatRfc3339(progress.start_time)},
        {"last_updated", timeutil::FormatRfc3339(progress.last_updated)},
    };
    if (!progress.error.empty()) {
        j["error"] = progress.error;
    }
}

} // namespace sftpgate::core
