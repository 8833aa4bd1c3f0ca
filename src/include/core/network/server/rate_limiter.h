#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sftpgate::core {

/**
 * @brief Per-client request counter over a fixed time window
 *
 * A client may make `limit` requests per window. Its window starts with its first request.
 * Clients idle for longer than one window are forgotten. All members are thread-safe.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    RateLimiter(std::size_t limit, std::chrono::seconds window);

    // Records one request from client. Returns false if it exceeds the limit.
    bool Allow(const std::string& client, Clock::time_point now = Clock::now());

    std::size_t tracked_clients() const;

private:
    struct ClientWindow {
        std::size_t count = 0;
        Clock::time_point window_start;
        Clock::time_point last_seen;
    };

    void prune(Clock::time_point now);

    const std::size_t limit_;
    const Clock::duration window_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ClientWindow> clients_;
};

} // namespace sftpgate::core
