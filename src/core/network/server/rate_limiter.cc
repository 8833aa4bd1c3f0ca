#include <core/network/server/rate_limiter.h>

namespace sftpgate::core {

RateLimiter::RateLimiter(std::size_t limit, std::chrono::seconds window)
    : limit_(limit)
    , window_(window) {}

bool RateLimiter::Allow(const std::string& client, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    prune(now);

    auto [it, inserted] = clients_.try_emplace(client);
    auto& entry = it->second;
    if (inserted || now - entry.window_start > window_) {
        entry.count = 0;
        entry.window_start = now;
    }
    entry.last_seen = now;

    if (entry.count >= limit_) {
        return false;
    }
    ++entry.count;
    return true;
}

std::size_t RateLimiter::tracked_clients() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

void RateLimiter::prune(Clock::time_point now) {
    for (auto it = clients_.begin(); it != clients_.end();) {
        if (now - it->second.last_seen > window_) {
            it = clients_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace sftpgate::core
