#include <core/util/time.h>
#include <cstdint>
#include <ctime>
#include <spdlog/fmt/fmt.h>

namespace sftpgate::core {

namespace timeutil {

namespace {

// Renders `value / unit` with up to `digits` fractional digits, trailing zeros removed.
std::string formatFraction(std::uint64_t value, std::uint64_t unit, int digits) {
    std::string out = std::to_string(value / unit);
    std::uint64_t rest = value % unit;
    if (rest == 0) {
        return out;
    }
    std::string fraction = fmt::format("{:0{}}", rest, digits);
    while (!fraction.empty() && fraction.back() == '0') {
        fraction.pop_back();
    }
    return out + "." + fraction;
}

} // namespace

std::string FormatRfc3339(std::chrono::system_clock::time_point tp) {
    auto since_epoch = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch());
    auto seconds = std::chrono::floor<std::chrono::seconds>(since_epoch);
    auto nanos = (since_epoch - seconds).count();

    std::time_t tt = static_cast<std::time_t>(seconds.count());
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::string out(buf);
    if (nanos > 0) {
        std::string fraction = fmt::format("{:09}", nanos);
        while (fraction.back() == '0') {
            fraction.pop_back();
        }
        out += "." + fraction;
    }
    out += "Z";
    return out;
}

std::string FormatDuration(std::chrono::nanoseconds d) {
    if (d.count() == 0) {
        return "0s";
    }
    bool negative = d.count() < 0;
    auto ns = static_cast<std::uint64_t>(negative ? -d.count() : d.count());
    std::string sign = negative ? "-" : "";

    constexpr std::uint64_t kMicro = 1000;
    constexpr std::uint64_t kMilli = 1000 * kMicro;
    constexpr std::uint64_t kSecond = 1000 * kMilli;
    constexpr std::uint64_t kMinute = 60 * kSecond;
    constexpr std::uint64_t kHour = 60 * kMinute;

    if (ns < kMicro) {
        return sign + std::to_string(ns) + "ns";
    }
    if (ns < kMilli) {
        return sign + formatFraction(ns, kMicro, 3) + "µs";
    }
    if (ns < kSecond) {
        return sign + formatFraction(ns, kMilli, 6) + "ms";
    }

    std::string out = sign;
    if (ns >= kHour) {
        out += std::to_string(ns / kHour) + "h";
        ns %= kHour;
        out += std::to_string(ns / kMinute) + "m";
        ns %= kMinute;
    } else if (ns >= kMinute) {
        out += std::to_string(ns / kMinute) + "m";
        ns %= kMinute;
    }
    return out + formatFraction(ns, kSecond, 9) + "s";
}

} // namespace timeutil

} // namespace sftpgate::core
