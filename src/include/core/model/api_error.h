#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace sftpgate::core {

// Generic error body: {code, message, details?}
struct ApiError {
    int code = 0;
    std::string message;
    std::string details;
};

inline void to_json(nlohmann::json& j, const ApiError& error) {
    j = nlohmann::json{{"code", error.code}, {"message", error.message}};
    if (!error.details.empty()) {
        j["details"] = error.details;
    }
}

} // namespace sftpgate::core
