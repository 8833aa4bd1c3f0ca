#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace sftpgate::core {

// Raised when a request payload is malformed or misses a required field. Mapped to HTTP 400.
class RequestValidationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct TransferRequest {
    std::string target_host;
    int target_port = 0; // 0 means the default SSH port
    std::string source_file_path;
    std::string target_file_path;

    // Per-request credentials. Setting any of them replaces the service defaults entirely.
    std::string username;
    std::string password;
    std::string private_key_path;

    int EffectivePort() const;
    bool OverridesCredentials() const;
};

// Strict parsing: throws RequestValidationError naming the offending field.
void from_json(const nlohmann::json& j, TransferRequest& request);

void to_json(nlohmann::json& j, const TransferRequest& request);

TransferRequest ParseTransferRequest(const std::string& body);

} // namespace sftpgate::core
