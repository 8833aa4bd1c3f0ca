#include <core/constant/transfer.h>
#include <core/model/transfer_request.h>

using json = nlohmann::json;

namespace sftpgate::core {

namespace {

std::string requiredString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        throw RequestValidationError(std::string("Key: '") + key + "' Error: field is required");
    }
    if (!it->is_string()) {
        throw RequestValidationError(std::string("Key: '") + key + "' Error: must be a string");
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        throw RequestValidationError(std::string("Key: '") + key + "' Error: field is required");
    }
    return value;
}

std::string optionalString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        throw RequestValidationError(std::string("Key: '") + key + "' Error: must be a string");
    }
    return it->get<std::string>();
}

} // namespace

int TransferRequest::EffectivePort() const {
    return target_port == 0 ? transfer::kDefaultSshPort : target_port;
}

bool TransferRequest::OverridesCredentials() const {
    return !username.empty() || !password.empty() || !private_key_path.empty();
}

void from_json(const json& j, TransferRequest& request) {
    if (!j.is_object()) {
        throw RequestValidationError("request body must be a JSON object");
    }
    request.target_host = requiredString(j, "target_host");
    request.source_file_path = requiredString(j, "source_file_path");
    request.target_file_path = requiredString(j, "target_file_path");

    request.target_port = 0;
    if (auto it = j.find("target_port"); it != j.end() && !it->is_null()) {
        if (!it->is_number_integer()) {
            throw RequestValidationError("Key: 'target_port' Error: must be an integer");
        }
        auto port = it->get<long long>();
        if (port < 0 || port > 65535) {
            throw RequestValidationError("Key: 'target_port' Error: must be between 0 and 65535");
        }
        request.target_port = static_cast<int>(port);
    }

    request.username = optionalString(j, "username");
    request.password = optionalString(j, "password");
    request.private_key_path = optionalString(j, "private_key_path");
}

void to_json(json& j, const TransferRequest& request) {
    j = json{
        {"target_host", request.target_host},
        {"target_port", request.target_port},
        {"source_file_path", request.source_file_path},
        {"target_file_path", request.target_file_path},
    };
    if (!request.username.empty()) {
        j["username"] = request.username;
    }
    if (!request.password.empty()) {
        j["password"] = request.password;
    }
    if (!request.private_key_path.empty()) {
        j["private_key_path"] = request.private_key_path;
    }
}

TransferRequest ParseTransferRequest(const std::string& body) {
    json data;
    try {
        data = json::parse(body);
    } catch (const json::parse_error& e) {
        throw RequestValidationError(e.what());
    }
    return data.get<TransferRequest>();
}

} // namespace sftpgate::core
