#include <cerrno>
#include <core/ssh/session_factory.h>
#include <filesystem>
#include <fstream>
#include <ios>
#include <iterator>
#include <spdlog/spdlog.h>

namespace sftpgate::core {

namespace {

std::string readKeyFile(const std::string& key_path) {
    std::error_code type_ec;
    if (std::filesystem::is_directory(key_path, type_ec)) {
        throw AuthError(TransferErrc::kKeyRead, "read " + key_path + ": is a directory");
    }
    std::ifstream file(key_path, std::ios::binary);
    if (!file.is_open()) {
        auto cause = std::error_code(errno, std::generic_category()).message();
        throw AuthError(TransferErrc::kKeyRead, "open " + key_path + ": " + cause);
    }
    std::string content;
    try {
        // libstdc++ reports a read error (EISDIR and friends) by throwing from underflow.
        content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    } catch (const std::ios_base::failure& e) {
        throw AuthError(TransferErrc::kKeyRead, "read " + key_path + ": " + e.what());
    }
    if (file.bad()) {
        auto cause = std::error_code(errno, std::generic_category()).message();
        throw AuthError(TransferErrc::kKeyRead, "read " + key_path + ": " + cause);
    }
    return content;
}

SshKeyPtr parsePrivateKey(const std::string& key_path, const std::string& content) {
    if (content.empty()) {
        throw AuthError(TransferErrc::kKeyParse, "ssh: no key found in " + key_path);
    }
    ssh_key key = nullptr;
    int rc = ssh_pki_import_privkey_base64(content.c_str(), nullptr, nullptr, nullptr, &key);
    if (rc != SSH_OK || key == nullptr) {
        throw AuthError(TransferErrc::kKeyParse, "ssh: no valid private key found in " + key_path);
    }
    SshKeyPtr owned(key, SshKeyDeleter{});
    if (ssh_key_is_private(owned.get()) != 1) {
        throw AuthError(TransferErrc::kKeyParse, "ssh: " + key_path + " does not hold a private key");
    }
    return owned;
}

} // namespace

AuthError::AuthError(TransferErrc errc, std::string detail)
    : std::system_error(make_error_code(errc), detail)
    , detail_(std::move(detail)) {}

SessionFactory::SessionFactory(HostKeyPolicy host_key_policy)
    : host_key_policy_(std::move(host_key_policy)) {}

SessionConfig SessionFactory::Build(const std::string& username,
                                    const std::string& password,
                                    const std::string& key_path) const {
    SessionConfig config;
    config.username = username;
    config.timeout = transfer::kConnectTimeout;
    config.host_key_policy = host_key_policy_;

    if (!password.empty()) {
        config.auth = PasswordAuth{password};
    } else if (!key_path.empty()) {
        auto content = readKeyFile(key_path);
        config.auth = PublicKeyAuth{key_path, parsePrivateKey(key_path, content)};
    } else {
        throw AuthError(TransferErrc::kNoCredential, "");
    }

    spdlog::debug("Built SSH session config for user '{}' using {} authentication",
                  username,
                  config.uses_password() ? "password" : "public key");
    return config;
}

} // namespace sftpgate::core
