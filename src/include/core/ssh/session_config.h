#pragma once

#include <chrono>
#include <core/constant/transfer.h>
#include <core/ssh/host_key_policy.h>
#include <libssh/libssh.h>
#include <memory>
#include <string>
#include <variant>

namespace sftpgate::core {

struct SshKeyDeleter {
    void operator()(ssh_key key) const { ssh_key_free(key); }
};

// ssh_key is a pointer typedef; the shared_ptr owns the pointee.
using SshKeyPtr = std::shared_ptr<std::remove_pointer_t<ssh_key>>;

struct PasswordAuth {
    std::string password;
};

struct PublicKeyAuth {
    std::string key_path; // for logging only
    SshKeyPtr key;
};

using AuthMethod = std::variant<PasswordAuth, PublicKeyAuth>;

// Everything needed to open an authenticated SSH connection, minus the address.
struct SessionConfig {
    std::string username;
    AuthMethod auth;
    std::chrono::seconds timeout = transfer::kConnectTimeout;
    HostKeyPolicy host_key_policy = AcceptAnyHostKey{};

    bool uses_password() const { return std::holds_alternative<PasswordAuth>(auth); }
};

} // namespace sftpgate::core
