#pragma once

#include <core/ssh/host_key_policy.h>
#include <core/ssh/session_config.h>
#include <core/transfer/transfer_error.h>
#include <string>
#include <system_error>

namespace sftpgate::core {

// Credential failure raised by SessionFactory::Build. code() is kNoCredential, kKeyRead or
// kKeyParse; detail() holds the underlying cause.
class AuthError : public std::system_error {
public:
    AuthError(TransferErrc errc, std::string detail);

    const std::string& detail() const noexcept { return detail_; }

private:
    std::string detail_;
};

/**
 * @brief Builds SessionConfig values for SSH connections
 *
 * No network I/O happens here. The only side effect is reading a private key file.
 */
class SessionFactory {
public:
    explicit SessionFactory(HostKeyPolicy host_key_policy = AcceptAnyHostKey{});

    /**
     * @brief Build an authentication configuration
     *
     * A non-empty password wins over the key path. The username is passed through unchecked.
     *
     * @throws AuthError kNoCredential when both password and key_path are empty,
     *         kKeyRead when the key file cannot be read, kKeyParse when it holds no private key
     */
    SessionConfig Build(const std::string& username,
                        const std::string& password,
                        const std::string& key_path) const;

    const HostKeyPolicy& host_key_policy() const { return host_key_policy_; }

private:
    HostKeyPolicy host_key_policy_;
};

} // namespace sftpgate::core
