#pragma once

#include <core/model/transfer_request.h>
#include <core/model/transfer_result.h>
#include <core/ssh/remote_client.h>
#include <core/ssh/session_factory.h>
#include <memory>
#include <string>
#include <system_error>

namespace sftpgate::core {

// Service-wide credentials used when a request brings none of its own.
struct CredentialDefaults {
    std::string username;
    std::string password;
    std::string private_key_path;
};

/**
 * @brief Drives one file transfer: credentials, dial, SFTP, mkdir, create, copy
 *
 * Stages run in order and each runs exactly once. The first failure ends the transfer.
 * The orchestrator holds no mutable state, so one instance serves concurrent requests.
 */
class TransferOrchestrator {
public:
    TransferOrchestrator(CredentialDefaults defaults,
                         SessionFactory session_factory,
                         std::shared_ptr<RemoteConnector> connector);

    /**
     * @brief Copy request.source_file_path to request.target_file_path on the remote host
     *
     * Never throws for stage failures. On failure the result has status kFailed, its error
     * names the stage, and ec holds the matching TransferErrc. On success ec is cleared.
     */
    TransferResult Transfer(const TransferRequest& request, std::error_code& ec) const;

    // Resolves the credentials for a request into a session configuration. Throws AuthError.
    SessionConfig ResolveSessionConfig(const TransferRequest& request) const;

private:
    TransferResult& fail(TransferResult& result,
                         TransferErrc errc,
                         const std::string& detail,
                         std::error_code& ec) const;

    CredentialDefaults defaults_;
    SessionFactory session_factory_;
    std::shared_ptr<RemoteConnector> connector_;
};

} // namespace sftpgate::core
