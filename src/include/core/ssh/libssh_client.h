/**
 * @file libssh_client.h
 * @brief libssh-backed implementation of the remote client interfaces
 */
#pragma once

#include <core/ssh/remote_client.h>
#include <libssh/libssh.h>
#include <libssh/sftp.h>
#include <memory>
#include <type_traits>

namespace sftpgate::core {

struct SshSessionDeleter {
    void operator()(ssh_session session) const {
        if (ssh_is_connected(session)) {
            ssh_disconnect(session);
        }
        ssh_free(session);
    }
};

struct SftpSessionDeleter {
    void operator()(sftp_session sftp) const { sftp_free(sftp); }
};

using SshSessionPtr = std::unique_ptr<std::remove_pointer_t<ssh_session>, SshSessionDeleter>;
using SftpSessionPtr = std::unique_ptr<std::remove_pointer_t<sftp_session>, SftpSessionDeleter>;

class LibsshRemoteFile : public RemoteFile {
public:
    LibsshRemoteFile(sftp_file file, sftp_session sftp, ssh_session session, std::string path);
    ~LibsshRemoteFile() override;

    LibsshRemoteFile(const LibsshRemoteFile&) = delete;
    LibsshRemoteFile& operator=(const LibsshRemoteFile&) = delete;

    std::size_t Write(const char* data, std::size_t size) override;
    void Close() override;

private:
    sftp_file file_;
    sftp_session sftp_;
    ssh_session session_;
    std::string path_;
};

class LibsshSftpSession : public SftpSession {
public:
    // session must outlive this object.
    LibsshSftpSession(SftpSessionPtr sftp, ssh_session session);

    std::optional<RemoteEntryType> Stat(const std::string& path) override;
    void MakeDirectory(const std::string& path) override;
    std::unique_ptr<RemoteFile> Create(const std::string& path) override;

private:
    std::string lastError(const std::string& op, const std::string& path) const;

    SftpSessionPtr sftp_;
    ssh_session session_;
};

class LibsshSession : public RemoteSession {
public:
    explicit LibsshSession(SshSessionPtr session);

    std::unique_ptr<SftpSession> OpenSftp() override;

private:
    SshSessionPtr session_;
};

class LibsshConnector : public RemoteConnector {
public:
    /**
     * @brief Initialize the libssh library
     *
     * Call once at startup, before any worker thread connects.
     * Safe to call multiple times.
     */
    static void InitLibrary();

    // Releases libssh global state. Call after every session is gone.
    static void FinalizeLibrary();

    std::unique_ptr<RemoteSession> Connect(const SessionConfig& config,
                                           const std::string& host,
                                           int port) override;

private:
    static void verifyHostKey(ssh_session session,
                              const std::string& host,
                              int port,
                              const HostKeyPolicy& policy);
    static void authenticate(ssh_session session, const SessionConfig& config);
};

} // namespace sftpgate::core
