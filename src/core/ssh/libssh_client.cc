#include <core/ssh/libssh_client.h>
#include <fcntl.h>
#include <mutex>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace sftpgate::core {

namespace {

std::string sftpErrorString(int code) {
    switch (code) {
    case SSH_FX_OK:
        return "ok";
    case SSH_FX_EOF:
        return "end of file";
    case SSH_FX_NO_SUCH_FILE:
        return "file does not exist";
    case SSH_FX_PERMISSION_DENIED:
        return "permission denied";
    case SSH_FX_FAILURE:
        return "failure";
    case SSH_FX_BAD_MESSAGE:
        return "bad message";
    case SSH_FX_NO_CONNECTION:
        return "no connection";
    case SSH_FX_CONNECTION_LOST:
        return "connection lost";
    case SSH_FX_OP_UNSUPPORTED:
        return "operation unsupported";
    case SSH_FX_INVALID_HANDLE:
        return "invalid handle";
    case SSH_FX_NO_SUCH_PATH:
        return "no such path";
    case SSH_FX_FILE_ALREADY_EXISTS:
        return "file already exists";
    case SSH_FX_WRITE_PROTECT:
        return "write protected filesystem";
    case SSH_FX_NO_MEDIA:
        return "no media";
    default:
        return fmt::format("sftp status {}", code);
    }
}

std::string sftpFailure(const std::string& op,
                        const std::string& path,
                        sftp_session sftp,
                        ssh_session session) {
    int code = sftp_get_error(sftp);
    if (code == SSH_FX_OK) {
        // Transport-level failure, the SFTP status was never received.
        return fmt::format("{} {}: {}", op, path, ssh_get_error(session));
    }
    return fmt::format("{} {}: {}", op, path, sftpErrorString(code));
}

std::string knownHostsStateString(ssh_known_hosts_e state) {
    switch (state) {
    case SSH_KNOWN_HOSTS_OK:
        return "host key is known";
    case SSH_KNOWN_HOSTS_CHANGED:
        return "host key has changed";
    case SSH_KNOWN_HOSTS_OTHER:
        return "host presented a key of another type than the one on record";
    case SSH_KNOWN_HOSTS_NOT_FOUND:
        return "known_hosts file not found";
    case SSH_KNOWN_HOSTS_UNKNOWN:
        return "host is unknown";
    case SSH_KNOWN_HOSTS_ERROR:
    default:
        return "error while checking known hosts";
    }
}

std::string serverFingerprint(ssh_session session) {
    ssh_key server_key = nullptr;
    if (ssh_get_server_publickey(session, &server_key) != SSH_OK) {
        throw RemoteError(fmt::format("unable to read server host key: {}", ssh_get_error(session)));
    }
    std::unique_ptr<std::remove_pointer_t<ssh_key>, SshKeyDeleter> key_guard(server_key);

    unsigned char* hash = nullptr;
    size_t hash_len = 0;
    if (ssh_get_publickey_hash(server_key, SSH_PUBLICKEY_HASH_SHA256, &hash, &hash_len) != 0) {
        throw RemoteError("unable to hash server host key");
    }
    char* hex = ssh_get_fingerprint_hash(SSH_PUBLICKEY_HASH_SHA256, hash, hash_len);
    ssh_clean_pubkey_hash(&hash);
    if (hex == nullptr) {
        throw RemoteError("unable to format server host key fingerprint");
    }
    std::string fingerprint(hex);
    ssh_string_free_char(hex);
    return fingerprint;
}

void setOption(ssh_session session, ssh_options_e option, const void* value, const char* name) {
    if (ssh_options_set(session, option, value) != SSH_OK) {
        throw RemoteError(fmt::format("unable to set SSH option {}: {}", name, ssh_get_error(session)));
    }
}

} // namespace

// LibsshRemoteFile

LibsshRemoteFile::LibsshRemoteFile(sftp_file file,
                                   sftp_session sftp,
                                   ssh_session session,
                                   std::string path)
    : file_(file)
    , sftp_(sftp)
    , session_(session)
    , path_(std::move(path)) {}

LibsshRemoteFile::~LibsshRemoteFile() {
    if (file_ != nullptr) {
        if (sftp_close(file_) != SSH_NO_ERROR) {
            spdlog::warn("Failed to close remote file {} during cleanup", path_);
        }
        file_ = nullptr;
    }
}

std::size_t LibsshRemoteFile::Write(const char* data, std::size_t size) {
    if (file_ == nullptr) {
        throw RemoteError("write " + path_ + ": file already closed");
    }
    ssize_t written = sftp_write(file_, data, size);
    if (written < 0) {
        throw RemoteError(sftpFailure("write", path_, sftp_, session_));
    }
    return static_cast<std::size_t>(written);
}

void LibsshRemoteFile::Close() {
    if (file_ == nullptr) {
        return;
    }
    // sftp_close releases the handle even when it reports an error
    int rc = sftp_close(file_);
    file_ = nullptr;
    if (rc != SSH_NO_ERROR) {
        throw RemoteError(sftpFailure("close", path_, sftp_, session_));
    }
}

// LibsshSftpSession

LibsshSftpSession::LibsshSftpSession(SftpSessionPtr sftp, ssh_session session)
    : sftp_(std::move(sftp))
    , session_(session) {}

std::string LibsshSftpSession::lastError(const std::string& op, const std::string& path) const {
    return sftpFailure(op, path, sftp_.get(), session_);
}

std::optional<RemoteEntryType> LibsshSftpSession::Stat(const std::string& path) {
    sftp_attributes attributes = sftp_stat(sftp_.get(), path.c_str());
    if (attributes == nullptr) {
        int code = sftp_get_error(sftp_.get());
        if (code == SSH_FX_NO_SUCH_FILE || code == SSH_FX_NO_SUCH_PATH) {
            return std::nullopt;
        }
        throw RemoteError(lastError("stat", path));
    }
    RemoteEntryType type = RemoteEntryType::kOther;
    if (attributes->type == SSH_FILEXFER_TYPE_DIRECTORY) {
        type = RemoteEntryType::kDirectory;
    } else if (attributes->type == SSH_FILEXFER_TYPE_REGULAR) {
        type = RemoteEntryType::kFile;
    }
    sftp_attributes_free(attributes);
    return type;
}

void LibsshSftpSession::MakeDirectory(const std::string& path) {
    if (sftp_mkdir(sftp_.get(), path.c_str(), transfer::kRemoteDirectoryMode) != SSH_OK) {
        throw RemoteError(lastError("mkdir", path));
    }
}

std::unique_ptr<RemoteFile> LibsshSftpSession::Create(const std::string& path) {
    sftp_file file = sftp_open(sftp_.get(),
                               path.c_str(),
                               O_WRONLY | O_CREAT | O_TRUNC,
                               transfer::kRemoteFileMode);
    if (file == nullptr) {
        throw RemoteError(lastError("open", path));
    }
    return std::make_unique<LibsshRemoteFile>(file, sftp_.get(), session_, path);
}

// LibsshSession

LibsshSession::LibsshSession(SshSessionPtr session)
    : session_(std::move(session)) {}

std::unique_ptr<SftpSession> LibsshSession::OpenSftp() {
    SftpSessionPtr sftp(sftp_new(session_.get()));
    if (!sftp) {
        throw RemoteError(fmt::format("sftp_new: {}", ssh_get_error(session_.get())));
    }
    if (sftp_init(sftp.get()) != SSH_OK) {
        int code = sftp_get_error(sftp.get());
        throw RemoteError(fmt::format("sftp_init: {} ({})",
                                      ssh_get_error(session_.get()),
                                      sftpErrorString(code)));
    }
    return std::make_unique<LibsshSftpSession>(std::move(sftp), session_.get());
}

// LibsshConnector

void LibsshConnector::InitLibrary() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (ssh_init() != SSH_OK) {
            throw RemoteError("ssh_init failed");
        }
    });
}

void LibsshConnector::FinalizeLibrary() {
    if (ssh_finalize() != SSH_OK) {
        spdlog::warn("ssh_finalize failed");
    }
}

std::unique_ptr<RemoteSession> LibsshConnector::Connect(const SessionConfig& config,
                                                        const std::string& host,
                                                        int port) {
    SshSessionPtr session(ssh_new());
    if (!session) {
        throw RemoteError("unable to allocate SSH session");
    }

    unsigned int remote_port = static_cast<unsigned int>(port);
    long timeout = static_cast<long>(config.timeout.count());
    setOption(session.get(), SSH_OPTIONS_HOST, host.c_str(), "host");
    setOption(session.get(), SSH_OPTIONS_PORT, &remote_port, "port");
    setOption(session.get(), SSH_OPTIONS_TIMEOUT, &timeout, "timeout");
    if (!config.username.empty()) {
        setOption(session.get(), SSH_OPTIONS_USER, config.username.c_str(), "user");
    } else {
        spdlog::warn("Connecting to {}:{} without a username, libssh falls back to the local user",
                     host,
                     port);
    }
    if (const auto* known_hosts = std::get_if<KnownHostsFile>(&config.host_key_policy)) {
        if (!known_hosts->path.empty()) {
            auto path = known_hosts->path.string();
            setOption(session.get(), SSH_OPTIONS_KNOWNHOSTS, path.c_str(), "knownhosts");
        }
    }

    spdlog::debug("Dialing {}:{} (timeout {}s)", host, port, timeout);
    if (ssh_connect(session.get()) != SSH_OK) {
        throw RemoteError(
            fmt::format("dial tcp {}:{}: {}", host, port, ssh_get_error(session.get())));
    }

    verifyHostKey(session.get(), host, port, config.host_key_policy);
    authenticate(session.get(), config);

    spdlog::debug("SSH session established with {}:{}", host, port);
    return std::make_unique<LibsshSession>(std::move(session));
}

void LibsshConnector::verifyHostKey(ssh_session session,
                                    const std::string& host,
                                    int port,
                                    const HostKeyPolicy& policy) {
    if (std::holds_alternative<AcceptAnyHostKey>(policy)) {
        spdlog::warn("Accepting host key {} of {}:{} without verification",
                     serverFingerprint(session),
                     host,
                     port);
        return;
    }

    if (const auto* pinned = std::get_if<PinnedHostKey>(&policy)) {
        auto actual = serverFingerprint(session);
        if (!FingerprintsMatch(pinned->fingerprint, actual)) {
            throw RemoteError(fmt::format("ssh: host key mismatch for {}:{}: got {}, want {}",
                                          host,
                                          port,
                                          actual,
                                          pinned->fingerprint));
        }
        return;
    }

    ssh_known_hosts_e state = ssh_session_is_known_server(session);
    if (state != SSH_KNOWN_HOSTS_OK) {
        throw RemoteError(fmt::format("ssh: host key verification failed for {}:{}: {}",
                                      host,
                                      port,
                                      knownHostsStateString(state)));
    }
}

void LibsshConnector::authenticate(ssh_session session, const SessionConfig& config) {
    int rc = SSH_AUTH_ERROR;
    if (const auto* password = std::get_if<PasswordAuth>(&config.auth)) {
        rc = ssh_userauth_password(session, nullptr, password->password.c_str());
    } else {
        const auto& public_key = std::get<PublicKeyAuth>(config.auth);
        rc = ssh_userauth_publickey(session, nullptr, public_key.key.get());
    }
    if (rc != SSH_AUTH_SUCCESS) {
        throw RemoteError(fmt::format("ssh: handshake failed: unable to authenticate as '{}': {}",
                                      config.username,
                                      ssh_get_error(session)));
    }
}

} // namespace sftpgate::core
