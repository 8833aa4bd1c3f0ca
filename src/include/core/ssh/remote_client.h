#pragma once

#include <core/ssh/session_config.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace sftpgate::core {

// Any failure reported by the remote side or the SSH library.
class RemoteError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class RemoteEntryType {
    kFile,
    kDirectory,
    kOther,
};

// A remote file opened for writing. Destruction closes it if Close() was not called.
class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    // Returns how many bytes were accepted, possibly fewer than size. Throws RemoteError.
    virtual std::size_t Write(const char* data, std::size_t size) = 0;

    // Flushes and closes the handle. Throws RemoteError if the server rejects the close.
    virtual void Close() = 0;
};

// SFTP sub-protocol session layered on a RemoteSession.
class SftpSession {
public:
    virtual ~SftpSession() = default;

    // std::nullopt when the path does not exist.
    virtual std::optional<RemoteEntryType> Stat(const std::string& path) = 0;

    virtual void MakeDirectory(const std::string& path) = 0;

    // Opens path for writing, creating it or truncating it.
    virtual std::unique_ptr<RemoteFile> Create(const std::string& path) = 0;

    // Creates path and any missing parents. Succeeds if path already is a directory.
    void MakeDirectories(const std::string& path);
};

// Authenticated SSH transport. Destruction disconnects.
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    virtual std::unique_ptr<SftpSession> OpenSftp() = 0;
};

class RemoteConnector {
public:
    virtual ~RemoteConnector() = default;

    // Connects, verifies the host key and authenticates. Throws RemoteError.
    virtual std::unique_ptr<RemoteSession> Connect(const SessionConfig& config,
                                                   const std::string& host,
                                                   int port) = 0;
};

// Parent directory of a remote path: "." for a bare name, "/" for a root-level entry.
std::string RemoteParentDirectory(const std::string& path);

} // namespace sftpgate::core
