#include <core/ssh/remote_client.h>

namespace sftpgate::core {

std::string RemoteParentDirectory(const std::string& path) {
    auto end = path.find_last_not_of('/');
    if (end == std::string::npos) {
        return path.empty() ? "." : "/";
    }
    auto slash = path.find_last_of('/', end);
    if (slash == std::string::npos) {
        return ".";
    }
    auto parent_end = path.find_last_not_of('/', slash);
    if (parent_end == std::string::npos) {
        return "/";
    }
    return path.substr(0, parent_end + 1);
}

void SftpSession::MakeDirectories(const std::string& path) {
    if (auto type = Stat(path)) {
        if (*type == RemoteEntryType::kDirectory) {
            return;
        }
        throw RemoteError("mkdir " + path + ": not a directory");
    }

    auto parent = RemoteParentDirectory(path);
    if (parent != path && parent != ".") {
        MakeDirectories(parent);
    }

    try {
        MakeDirectory(path);
    } catch (const RemoteError&) {
        // Lost a race with another creator, or the server refuses mkdir on existing paths.
        auto type = Stat(path);
        if (type && *type == RemoteEntryType::kDirectory) {
            return;
        }
        throw;
    }
}

} // namespace sftpgate::core
