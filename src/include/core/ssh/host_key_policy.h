#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <variant>

namespace sftpgate::core {

// Trust any server key. Must be chosen explicitly and is logged on every connection.
struct AcceptAnyHostKey {};

// Trust only a server whose SHA256 key fingerprint matches, "SHA256:" prefix optional.
struct PinnedHostKey {
    std::string fingerprint;
};

// Trust servers recorded in a known_hosts file. Empty path selects the libssh default.
struct KnownHostsFile {
    std::filesystem::path path;
};

using HostKeyPolicy = std::variant<AcceptAnyHostKey, PinnedHostKey, KnownHostsFile>;

std::string_view HostKeyPolicyName(const HostKeyPolicy& policy);

// Compares two SHA256 fingerprints, ignoring an optional "SHA256:" prefix and base64 padding.
bool FingerprintsMatch(std::string_view expected, std::string_view actual);

} // namespace sftpgate::core
