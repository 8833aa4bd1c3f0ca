#include <core/ssh/host_key_policy.h>

namespace sftpgate::core {

namespace {

std::string_view normalizeFingerprint(std::string_view fingerprint) {
    constexpr std::string_view kPrefix = "SHA256:";
    if (fingerprint.substr(0, kPrefix.size()) == kPrefix) {
        fingerprint.remove_prefix(kPrefix.size());
    }
    while (!fingerprint.empty() && fingerprint.back() == '=') {
        fingerprint.remove_suffix(1);
    }
    return fingerprint;
}

struct PolicyName {
    std::string_view operator()(const AcceptAnyHostKey&) const { return "accept-any"; }
    std::string_view operator()(const PinnedHostKey&) const { return "fingerprint"; }
    std::string_view operator()(const KnownHostsFile&) const { return "known-hosts"; }
};

} // namespace

std::string_view HostKeyPolicyName(const HostKeyPolicy& policy) {
    return std::visit(PolicyName{}, policy);
}

bool FingerprintsMatch(std::string_view expected, std::string_view actual) {
    auto lhs = normalizeFingerprint(expected);
    return !lhs.empty() && lhs == normalizeFingerprint(actual);
}

} // namespace sftpgate::core
