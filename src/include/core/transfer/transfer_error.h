#pragma once

#include <string>
#include <system_error>

namespace sftpgate::core {

// One code per orchestration stage. The first three are raised while resolving credentials.
enum class TransferErrc {
    kNoCredential = 1,
    kKeyRead,
    kKeyParse,
    kConnect,
    kSession,
    kSourceOpen,
    kRemoteMkdir,
    kDestCreate,
    kCopy,
};

const std::error_category& TransferCategory() noexcept;

std::error_code make_error_code(TransferErrc errc) noexcept;

// True for the credential-resolution codes (kNoCredential, kKeyRead, kKeyParse).
bool IsAuthError(const std::error_code& ec) noexcept;

// Builds the "<stage message>: <detail>" string stored in a failed TransferResult.
std::string DescribeFailure(const std::error_code& ec, const std::string& detail);

} // namespace sftpgate::core

template<>
struct std::is_error_code_enum<sftpgate::core::TransferErrc> : std::true_type {};
