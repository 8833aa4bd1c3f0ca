#include <core/transfer/transfer_error.h>

namespace sftpgate::core {

namespace {

class TransferErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "transfer"; }

    std::string message(int value) const override {
        switch (static_cast<TransferErrc>(value)) {
        case TransferErrc::kNoCredential:
            return "either password or keyPath must be provided";
        case TransferErrc::kKeyRead:
            return "unable to read private key";
        case TransferErrc::kKeyParse:
            return "unable to parse private key";
        case TransferErrc::kConnect:
            return "failed to connect to SSH server";
        case TransferErrc::kSession:
            return "failed to create SFTP client";
        case TransferErrc::kSourceOpen:
            return "failed to open source file";
        case TransferErrc::kRemoteMkdir:
            return "failed to create target directory";
        case TransferErrc::kDestCreate:
            return "failed to create target file";
        case TransferErrc::kCopy:
            return "failed to copy file contents";
        }
        return "unknown transfer error";
    }
};

} // namespace

const std::error_category& TransferCategory() noexcept {
    static const TransferErrorCategory category;
    return category;
}

std::error_code make_error_code(TransferErrc errc) noexcept {
    return {static_cast<int>(errc), TransferCategory()};
}

bool IsAuthError(const std::error_code& ec) noexcept {
    return ec == TransferErrc::kNoCredential || ec == TransferErrc::kKeyRead
           || ec == TransferErrc::kKeyParse;
}

std::string DescribeFailure(const std::error_code& ec, const std::string& detail) {
    if (detail.empty()) {
        return ec.message();
    }
    return ec.message() + ": " + detail;
}

} // namespace sftpgate::core
