#include <cerrno>
#include <core/constant/transfer.h>
#include <core/transfer/transfer_orchestrator.h>
#include <core/util/time.h>
#include <fstream>
#include <spdlog/spdlog.h>
#include <vector>

namespace sftpgate::core {

namespace {

std::string lastSystemError() {
    return std::error_code(errno, std::generic_category()).message();
}

// Writes the whole buffer, adding every acknowledged byte to `written` as it goes.
void writeAll(RemoteFile& file, const char* data, std::size_t size, std::int64_t& written) {
    while (size > 0) {
        std::size_t n = file.Write(data, size);
        if (n == 0) {
            throw RemoteError("short write");
        }
        written += static_cast<std::int64_t>(n);
        data += n;
        size -= n;
    }
}

} // namespace

TransferOrchestrator::TransferOrchestrator(CredentialDefaults defaults,
                                           SessionFactory session_factory,
                                           std::shared_ptr<RemoteConnector> connector)
    : defaults_(std::move(defaults))
    , session_factory_(std::move(session_factory))
    , connector_(std::move(connector)) {}

SessionConfig TransferOrchestrator::ResolveSessionConfig(const TransferRequest& request) const {
    // Any per-request credential replaces the defaults wholesale, fields are never mixed.
    if (request.OverridesCredentials()) {
        spdlog::debug("Using request-supplied credentials for {}", request.target_host);
        return session_factory_.Build(request.username,
                                      request.password,
                                      request.private_key_path);
    }
    return session_factory_.Build(defaults_.username,
                                  defaults_.password,
                                  defaults_.private_key_path);
}

TransferResult& TransferOrchestrator::fail(TransferResult& result,
                                           TransferErrc errc,
                                           const std::string& detail,
                                           std::error_code& ec) const {
    ec = make_error_code(errc);
    result.end_time = TransferResult::Clock::now();
    result.status = TransferStatus::kFailed;
    result.error = DescribeFailure(ec, detail);
    result.id = GenerateTransferId(result.end_time);
    spdlog::warn("Transfer {} -> {}:{} failed after {} ({} bytes written): {}",
                 result.source_file,
                 result.target_host,
                 result.target_file,
                 timeutil::FormatDuration(result.duration()),
                 result.bytes_written,
                 result.error);
    return result;
}

TransferResult TransferOrchestrator::Transfer(const TransferRequest& request,
                                              std::error_code& ec) const {
    ec.clear();
    TransferResult result = TransferResult::Begin(request);
    const int port = request.EffectivePort();

    SessionConfig config;
    try {
        config = ResolveSessionConfig(request);
    } catch (const AuthError& e) {
        return fail(result, static_cast<TransferErrc>(e.code().value()), e.detail(), ec);
    }

    // Owners are declared in reverse release order: file, source, sftp, then session.
    std::unique_ptr<RemoteSession> session;
    try {
        session = connector_->Connect(config, request.target_host, port);
    } catch (const std::exception& e) {
        return fail(result, TransferErrc::kConnect, e.what(), ec);
    }

    std::unique_ptr<SftpSession> sftp;
    try {
        sftp = session->OpenSftp();
    } catch (const std::exception& e) {
        return fail(result, TransferErrc::kSession, e.what(), ec);
    }
    spdlog::debug("SFTP session open on {}:{}", request.target_host, port);

    std::ifstream source(request.source_file_path, std::ios::binary);
    if (!source.is_open()) {
        return fail(result,
                    TransferErrc::kSourceOpen,
                    "open " + request.source_file_path + ": " + lastSystemError(),
                    ec);
    }

    const auto target_dir = RemoteParentDirectory(request.target_file_path);
    try {
        sftp->MakeDirectories(target_dir);
    } catch (const std::exception& e) {
        return fail(result, TransferErrc::kRemoteMkdir, e.what(), ec);
    }

    std::unique_ptr<RemoteFile> destination;
    try {
        destination = sftp->Create(request.target_file_path);
    } catch (const std::exception& e) {
        return fail(result, TransferErrc::kDestCreate, e.what(), ec);
    }
    spdlog::debug("Copying {} to {}:{}",
                  request.source_file_path,
                  request.target_host,
                  request.target_file_path);

    std::vector<char> buffer(transfer::kCopyBufferSize);
    try {
        while (true) {
            source.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto count = source.gcount();
            if (count > 0) {
                writeAll(*destination,
                         buffer.data(),
                         static_cast<std::size_t>(count),
                         result.bytes_written);
            }
            if (source.eof()) {
                break;
            }
            if (source.fail()) {
                throw std::runtime_error("read " + request.source_file_path + ": "
                                         + lastSystemError());
            }
        }
        destination->Close();
    } catch (const std::exception& e) {
        return fail(result, TransferErrc::kCopy, e.what(), ec);
    }

    result.end_time = TransferResult::Clock::now();
    result.status = TransferStatus::kCompleted;
    result.error.clear();
    result.id = GenerateTransferId(result.end_time);
    spdlog::info("Transfer {} completed: {} -> {}:{} ({} bytes in {})",
                 result.id,
                 result.source_file,
                 result.target_host,
                 result.target_file,
                 result.bytes_written,
                 timeutil::FormatDuration(result.duration()));
    return result;
}

} // namespace sftpgate::core
