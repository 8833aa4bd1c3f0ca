#include <core/security/open_ssl_provider.h>
#include <fstream>
#include <ios>
#include <iterator>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace ssl = boost::asio::ssl;
namespace fs = std::filesystem;

namespace sftpgate::core {

namespace {

std::string readPemFile(const fs::path& path) {
    std::error_code type_ec;
    if (fs::is_directory(path, type_ec)) {
        throw std::runtime_error("cannot read " + path.string() + ": is a directory");
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("cannot open " + path.string());
    }
    std::string content;
    try {
        content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    } catch (const std::ios_base::failure& e) {
        throw std::runtime_error("cannot read " + path.string() + ": " + e.what());
    }
    if (file.bad()) {
        throw std::runtime_error("cannot read " + path.string());
    }
    return content;
}

} // namespace

OpenSSLProvider::~OpenSSLProvider() {
    if (initialized_) {
        // OpenSSL cleans up on its own since 1.1.0
        EVP_cleanup();
        ERR_free_strings();
        CRYPTO_cleanup_all_ex_data();
        initialized_ = false;
    }
}

OpenSSLProvider& OpenSSLProvider::instance() {
    static OpenSSLProvider instance;
    return instance;
}

void OpenSSLProvider::InitOpenSSL() {
    if (!instance().initialized_) {
        if (OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS,
                             nullptr)
            != 1) {
            spdlog::critical("OPENSSL_init_ssl failed");
            throw std::runtime_error("OpenSSL initialization failed");
        }
        instance().initialized_ = true;
        spdlog::debug("OpenSSL initialized: {}", OpenSSL_version(OPENSSL_VERSION));
    }
}

ssl::context OpenSSLProvider::BuildServerContext(std::string_view cert_pem,
                                                 std::string_view key_pem) {
    ssl::context ctx(ssl::context::tlsv12_server);

    ctx.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2
                    | ssl::context::no_sslv3 | ssl::context::single_dh_use);

    ctx.use_certificate_chain(boost::asio::buffer(cert_pem.data(), cert_pem.size()));
    ctx.use_private_key(boost::asio::buffer(key_pem.data(), key_pem.size()), ssl::context::pem);

    return ctx;
}

ssl::context OpenSSLProvider::LoadServerContext(const fs::path& cert_file,
                                                const fs::path& key_file) {
    auto cert_pem = readPemFile(cert_file);
    auto key_pem = readPemFile(key_file);
    spdlog::info("Loaded TLS certificate from {}", cert_file.string());
    return BuildServerContext(cert_pem, key_pem);
}

} // namespace sftpgate::core
