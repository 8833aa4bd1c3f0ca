/**
 * @file open_ssl_provider.h
 * @brief OpenSSL library initialization and TLS contexts for the HTTPS listener
 */
#pragma once

#include <boost/asio/ssl/context.hpp>
#include <filesystem>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <string_view>

namespace sftpgate::core {

class OpenSSLProvider {
private:
    OpenSSLProvider() = default;
    OpenSSLProvider(const OpenSSLProvider&) = delete;
    OpenSSLProvider& operator=(const OpenSSLProvider&) = delete;
    ~OpenSSLProvider();

    static OpenSSLProvider& instance();

    bool initialized_ = false;

public:
    /**
     * @brief Initialize OpenSSL library
     * 
     * Safe to call more than once; only the first call does any work.
     */
    static void InitOpenSSL();

    /**
     * @brief Build a server SSL context with the given certificate and key in PEM format
     * 
     * @param cert_pem Certificate chain in PEM format
     * @param key_pem Private key in PEM format
     * @return boost::asio::ssl::context SSL context configured for server use
     * @throws boost::system::system_error if either PEM block is rejected
     */
    static boost::asio::ssl::context BuildServerContext(std::string_view cert_pem,
                                                        std::string_view key_pem);

    /**
     * @brief Read the PEM files and build a server context from them
     * 
     * @throws std::runtime_error if a file cannot be read
     */
    static boost::asio::ssl::context LoadServerContext(const std::filesystem::path& cert_file,
                                                       const std::filesystem::path& key_file);
};

} // namespace sftpgate::core
