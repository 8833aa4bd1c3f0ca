/*
    config.h
    Service configuration, loaded once at startup and read-only afterwards.

    Sources, later ones win:
    - built-in defaults
    - a TOML file (toml++), by default ~/.config/sftpgate/config.toml:

        [server]
        port = 8080
        read-timeout = 10          # seconds
        write-timeout = 10         # seconds
        max-request-size = 52428800
        worker-threads = 4         # also the most transfers that can run at once
        tls-cert-file = ""
        tls-key-file = ""

        [rate-limit]
        requests = 100
        duration = 60              # seconds

        [ssh]
        username = "deploy"
        password = ""
        key-path = "/etc/sftpgate/id_ed25519"
        host-key-policy = "accept-any"   # accept-any | fingerprint | known-hosts
        host-key-fingerprint = ""
        known-hosts-path = ""

        [log]
        level = "info"
        dir = "/var/log/sftpgate"

    - environment variables: PORT, READ_TIMEOUT, WRITE_TIMEOUT, MAX_REQUEST_SIZE,
      WORKER_THREADS, TLS_CERT_FILE, TLS_KEY_FILE, RATE_LIMIT_REQUESTS, RATE_LIMIT_DURATION,
      SSH_USERNAME, SSH_PASSWORD, SSH_KEY_PATH, SSH_HOST_KEY_POLICY, SSH_HOST_KEY_FINGERPRINT,
      SSH_KNOWN_HOSTS_PATH, LOG_LEVEL, LOG_DIR

    Example usage:
        Settings settings = LoadSettings(path::kDefaultConfigFile);
        std::uint16_t port = settings.server.port;
*/

#pragma once

#include <chrono>
#include <core/ssh/host_key_policy.h>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sftpgate::core {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ServerSettings {
    std::uint16_t port = 8080;
    std::chrono::seconds read_timeout{10};
    std::chrono::seconds write_timeout{10};
    std::uint64_t max_request_size = 50 * 1024 * 1024; // 50 MB
    // io_context threads. A transfer blocks its thread, so this also caps concurrent transfers.
    unsigned int worker_threads = 1;
    std::filesystem::path tls_cert_file; // HTTPS when both files are set
    std::filesystem::path tls_key_file;

    bool https() const { return !tls_cert_file.empty() && !tls_key_file.empty(); }
};

struct RateLimitSettings {
    std::size_t requests = 100;
    std::chrono::seconds duration{60};
};

struct SshSettings {
    std::string username;
    std::string password;
    std::string key_path;
    HostKeyPolicy host_key_policy = AcceptAnyHostKey{};
};

struct LogSettings {
    std::string level = "info";
    std::filesystem::path dir;
};

struct Settings {
    ServerSettings server;
    RateLimitSettings rate_limit;
    SshSettings ssh;
    LogSettings log;
};

using EnvironmentLookup = std::function<std::optional<std::string>(std::string_view)>;

// Reads the process environment.
std::optional<std::string> ProcessEnvironment(std::string_view name);

/**
 * @brief Load settings from defaults, the TOML file and the environment, then validate them
 *
 * A missing config file is skipped unless `required` is set. Malformed numbers are logged and
 * ignored.
 *
 * @throws ConfigError when the file cannot be parsed or validation fails
 */
Settings LoadSettings(const std::filesystem::path& config_file,
                      bool required = false,
                      const EnvironmentLookup& env = ProcessEnvironment);

// Throws ConfigError describing the first problem found.
void ValidateSettings(const Settings& settings);

} // namespace sftpgate::core
