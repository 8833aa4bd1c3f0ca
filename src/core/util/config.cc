#include <algorithm>
#include <charconv>
#include <core/constant/path.h>
#include <core/util/config.h>
#include <cstdlib>
#include <limits>
#include <spdlog/spdlog.h>
#include <thread>
#include <toml++/toml.h>

namespace sftpgate::core {

namespace {

// Host-key settings stay as raw strings until every source has been applied.
struct HostKeySource {
    std::string policy = "accept-any";
    std::string fingerprint;
    std::string known_hosts_path;
};

template<typename T>
bool parseNumber(std::string_view text, T& out) {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

template<typename T>
void overrideNumber(const EnvironmentLookup& env, std::string_view name, T& target) {
    auto value = env(name);
    if (!value || value->empty()) {
        return;
    }
    T parsed{};
    if (!parseNumber(*value, parsed)) {
        spdlog::warn("Ignoring {}={}: not a valid number", name, *value);
        return;
    }
    target = parsed;
}

void overrideSeconds(const EnvironmentLookup& env,
                     std::string_view name,
                     std::chrono::seconds& target) {
    auto count = target.count();
    overrideNumber(env, name, count);
    target = std::chrono::seconds(count);
}

void overrideString(const EnvironmentLookup& env, std::string_view name, std::string& target) {
    if (auto value = env(name); value && !value->empty()) {
        target = *value;
    }
}

void overridePath(const EnvironmentLookup& env,
                  std::string_view name,
                  std::filesystem::path& target) {
    if (auto value = env(name); value && !value->empty()) {
        target = *value;
    }
}

template<typename T>
void readNumber(const toml::table& table, std::string_view section, std::string_view key, T& target) {
    auto node = table[section][key];
    if (!node) {
        return;
    }
    if (auto value = node.value<std::int64_t>()) {
        if (*value < 0
            || static_cast<std::uint64_t>(*value) > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
            spdlog::warn("Ignoring {}.{} = {}: out of range", section, key, *value);
            return;
        }
        target = static_cast<T>(*value);
    } else {
        spdlog::warn("Ignoring {}.{}: not an integer", section, key);
    }
}

void readSeconds(const toml::table& table,
                 std::string_view section,
                 std::string_view key,
                 std::chrono::seconds& target) {
    auto count = target.count();
    readNumber(table, section, key, count);
    target = std::chrono::seconds(count);
}

template<typename T>
void readString(const toml::table& table, std::string_view section, std::string_view key, T& target) {
    if (auto value = table[section][key].value<std::string>()) {
        target = *value;
    }
}

void loadFile(const std::filesystem::path& config_file,
              bool required,
              Settings& settings,
              HostKeySource& host_key) {
    if (config_file.empty() || !std::filesystem::exists(config_file)) {
        if (required) {
            throw ConfigError("config file \"" + config_file.string() + "\" does not exist");
        }
        spdlog::debug("No config file at \"{}\", using defaults and environment",
                      config_file.string());
        return;
    }

    toml::table table;
    try {
        table = toml::parse_file(config_file.string());
    } catch (const toml::parse_error& err) {
        throw ConfigError("\"" + config_file.string()
                          + "\" could not be parsed: " + std::string(err.description()));
    }
    spdlog::info("Loaded config file \"{}\"", config_file.string());

    readNumber(table, "server", "port", settings.server.port);
    readSeconds(table, "server", "read-timeout", settings.server.read_timeout);
    readSeconds(table, "server", "write-timeout", settings.server.write_timeout);
    readNumber(table, "server", "max-request-size", settings.server.max_request_size);
    readNumber(table, "server", "worker-threads", settings.server.worker_threads);
    readString(table, "server", "tls-cert-file", settings.server.tls_cert_file);
    readString(table, "server", "tls-key-file", settings.server.tls_key_file);

    readNumber(table, "rate-limit", "requests", settings.rate_limit.requests);
    readSeconds(table, "rate-limit", "duration", settings.rate_limit.duration);

    readString(table, "ssh", "username", settings.ssh.username);
    readString(table, "ssh", "password", settings.ssh.password);
    readString(table, "ssh", "key-path", settings.ssh.key_path);
    readString(table, "ssh", "host-key-policy", host_key.policy);
    readString(table, "ssh", "host-key-fingerprint", host_key.fingerprint);
    readString(table, "ssh", "known-hosts-path", host_key.known_hosts_path);

    readString(table, "log", "level", settings.log.level);
    readString(table, "log", "dir", settings.log.dir);
}

void loadEnvironment(const EnvironmentLookup& env, Settings& settings, HostKeySource& host_key) {
    overrideNumber(env, "PORT", settings.server.port);
    overrideSeconds(env, "READ_TIMEOUT", settings.server.read_timeout);
    overrideSeconds(env, "WRITE_TIMEOUT", settings.server.write_timeout);
    overrideNumber(env, "MAX_REQUEST_SIZE", settings.server.max_request_size);
    overrideNumber(env, "WORKER_THREADS", settings.server.worker_threads);
    overridePath(env, "TLS_CERT_FILE", settings.server.tls_cert_file);
    overridePath(env, "TLS_KEY_FILE", settings.server.tls_key_file);

    overrideNumber(env, "RATE_LIMIT_REQUESTS", settings.rate_limit.requests);
    overrideSeconds(env, "RATE_LIMIT_DURATION", settings.rate_limit.duration);

    overrideString(env, "SSH_USERNAME", settings.ssh.username);
    overrideString(env, "SSH_PASSWORD", settings.ssh.password);
    overrideString(env, "SSH_KEY_PATH", settings.ssh.key_path);
    overrideString(env, "SSH_HOST_KEY_POLICY", host_key.policy);
    overrideString(env, "SSH_HOST_KEY_FINGERPRINT", host_key.fingerprint);
    overrideString(env, "SSH_KNOWN_HOSTS_PATH", host_key.known_hosts_path);

    overrideString(env, "LOG_LEVEL", settings.log.level);
    overridePath(env, "LOG_DIR", settings.log.dir);
}

HostKeyPolicy buildHostKeyPolicy(const HostKeySource& source) {
    if (source.policy == "accept-any") {
        return AcceptAnyHostKey{};
    }
    if (source.policy == "fingerprint") {
        if (source.fingerprint.empty()) {
            throw ConfigError("SSH_HOST_KEY_FINGERPRINT is required when SSH_HOST_KEY_POLICY is "
                              "\"fingerprint\"");
        }
        return PinnedHostKey{source.fingerprint};
    }
    if (source.policy == "known-hosts") {
        return KnownHostsFile{source.known_hosts_path};
    }
    throw ConfigError("unknown SSH_HOST_KEY_POLICY \"" + source.policy
                      + "\", expected accept-any, fingerprint or known-hosts");
}

} // namespace

std::optional<std::string> ProcessEnvironment(std::string_view name) {
    const char* value = std::getenv(std::string(name).c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

Settings LoadSettings(const std::filesystem::path& config_file,
                      bool required,
                      const EnvironmentLookup& env) {
    Settings settings;
    settings.server.worker_threads = std::max(1u, std::thread::hardware_concurrency());
    settings.log.dir = path::kLogDir;

    HostKeySource host_key;
    loadFile(config_file, required, settings, host_key);
    loadEnvironment(env, settings, host_key);
    settings.ssh.host_key_policy = buildHostKeyPolicy(host_key);

    ValidateSettings(settings);
    return settings;
}

void ValidateSettings(const Settings& settings) {
    if (settings.ssh.key_path.empty() && settings.ssh.password.empty()) {
        throw ConfigError("either SSH_KEY_PATH or SSH_PASSWORD must be provided");
    }
    if (settings.ssh.username.empty()) {
        throw ConfigError("SSH_USERNAME is required");
    }
    if (settings.server.tls_cert_file.empty() != settings.server.tls_key_file.empty()) {
        throw ConfigError("TLS_CERT_FILE and TLS_KEY_FILE must be set together");
    }
    if (settings.server.worker_threads == 0) {
        throw ConfigError("WORKER_THREADS must be at least 1");
    }
    if (settings.server.read_timeout.count() <= 0) {
        throw ConfigError("READ_TIMEOUT must be positive");
    }
    if (settings.server.write_timeout.count() <= 0) {
        throw ConfigError("WRITE_TIMEOUT must be positive");
    }
    if (settings.rate_limit.duration.count() <= 0) {
        throw ConfigError("RATE_LIMIT_DURATION must be positive");
    }
}

} // namespace sftpgate::core
