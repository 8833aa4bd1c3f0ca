#include "test_util.h"
#include <core/util/config.h>
#include <gtest/gtest.h>
#include <map>
#include <optional>
#include <string>
#include <variant>

using namespace sftpgate::core;
using namespace sftpgate::core::testing;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    EnvironmentLookup lookup() {
        return [this](std::string_view name) -> std::optional<std::string> {
            auto it = env_.find(std::string(name));
            if (it == env_.end()) {
                return std::nullopt;
            }
            return it->second;
        };
    }

    Settings load(const std::filesystem::path& file = {}) {
        return LoadSettings(file, false, lookup());
    }

    std::map<std::string, std::string> env_{{"SSH_USERNAME", "deploy"},
                                            {"SSH_PASSWORD", "pw"}};
    TempDir tmp_;
};

TEST_F(ConfigTest, DefaultsWithMinimalEnvironment) {
    auto settings = load();

    EXPECT_EQ(settings.server.port, 8080);
    EXPECT_EQ(settings.server.read_timeout, std::chrono::seconds(10));
    EXPECT_EQ(settings.server.write_timeout, std::chrono::seconds(10));
    EXPECT_EQ(settings.server.max_request_size, 50u * 1024 * 1024);
    EXPECT_GE(settings.server.worker_threads, 1u);
    EXPECT_FALSE(settings.server.https());
    EXPECT_EQ(settings.rate_limit.requests, 100u);
    EXPECT_EQ(settings.rate_limit.duration, std::chrono::seconds(60));
    EXPECT_EQ(settings.ssh.username, "deploy");
    EXPECT_EQ(settings.ssh.password, "pw");
    EXPECT_TRUE(std::holds_alternative<AcceptAnyHostKey>(settings.ssh.host_key_policy));
    EXPECT_EQ(settings.log.level, "info");
    EXPECT_FALSE(settings.log.dir.empty());
}

TEST_F(ConfigTest, EnvironmentOverridesNumbers) {
    env_["PORT"] = "9090";
    env_["READ_TIMEOUT"] = "3";
    env_["RATE_LIMIT_REQUESTS"] = "5";
    env_["RATE_LIMIT_DURATION"] = "1";
    env_["MAX_REQUEST_SIZE"] = "1024";
    env_["WORKER_THREADS"] = "2";

    auto settings = load();

    EXPECT_EQ(settings.server.port, 9090);
    EXPECT_EQ(settings.server.read_timeout, std::chrono::seconds(3));
    EXPECT_EQ(settings.rate_limit.requests, 5u);
    EXPECT_EQ(settings.rate_limit.duration, std::chrono::seconds(1));
    EXPECT_EQ(settings.server.max_request_size, 1024u);
    EXPECT_EQ(settings.server.worker_threads, 2u);
}

TEST_F(ConfigTest, MalformedNumberKeepsPreviousValue) {
    env_["PORT"] = "eighty";
    env_["RATE_LIMIT_REQUESTS"] = "12abc";

    auto settings = load();

    EXPECT_EQ(settings.server.port, 8080);
    EXPECT_EQ(settings.rate_limit.requests, 100u);
}

TEST_F(ConfigTest, MissingCredentialIsRejected) {
    env_.erase("SSH_PASSWORD");
    EXPECT_THROW(load(), ConfigError);

    env_["SSH_KEY_PATH"] = "/etc/sftpgate/id_ed25519";
    EXPECT_NO_THROW(load());
}

TEST_F(ConfigTest, MissingUsernameIsRejected) {
    env_.erase("SSH_USERNAME");
    EXPECT_THROW(load(), ConfigError);
}

TEST_F(ConfigTest, NonPositiveTimeoutsAreRejected) {
    env_["READ_TIMEOUT"] = "-5";
    EXPECT_THROW(load(), ConfigError);

    env_["READ_TIMEOUT"] = "5";
    env_["WRITE_TIMEOUT"] = "0";
    EXPECT_THROW(load(), ConfigError);

    env_["WRITE_TIMEOUT"] = "7";
    auto settings = load();
    EXPECT_EQ(settings.server.read_timeout, std::chrono::seconds(5));
    EXPECT_EQ(settings.server.write_timeout, std::chrono::seconds(7));
}

TEST_F(ConfigTest, TlsFilesMustComeTogether) {
    env_["TLS_CERT_FILE"] = "/etc/sftpgate/cert.pem";
    EXPECT_THROW(load(), ConfigError);

    env_["TLS_KEY_FILE"] = "/etc/sftpgate/key.pem";
    auto settings = load();
    EXPECT_TRUE(settings.server.https());
}

TEST_F(ConfigTest, HostKeyPolicySelection) {
    env_["SSH_HOST_KEY_POLICY"] = "fingerprint";
    EXPECT_THROW(load(), ConfigError);

    env_["SSH_HOST_KEY_FINGERPRINT"] = "SHA256:abc";
    auto pinned = load();
    ASSERT_TRUE(std::holds_alternative<PinnedHostKey>(pinned.ssh.host_key_policy));
    EXPECT_EQ(std::get<PinnedHostKey>(pinned.ssh.host_key_policy).fingerprint, "SHA256:abc");

    env_["SSH_HOST_KEY_POLICY"] = "known-hosts";
    env_["SSH_KNOWN_HOSTS_PATH"] = "/etc/ssh/ssh_known_hosts";
    auto known = load();
    ASSERT_TRUE(std::holds_alternative<KnownHostsFile>(known.ssh.host_key_policy));
    EXPECT_EQ(std::get<KnownHostsFile>(known.ssh.host_key_policy).path,
              std::filesystem::path("/etc/ssh/ssh_known_hosts"));

    env_["SSH_HOST_KEY_POLICY"] = "trust-me";
    EXPECT_THROW(load(), ConfigError);
}

TEST_F(ConfigTest, TomlFileThenEnvironment) {
    auto file = tmp_.Write("config.toml", R"(
[server]
port = 7000
write-timeout = 20
worker-threads = 3

[rate-limit]
requests = 10

[ssh]
username = "from-file"
key-path = "/keys/id_rsa"

[log]
level = "debug"
)");
    env_.erase("SSH_USERNAME");
    env_["PORT"] = "7001";

    auto settings = load(file);

    EXPECT_EQ(settings.server.port, 7001);
    EXPECT_EQ(settings.server.write_timeout, std::chrono::seconds(20));
    EXPECT_EQ(settings.server.worker_threads, 3u);
    EXPECT_EQ(settings.rate_limit.requests, 10u);
    EXPECT_EQ(settings.ssh.username, "from-file");
    EXPECT_EQ(settings.ssh.key_path, "/keys/id_rsa");
    EXPECT_EQ(settings.log.level, "debug");
}

TEST_F(ConfigTest, TomlOutOfRangePortIsIgnored) {
    auto file = tmp_.Write("config.toml", "[server]\nport = 70000\n");

    auto settings = load(file);

    EXPECT_EQ(settings.server.port, 8080);
}

TEST_F(ConfigTest, BrokenTomlIsConfigError) {
    auto file = tmp_.Write("config.toml", "[server\nport = \n");
    EXPECT_THROW(load(file), ConfigError);
}

TEST_F(ConfigTest, RequiredFileMustExist) {
    EXPECT_THROW(LoadSettings(tmp_.path() / "absent.toml", true, lookup()), ConfigError);
    EXPECT_NO_THROW(LoadSettings(tmp_.path() / "absent.toml", false, lookup()));
}

} // namespace
