#include "test_util.h"
#include <core/security/open_ssl_provider.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

using namespace sftpgate::core;
using namespace sftpgate::core::testing;

namespace {

TEST(OpenSSLProviderTest, MissingPemFileIsReported) {
    TempDir tmp;
    auto key = tmp.Write("key.pem", "");
    try {
        OpenSSLProvider::LoadServerContext(tmp.path() / "absent.pem", key);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()).rfind("cannot open ", 0), 0u) << e.what();
    }
}

TEST(OpenSSLProviderTest, DirectoryAsPemFileIsReadError) {
    TempDir tmp;
    try {
        OpenSSLProvider::LoadServerContext(tmp.path(), tmp.path());
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()).rfind("cannot read ", 0), 0u) << e.what();
    }
}

} // namespace
