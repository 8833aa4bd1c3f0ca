#include <core/model/transfer_request.h>
#include <core/model/transfer_result.h>
#include <core/model/transfer_progress.h>
#include <core/model/api_error.h>
#include <gtest/gtest.h>

using namespace sftpgate::core;
using json = nlohmann::json;

namespace {

TEST(TransferRequestTest, ParsesFullRequest) {
    auto request = ParseTransferRequest(R"({
        "target_host": "10.0.0.5",
        "target_port": 2222,
        "source_file_path": "/tmp/a.txt",
        "target_file_path": "/remote/dir/a.txt",
        "username": "alice",
        "password": "pw",
        "private_key_path": "/keys/id"
    })");

    EXPECT_EQ(request.target_host, "10.0.0.5");
    EXPECT_EQ(request.target_port, 2222);
    EXPECT_EQ(request.EffectivePort(), 2222);
    EXPECT_EQ(request.source_file_path, "/tmp/a.txt");
    EXPECT_EQ(request.target_file_path, "/remote/dir/a.txt");
    EXPECT_EQ(request.username, "alice");
    EXPECT_EQ(request.password, "pw");
    EXPECT_EQ(request.private_key_path, "/keys/id");
    EXPECT_TRUE(request.OverridesCredentials());
}

TEST(TransferRequestTest, OptionalFieldsDefault) {
    auto request = ParseTransferRequest(
        R"({"target_host":"h","source_file_path":"/a","target_file_path":"/b"})");

    EXPECT_EQ(request.target_port, 0);
    EXPECT_EQ(request.EffectivePort(), 22);
    EXPECT_FALSE(request.OverridesCredentials());
}

TEST(TransferRequestTest, MissingRequiredFieldNamesIt) {
    try {
        ParseTransferRequest(R"({"target_host":"h","source_file_path":"/a"})");
        FAIL() << "expected RequestValidationError";
    } catch (const RequestValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("target_file_path"), std::string::npos);
    }
}

TEST(TransferRequestTest, RejectsInvalidPayloads) {
    EXPECT_THROW(ParseTransferRequest("not json"), RequestValidationError);
    EXPECT_THROW(ParseTransferRequest("[]"), RequestValidationError);
    EXPECT_THROW(ParseTransferRequest(
                     R"({"target_host":"","source_file_path":"/a","target_file_path":"/b"})"),
                 RequestValidationError);
    EXPECT_THROW(ParseTransferRequest(
                     R"({"target_host":1,"source_file_path":"/a","target_file_path":"/b"})"),
                 RequestValidationError);
    EXPECT_THROW(
        ParseTransferRequest(
            R"({"target_host":"h","target_port":"22","source_file_path":"/a","target_file_path":"/b"})"),
        RequestValidationError);
    EXPECT_THROW(
        ParseTransferRequest(
            R"({"target_host":"h","target_port":70000,"source_file_path":"/a","target_file_path":"/b"})"),
        RequestValidationError);
    EXPECT_THROW(
        ParseTransferRequest(
            R"({"target_host":"h","target_port":-1,"source_file_path":"/a","target_file_path":"/b"})"),
        RequestValidationError);
}

TEST(TransferResultTest, SerializesCompletedResult) {
    TransferRequest request;
    request.target_host = "10.0.0.5";
    request.source_file_path = "/tmp/a.txt";
    request.target_file_path = "/remote/a.txt";

    auto result = TransferResult::Begin(request);
    result.status = TransferStatus::kCompleted;
    result.bytes_written = 5;
    result.end_time = result.start_time + std::chrono::milliseconds(250);
    result.id = GenerateTransferId(result.end_time);

    json j = result;
    EXPECT_EQ(j["status"], "completed");
    EXPECT_EQ(j["bytes_written"], 5);
    EXPECT_EQ(j["source_file"], "/tmp/a.txt");
    EXPECT_EQ(j["target_file"], "/remote/a.txt");
    EXPECT_EQ(j["target_host"], "10.0.0.5");
    EXPECT_EQ(j["duration"], "250ms");
    EXPECT_FALSE(j.contains("error"));
    EXPECT_EQ(j["id"].get<std::string>().rfind("transfer-", 0), 0u);
}

TEST(TransferResultTest, FailedResultCarriesError) {
    TransferResult result;
    result.error = "failed to connect to SSH server: refused";

    json j = result;
    EXPECT_EQ(j["status"], "failed");
    EXPECT_EQ(j["error"], "failed to connect to SSH server: refused");
}

TEST(TransferResultTest, IdsAreUnique) {
    auto now = TransferResult::Clock::now();
    auto a = GenerateTransferId(now);
    auto b = GenerateTransferId(now);
    EXPECT_NE(a, b);
    // "transfer-" + nanos + "-" + 8 hex digits
    EXPECT_EQ(a.size() - a.rfind('-') - 1, 8u);
}

TEST(TransferProgressTest, SyntheticReportIsCompleted) {
    json j = TransferProgress::Synthetic("transfer-1-abcdef01");
    EXPECT_EQ(j["id"], "transfer-1-abcdef01");
    EXPECT_EQ(j["status"], "completed");
    EXPECT_DOUBLE_EQ(j["percent_complete"].get<double>(), 100.0);
    EXPECT_EQ(j["bytes_transferred"], 1024);
    EXPECT_TRUE(j.contains("start_time"));
    EXPECT_TRUE(j.contains("last_updated"));
}

TEST(ApiErrorTest, DetailsOmittedWhenEmpty) {
    json plain = ApiError{429, "Rate limit exceeded", ""};
    EXPECT_FALSE(plain.contains("details"));

    json detailed = ApiError{400, "Invalid request payload", "Key: 'x'"};
    EXPECT_EQ(detailed["code"], 400);
    EXPECT_EQ(detailed["details"], "Key: 'x'");
}

} // namespace
