#include <core/util/time.h>
#include <gtest/gtest.h>

using namespace sftpgate::core;
using namespace std::chrono_literals;

namespace {

TEST(TimeUtilTest, FormatsRfc3339InUtc) {
    std::chrono::system_clock::time_point epoch{};
    EXPECT_EQ(timeutil::FormatRfc3339(epoch), "1970-01-01T00:00:00Z");

    auto tp = epoch + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                          1714558830s + 123400000ns);
    EXPECT_EQ(timeutil::FormatRfc3339(tp), "2024-05-01T10:20:30.1234Z");
}

TEST(TimeUtilTest, FormatsDurations) {
    EXPECT_EQ(timeutil::FormatDuration(0ns), "0s");
    EXPECT_EQ(timeutil::FormatDuration(850ns), "850ns");
    EXPECT_EQ(timeutil::FormatDuration(12500ns), "12.5µs");
    EXPECT_EQ(timeutil::FormatDuration(250ms), "250ms");
    EXPECT_EQ(timeutil::FormatDuration(1500ms), "1.5s");
    EXPECT_EQ(timeutil::FormatDuration(2min + 3250ms), "2m3.25s");
    EXPECT_EQ(timeutil::FormatDuration(1h + 5s), "1h0m5s");
    EXPECT_EQ(timeutil::FormatDuration(-1500ms), "-1.5s");
}

} // namespace
