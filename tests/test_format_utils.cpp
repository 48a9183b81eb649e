#include "format_utils.hpp"

#include <gtest/gtest.h>

TEST(FormatUtilsTest, FormatBytes)
{
    EXPECT_EQ(formatBytes(12), "12 B");
    EXPECT_EQ(formatBytes(2048), "2.00 KB");
    EXPECT_EQ(formatBytes(5 * 1024 * 1024 + 512 * 1024), "5.50 MB");
    EXPECT_EQ(formatBytes(3LL * 1024 * 1024 * 1024), "3.00 GB");
}

TEST(FormatUtilsTest, FormatDuration)
{
    EXPECT_EQ(formatDuration(-1), "unknown");
    EXPECT_EQ(formatDuration(42), "42s");
    EXPECT_EQ(formatDuration(150), "2m 30s");
    EXPECT_EQ(formatDuration(3 * 3600 + 5 * 60 + 9), "3h 5m");
}

TEST(FormatUtilsTest, HttpStatusText)
{
    EXPECT_EQ(httpStatusText(404), "Not Found");
    EXPECT_EQ(httpStatusText(304), "Not Modified");
    EXPECT_EQ(httpStatusText(599), "Unknown Status");
}
