#include <gtest/gtest.h>

#include "util/byte_utils.hpp"

using namespace std::chrono_literals;

TEST(ByteUtilsTest, FormatBytes) {
    EXPECT_EQ(byte_utils::format_bytes(0), "0 B");
    EXPECT_EQ(byte_utils::format_bytes(1023), "1023 B");
    EXPECT_EQ(byte_utils::format_bytes(1024), "1.0 KB");
    EXPECT_EQ(byte_utils::format_bytes(1536), "1.5 KB");
    EXPECT_EQ(byte_utils::format_bytes(5ULL * 1024 * 1024), "5.0 MB");
    EXPECT_EQ(byte_utils::format_bytes(3ULL * 1024 * 1024 * 1024), "3.0 GB");
}

TEST(ByteUtilsTest, FormatDuration) {
    EXPECT_EQ(byte_utils::format_duration(850ms), "850ms");
    EXPECT_EQ(byte_utils::format_duration(12500ms), "12.5s");
    EXPECT_EQ(byte_utils::format_duration(std::chrono::milliseconds(3min)), "3.0m");
    EXPECT_EQ(byte_utils::format_duration(std::chrono::milliseconds(90min)), "1.5h");
}

TEST(ByteUtilsTest, FormatSpeed) {
    EXPECT_EQ(byte_utils::format_speed(2048, 1000ms), "2.0 KB/s");
    EXPECT_EQ(byte_utils::format_speed(2048, 2000ms), "1.0 KB/s");
    EXPECT_EQ(byte_utils::format_speed(100, 0ms), "0 B/s");
}
