#include <gtest/gtest.h>

#include "util/version.hpp"

TEST(VersionTest, FullVersion) {
    EXPECT_EQ(full_version(), "0.3.3");
}

TEST(VersionTest, Components) {
    EXPECT_EQ(proto_version("1.22.333"), 1);
    EXPECT_EQ(major_version("1.22.333"), 22);
    EXPECT_EQ(minor_version("1.22.333"), 333);
}

TEST(VersionTest, MalformedVersionsAreZero) {
    EXPECT_EQ(proto_version("1.2"), 0);
    EXPECT_EQ(major_version(""), 0);
    EXPECT_EQ(minor_version("1.2.x"), 0);
}
