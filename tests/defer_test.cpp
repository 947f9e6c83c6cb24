#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "util/defer.hpp"

TEST(DeferTest, RunsInReverseOrderWithinOneScope) {
    std::string order;
    {
        DEFER(order += "a";);
        DEFER(order += "b";);
        DEFER(order += "c";);
        EXPECT_TRUE(order.empty());
    }
    EXPECT_EQ(order, "cba");
}

TEST(DeferTest, MovedHolderRunsOnce) {
    int runs = 0;
    {
        auto first = make_deferred([&runs] { ++runs; });
        auto second = std::move(first);
    }
    EXPECT_EQ(runs, 1);
}
