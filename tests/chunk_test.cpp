#include <gtest/gtest.h>

#include <stdexcept>

#include "transfer/chunk.hpp"
#include "transfer/download_config.hpp"

namespace {
constexpr std::uint64_t MiB = 1024ULL * 1024ULL;
constexpr std::uint64_t GiB = 1024ULL * MiB;
} // namespace

TEST(ChunkPlanTest, TilesRangeWithClampedLastChunk) {
    auto chunks = plan_chunks(0, 25, 10);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0], (chunk{0, 0, 9}));
    EXPECT_EQ(chunks[1], (chunk{1, 10, 19}));
    EXPECT_EQ(chunks[2], (chunk{2, 20, 24}));
}

TEST(ChunkPlanTest, CoversRangeExactlyOnce) {
    const std::uint64_t start = 7;
    const std::uint64_t end = 1000;
    for (std::uint64_t size : {1ULL, 3ULL, 64ULL, 993ULL, 5000ULL}) {
        auto chunks = plan_chunks(start, end, size);
        ASSERT_EQ(chunks.size(), (end - start + size - 1) / size) << "size " << size;
        std::uint64_t expected = start;
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            EXPECT_EQ(chunks[i].index, i);
            EXPECT_EQ(chunks[i].start, expected);
            EXPECT_LE(chunks[i].length(), size);
            expected = chunks[i].end + 1;
        }
        EXPECT_EQ(expected, end);
    }
}

TEST(ChunkPlanTest, StartsAtOffset) {
    auto chunks = plan_chunks(20, 25, 10);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], (chunk{0, 20, 24}));
}

TEST(ChunkPlanTest, EmptyOrInvertedRangeYieldsNothing) {
    EXPECT_TRUE(plan_chunks(10, 10, 4).empty());
    EXPECT_TRUE(plan_chunks(11, 10, 4).empty());
    EXPECT_TRUE(plan_chunks(0, 0, 0).empty());
}

TEST(ChunkPlanTest, ZeroChunkSizeThrows) {
    EXPECT_THROW(plan_chunks(0, 10, 0), std::invalid_argument);
}

TEST(ChunkPlanTest, UsesConfigChunkSize) {
    download_config config;
    config.chunk_size = 4;
    config.auto_chunk = false;
    EXPECT_EQ(plan_chunks(0, 10, config).size(), 3u);

    config.auto_chunk = true;
    auto chunks = plan_chunks(0, 10, config);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].end, 9u);
}

TEST(ChunkSizeTest, BandsFollowTotalSize) {
    EXPECT_EQ(calculate_chunk_size(0), 4 * MiB);
    EXPECT_EQ(calculate_chunk_size(100 * MiB), 4 * MiB);
    EXPECT_EQ(calculate_chunk_size(100 * MiB + 1), 10 * MiB);
    EXPECT_EQ(calculate_chunk_size(1 * GiB), 10 * MiB);
    EXPECT_EQ(calculate_chunk_size(1 * GiB + 1), 20 * MiB);
    EXPECT_EQ(calculate_chunk_size(10 * GiB + 1), 50 * MiB);
    EXPECT_EQ(calculate_chunk_size(100 * GiB + 1), 100 * MiB);
}

TEST(ChunkSizeTest, NeverShrinksAsSizeGrows) {
    std::uint64_t previous = 0;
    for (std::uint64_t size = 0; size < 200 * GiB; size += 512 * MiB) {
        std::uint64_t current = calculate_chunk_size(size);
        EXPECT_GE(current, previous);
        previous = current;
    }
}
