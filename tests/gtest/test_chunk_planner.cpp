// =============================================================================
// Chunk Planner Tests
// =============================================================================

#include <gtest/gtest.h>
#include <limits>
#include <random>

#include "skopje/download/chunk_planner.hpp"
#include "skopje/error.hpp"

using namespace skopje;
using namespace skopje::download;

namespace {

constexpr uint64_t MiB = 1024ULL * 1024;

// Chunks must cover [0, file_size) exactly once, in order, without gaps.
void expect_tiling(const std::vector<Chunk>& chunks, uint64_t file_size, uint64_t chunk_size) {
    uint64_t expected_start = 0;
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].index, i);
        EXPECT_EQ(chunks[i].start, expected_start);
        EXPECT_GT(chunks[i].end, chunks[i].start);
        EXPECT_LE(chunks[i].length(), chunk_size);
        if (i + 1 < chunks.size()) {
            EXPECT_EQ(chunks[i].length(), chunk_size);
        }
        expected_start = chunks[i].end;
    }
    EXPECT_EQ(expected_start, file_size);

    if (!chunks.empty()) {
        uint64_t remainder = file_size % chunk_size;
        EXPECT_EQ(chunks.back().length(), remainder == 0 ? chunk_size : remainder);
    }
}

} // namespace

TEST(ChunkPlannerTest, TwoHundredFiftyMiBInHundredMiBChunks) {
    auto chunks = plan_chunks(250 * MiB, 100 * MiB);

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0], (Chunk{0, 0, 100 * MiB}));
    EXPECT_EQ(chunks[1], (Chunk{1, 100 * MiB, 200 * MiB}));
    EXPECT_EQ(chunks[2], (Chunk{2, 200 * MiB, 250 * MiB}));
    EXPECT_EQ(chunks[2].length(), 50 * MiB);
}

TEST(ChunkPlannerTest, ExactMultipleHasFullLastChunk) {
    auto chunks = plan_chunks(300, 100);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks.back().length(), 100u);
}

TEST(ChunkPlannerTest, SmallerThanOneChunk) {
    auto chunks = plan_chunks(10, 100);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], (Chunk{0, 0, 10}));
}

TEST(ChunkPlannerTest, EmptyFileHasNoChunks) {
    EXPECT_TRUE(plan_chunks(0, 100).empty());
    EXPECT_EQ(chunk_count(0, 100), 0u);
}

TEST(ChunkPlannerTest, ZeroChunkSizeRejected) {
    EXPECT_THROW(plan_chunks(100, 0), InvalidArgumentError);
    EXPECT_THROW(chunk_count(100, 0), InvalidArgumentError);
}

TEST(ChunkPlannerTest, CountNearUint64Max) {
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    EXPECT_EQ(chunk_count(max, max), 1u);
    EXPECT_EQ(chunk_count(max, max / 2), 3u);
}

TEST(ChunkPlannerTest, TilingHoldsForRandomSizes) {
    std::mt19937_64 rng(42);
    std::uniform_int_distribution<uint64_t> file_dist(1, 10'000'000);
    std::uniform_int_distribution<uint64_t> chunk_dist(1, 2'000'000);

    for (int i = 0; i < 200; ++i) {
        uint64_t file_size = file_dist(rng);
        uint64_t chunk_size = chunk_dist(rng);
        auto chunks = plan_chunks(file_size, chunk_size);
        ASSERT_EQ(chunks.size(), chunk_count(file_size, chunk_size));
        expect_tiling(chunks, file_size, chunk_size);
    }
}
