#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

#include "merkle_chunker/chunk.hpp"
#include "merkle_chunker/chunk_config.hpp"

using MerkleChunker::Chunks::ChunkRange;
using MerkleChunker::Chunks::Chunker;
using MerkleChunker::Config::ChunkConfig;

namespace {

constexpr uint64_t MAX = ChunkConfig::MAX_CHUNK_SIZE;

// Contiguous, non-overlapping, covering [0, size), and within the size limits.
void expectWellFormed(const std::vector<ChunkRange>& ranges, uint64_t size, uint64_t max) {
    ASSERT_FALSE(ranges.empty());
    EXPECT_EQ(ranges.front().start, 0u);
    EXPECT_EQ(ranges.back().end, size);
    for (size_t i = 0; i < ranges.size(); ++i) {
        EXPECT_LE(ranges[i].size(), max) << "chunk " << i << " of " << size;
        if (ranges.size() > 1) {
            EXPECT_GE(ranges[i].size(), max / 2) << "chunk " << i << " of " << size;
        }
        if (i > 0) {
            EXPECT_EQ(ranges[i].start, ranges[i - 1].end) << "chunk " << i << " of " << size;
        }
    }
}

} // namespace

TEST(Chunker, EmptyPayloadYieldsOneEmptyChunk) {
    auto ranges = Chunker::split(0);
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0], (ChunkRange{0, 0}));
}

TEST(Chunker, SmallPayloadIsOneChunk) {
    auto ranges = Chunker::split(10);
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0], (ChunkRange{0, 10}));
}

TEST(Chunker, ExactlyMaxIsOneChunk) {
    auto ranges = Chunker::split(MAX);
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0], (ChunkRange{0, MAX}));
}

TEST(Chunker, MaxPlusOneIsRebalanced) {
    auto ranges = Chunker::split(MAX + 1);
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0], (ChunkRange{0, MAX / 2 + 1}));
    EXPECT_EQ(ranges[1], (ChunkRange{MAX / 2 + 1, MAX + 1}));
    EXPECT_GE(ranges[1].size(), MAX / 2);
}

TEST(Chunker, MultipleOfMaxHasNoTrailingEmptyChunk) {
    auto ranges = Chunker::split(3 * MAX);
    ASSERT_EQ(ranges.size(), 3u);
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(ranges[i], (ChunkRange{i * MAX, (i + 1) * MAX}));
    }
}

TEST(Chunker, OnlyLastTwoChunksAreRebalanced) {
    const uint64_t size = 2 * MAX + 100;
    auto ranges = Chunker::split(size);
    ASSERT_EQ(ranges.size(), 3u);
    EXPECT_EQ(ranges[0], (ChunkRange{0, MAX}));
    EXPECT_EQ(ranges[1].size(), (MAX + 100) / 2);
    EXPECT_EQ(ranges[2].size(), (MAX + 100) / 2);
    expectWellFormed(ranges, size, MAX);
}

TEST(Chunker, TailOfHalfMaxIsKept) {
    const uint64_t size = MAX + MAX / 2;
    auto ranges = Chunker::split(size);
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0], (ChunkRange{0, MAX}));
    EXPECT_EQ(ranges[1], (ChunkRange{MAX, size}));
}

TEST(Chunker, OddMergedLengthGivesFirstHalfTheExtraByte) {
    auto ranges = Chunker::split(16 + 3, 16);
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0].size(), 10u);
    EXPECT_EQ(ranges[1].size(), 9u);
}

TEST(Chunker, WellFormedForAllSmallSizes) {
    for (uint64_t max : {2u, 7u, 16u, 64u}) {
        for (uint64_t size = 0; size <= 10 * max + 3; ++size) {
            expectWellFormed(Chunker::split(size, max), size, max);
        }
    }
}

TEST(Chunker, ZeroMaxChunkSizeThrows) {
    EXPECT_THROW(Chunker::split(10, 0), std::invalid_argument);
}

TEST(Chunker, ParseChunkIndex) {
    using MerkleChunker::Chunks::parseChunkIndex;
    EXPECT_EQ(parseChunkIndex("0"), 0u);
    EXPECT_EQ(parseChunkIndex("17"), 17u);

    EXPECT_THROW(parseChunkIndex(""), std::invalid_argument);
    EXPECT_THROW(parseChunkIndex("-1"), std::invalid_argument);
    EXPECT_THROW(parseChunkIndex("+1"), std::invalid_argument);
    EXPECT_THROW(parseChunkIndex(" 1"), std::invalid_argument);
    EXPECT_THROW(parseChunkIndex("1x"), std::invalid_argument);
    EXPECT_THROW(parseChunkIndex("99999999999999999999999"), std::out_of_range);
}
