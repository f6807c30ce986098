#include <gtest/gtest.h>
#include <random>
#include <set>
#include <stdexcept>
#include <variant>
#include <vector>

#include "merkle_chunker/merkle_tree.hpp"
#include "merkle_chunker/thread_pool.hpp"

using namespace MerkleChunker;
using Hashing::Digest;
using Hashing::HashUtility;
using Merkle::BranchNode;
using Merkle::LeafNode;
using Merkle::MerkleTree;

namespace {

constexpr uint64_t MAX = Config::ChunkConfig::MAX_CHUNK_SIZE;

std::vector<char> randomPayload(size_t size, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<char> data(size);
    for (auto& c : data) {
        c = static_cast<char>(dist(rng));
    }
    return data;
}

} // namespace

TEST(MerkleTree, EmptyPayloadRootIsLeafOfEmptyDigest) {
    MerkleTree tree = MerkleTree::build({});
    ASSERT_EQ(tree.leafCount(), 1u);
    ASSERT_EQ(tree.nodeCount(), 1u);
    EXPECT_EQ(tree.dataSize(), 0u);

    Digest empty = HashUtility::sha256(std::vector<char>{});
    Digest expected = HashUtility::hashConcat({HashUtility::sha256(empty),
                                               HashUtility::sha256(HashUtility::encodeOffset(0))});
    EXPECT_EQ(tree.dataRoot(), expected);
    EXPECT_EQ(tree.leaf(0).data_hash, empty);
}

TEST(MerkleTree, SingleChunkRootIsTheLeaf) {
    std::vector<char> payload = randomPayload(MAX, 1);
    MerkleTree tree = MerkleTree::build(payload);

    ASSERT_EQ(tree.leafCount(), 1u);
    ASSERT_TRUE(std::holds_alternative<LeafNode>(tree.root()));
    const LeafNode& leaf = tree.leaf(0);
    EXPECT_EQ(leaf.data_hash, HashUtility::sha256(payload));
    EXPECT_EQ(leaf.min_byte_range, 0u);
    EXPECT_EQ(leaf.max_byte_range, MAX);
    EXPECT_EQ(tree.dataRoot(), Merkle::leafId(leaf.data_hash, MAX));
}

TEST(MerkleTree, ThreeChunksPromoteTheOddLeaf) {
    std::vector<char> payload = randomPayload(3 * MAX, 2);
    MerkleTree tree = MerkleTree::build(payload);

    ASSERT_EQ(tree.leafCount(), 3u);
    ASSERT_EQ(tree.nodeCount(), 5u); // 3 leaves, branch(0,1), root

    const auto& pair = std::get<BranchNode>(tree.node(3));
    EXPECT_EQ(pair.left, 0u);
    EXPECT_EQ(pair.right, 1u);
    EXPECT_EQ(pair.byte_range, MAX);
    EXPECT_EQ(pair.max_byte_range, 2 * MAX);

    const auto& root = std::get<BranchNode>(tree.root());
    EXPECT_EQ(root.left, 3u);
    EXPECT_EQ(root.right, 2u); // leaf 2 promoted unpaired
    EXPECT_EQ(root.byte_range, 2 * MAX);
    EXPECT_EQ(root.min_byte_range, 0u);
    EXPECT_EQ(root.max_byte_range, 3 * MAX);

    Digest pair_id = Merkle::branchId(tree.leaf(0).id, tree.leaf(1).id, MAX);
    EXPECT_EQ(pair.id, pair_id);
    EXPECT_EQ(tree.dataRoot(), Merkle::branchId(pair_id, tree.leaf(2).id, 2 * MAX));
}

TEST(MerkleTree, LeavesFollowChunkLayout) {
    std::vector<char> payload = randomPayload(MAX + 1, 3);
    MerkleTree tree = MerkleTree::build(payload);
    auto ranges = tree.chunkRanges();
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges, Chunks::Chunker::split(MAX + 1));

    std::vector<char> second(payload.begin() + static_cast<std::ptrdiff_t>(ranges[1].start), payload.end());
    EXPECT_EQ(tree.leaf(1).data_hash, HashUtility::sha256(second));
}

TEST(MerkleTree, RootIsDeterministic) {
    std::vector<char> payload = randomPayload(5000, 4);
    EXPECT_EQ(MerkleTree::build(payload, nullptr, 64).dataRoot(),
              MerkleTree::build(payload, nullptr, 64).dataRoot());
}

TEST(MerkleTree, EverySingleByteMutationChangesTheRoot) {
    std::vector<char> payload = randomPayload(600, 5);
    std::set<Digest> roots;
    roots.insert(MerkleTree::build(payload, nullptr, 64).dataRoot());

    for (size_t i = 0; i < payload.size(); ++i) {
        std::vector<char> mutated = payload;
        mutated[i] = static_cast<char>(mutated[i] ^ 0x01);
        roots.insert(MerkleTree::build(mutated, nullptr, 64).dataRoot());
    }
    EXPECT_EQ(roots.size(), payload.size() + 1);
}

TEST(MerkleTree, SameContentAtDifferentOffsetsHashesDifferently) {
    LeafNode a = Merkle::hashLeaf("abcd", {0, 4});
    LeafNode b = Merkle::hashLeaf("abcd", {4, 8});
    EXPECT_EQ(a.data_hash, b.data_hash);
    EXPECT_NE(a.id, b.id);
}

TEST(MerkleTree, PooledBuildMatchesSequentialBuild) {
    Concurrency::ThreadPool pool(4);
    for (size_t size : {0u, 1u, 64u, 65u, 1000u, 4097u}) {
        std::vector<char> payload = randomPayload(size, static_cast<unsigned>(size));
        MerkleTree sequential = MerkleTree::build(payload, nullptr, 64);
        MerkleTree pooled = MerkleTree::build(payload, &pool, 64);

        ASSERT_EQ(sequential.nodeCount(), pooled.nodeCount()) << "size " << size;
        for (size_t i = 0; i < sequential.nodeCount(); ++i) {
            EXPECT_EQ(Merkle::nodeId(sequential.node(i)), Merkle::nodeId(pooled.node(i))) << "size " << size;
        }
    }
}

TEST(MerkleTree, BranchCountIsLeafCountMinusOne) {
    for (size_t size : {64u, 128u, 320u, 640u, 1000u}) {
        MerkleTree tree = MerkleTree::build(randomPayload(size, 6), nullptr, 64);
        EXPECT_EQ(tree.nodeCount(), 2 * tree.leafCount() - 1) << "size " << size;
        EXPECT_EQ(tree.dataSize(), size);
    }
}

TEST(MerkleTree, FromLeavesRejectsEmptyInput) {
    EXPECT_THROW(MerkleTree::fromLeaves({}), std::invalid_argument);
}

TEST(MerkleTree, LeafIndexOutOfRangeThrows) {
    MerkleTree tree = MerkleTree::build(randomPayload(100, 7), nullptr, 64);
    EXPECT_THROW(tree.leaf(tree.leafCount()), std::out_of_range);
}
