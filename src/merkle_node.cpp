// src/merkle_node.cpp
#include "merkle_chunker/merkle_node.hpp"

namespace MerkleChunker
{
    namespace Merkle
    {

        const Digest &nodeId(const Node &node)
        {
            return std::visit([](const auto &n) -> const Digest & { return n.id; }, node);
        }

        uint64_t nodeMinByteRange(const Node &node)
        {
            return std::visit([](const auto &n) { return n.min_byte_range; }, node);
        }

        uint64_t nodeMaxByteRange(const Node &node)
        {
            return std::visit([](const auto &n) { return n.max_byte_range; }, node);
        }

        Digest leafId(const Digest &data_hash, uint64_t max_byte_range)
        {
            using Hashing::HashUtility;
            return HashUtility::hashConcat({
                HashUtility::sha256(data_hash),
                HashUtility::sha256(HashUtility::encodeOffset(max_byte_range)),
            });
        }

        Digest branchId(const Digest &left_id, const Digest &right_id, uint64_t byte_range)
        {
            using Hashing::HashUtility;
            return HashUtility::hashConcat({
                HashUtility::sha256(left_id),
                HashUtility::sha256(right_id),
                HashUtility::sha256(HashUtility::encodeOffset(byte_range)),
            });
        }

        LeafNode hashLeaf(const char *data, const Chunks::ChunkRange &range)
        {
            LeafNode leaf;
            leaf.data_hash = Hashing::HashUtility::sha256(data, static_cast<size_t>(range.size()));
            leaf.min_byte_range = range.start;
            leaf.max_byte_range = range.end;
            leaf.id = leafId(leaf.data_hash, leaf.max_byte_range);
            return leaf;
        }

        BranchNode hashBranch(const Node &left, size_t left_index, const Node &right, size_t right_index)
        {
            BranchNode branch;
            branch.byte_range = nodeMaxByteRange(left);
            branch.min_byte_range = nodeMinByteRange(left);
            branch.max_byte_range = nodeMaxByteRange(right);
            branch.left = left_index;
            branch.right = right_index;
            branch.id = branchId(nodeId(left), nodeId(right), branch.byte_range);
            return branch;
        }

    } // namespace Merkle
} // namespace MerkleChunker
