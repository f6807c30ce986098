// include/merkle_chunker/merkle_node.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <variant>

#include "chunk.hpp"
#include "hash_utility.hpp"

namespace MerkleChunker
{
    namespace Merkle
    {

        using Hashing::Digest;

        // Commitment to one chunk's content and its end offset.
        struct LeafNode
        {
            Digest id{};
            Digest data_hash{};
            uint64_t min_byte_range = 0;
            uint64_t max_byte_range = 0; // exclusive
        };

        // Commitment to two children and the offset splitting them. Children are
        // indices into the owning tree's node arena.
        struct BranchNode
        {
            Digest id{};
            uint64_t byte_range = 0; // left child's max_byte_range
            uint64_t min_byte_range = 0;
            uint64_t max_byte_range = 0;
            size_t left = 0;
            size_t right = 0;
        };

        using Node = std::variant<LeafNode, BranchNode>;

        const Digest &nodeId(const Node &node);
        uint64_t nodeMinByteRange(const Node &node);
        uint64_t nodeMaxByteRange(const Node &node);

        // leaf id = H(H(data_hash) || H(note(max_byte_range)))
        Digest leafId(const Digest &data_hash, uint64_t max_byte_range);

        // branch id = H(H(left_id) || H(right_id) || H(note(byte_range)))
        Digest branchId(const Digest &left_id, const Digest &right_id, uint64_t byte_range);

        // Hash one chunk of the payload into a leaf. data must point at the
        // range.size() bytes of the chunk.
        LeafNode hashLeaf(const char *data, const Chunks::ChunkRange &range);

        // Combine two adjacent nodes; left_index/right_index are their arena slots.
        BranchNode hashBranch(const Node &left, size_t left_index, const Node &right, size_t right_index);

    } // namespace Merkle
} // namespace MerkleChunker
