// include/merkle_chunker/merkle_tree.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "chunk.hpp"
#include "chunk_config.hpp"
#include "merkle_node.hpp"
#include "thread_pool.hpp"

namespace MerkleChunker
{
    namespace Merkle
    {

        // Binary Merkle tree over the chunks of one payload.
        //
        // Nodes live in a single arena: leaves occupy slots [0, leafCount()) in chunk
        // order, branches follow level by level, and the root is the last slot. An
        // odd node at the end of a level is promoted to the next level unchanged.
        // The tree is immutable once built and may be shared between threads.
        class MerkleTree
        {
        public:
            // Chunk and hash a payload. When pool is given, leaf hashing and each
            // level's pairwise reduction are fanned out to it; the result is the
            // same as a sequential build.
            static MerkleTree build(const std::vector<char> &payload,
                                    Concurrency::ThreadPool *pool = nullptr,
                                    uint64_t max_chunk_size = Config::ChunkConfig::MAX_CHUNK_SIZE);

            // Build the branch levels over already hashed leaves (in payload order).
            // Throws std::invalid_argument if leaves is empty.
            static MerkleTree fromLeaves(std::vector<LeafNode> leaves,
                                         Concurrency::ThreadPool *pool = nullptr);

            const Digest &dataRoot() const { return nodeId(root()); }
            uint64_t dataSize() const { return nodeMaxByteRange(root()); }

            const Node &root() const { return nodes.back(); }
            size_t rootIndex() const { return nodes.size() - 1; }

            const Node &node(size_t index) const { return nodes.at(index); }
            size_t nodeCount() const { return nodes.size(); }

            size_t leafCount() const { return leaf_count; }
            const LeafNode &leaf(size_t index) const;

            // Ranges of all chunks, in order.
            std::vector<Chunks::ChunkRange> chunkRanges() const;

        private:
            MerkleTree() = default;

            std::vector<Node> nodes;
            size_t leaf_count = 0;
        };

    } // namespace Merkle
} // namespace MerkleChunker
