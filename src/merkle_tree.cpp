// src/merkle_tree.cpp
#include "merkle_chunker/merkle_tree.hpp"
#include <stdexcept>
#include <string>

namespace MerkleChunker
{
    namespace Merkle
    {

        MerkleTree MerkleTree::build(const std::vector<char> &payload,
                                     Concurrency::ThreadPool *pool,
                                     uint64_t max_chunk_size)
        {
            std::vector<Chunks::ChunkRange> ranges = Chunks::Chunker::split(payload.size(), max_chunk_size);

            std::vector<LeafNode> leaves;
            leaves.reserve(ranges.size());

            if (pool == nullptr)
            {
                for (const auto &range : ranges)
                {
                    leaves.push_back(hashLeaf(payload.data() + range.start, range));
                }
            }
            else
            {
                // Each leaf depends only on its own bytes and offset.
                leaves = pool->mapAll(ranges.size(), [&payload, &ranges](size_t i)
                                      { return hashLeaf(payload.data() + ranges[i].start, ranges[i]); });
            }

            return fromLeaves(std::move(leaves), pool);
        }

        MerkleTree MerkleTree::fromLeaves(std::vector<LeafNode> leaves, Concurrency::ThreadPool *pool)
        {
            if (leaves.empty())
            {
                throw std::invalid_argument("MerkleTree: at least one leaf is required.");
            }

            MerkleTree tree;
            tree.leaf_count = leaves.size();
            // n leaves always reduce to exactly n - 1 branches.
            tree.nodes.reserve(2 * leaves.size() - 1);

            std::vector<size_t> level;
            level.reserve(leaves.size());
            for (auto &leaf : leaves)
            {
                level.push_back(tree.nodes.size());
                tree.nodes.emplace_back(std::move(leaf));
            }

            while (level.size() > 1)
            {
                const size_t pairs = level.size() / 2;
                std::vector<BranchNode> branches;
                branches.reserve(pairs);

                if (pool == nullptr)
                {
                    for (size_t i = 0; i < pairs; ++i)
                    {
                        const size_t l = level[2 * i];
                        const size_t r = level[2 * i + 1];
                        branches.push_back(hashBranch(tree.nodes[l], l, tree.nodes[r], r));
                    }
                }
                else
                {
                    // Nodes are only read here; new branches are appended after the join.
                    branches = pool->mapAll(pairs, [&tree, &level](size_t i)
                                            {
                                                const size_t l = level[2 * i];
                                                const size_t r = level[2 * i + 1];
                                                return hashBranch(tree.nodes[l], l, tree.nodes[r], r); });
                }

                std::vector<size_t> next_level;
                next_level.reserve(pairs + 1);
                for (auto &branch : branches)
                {
                    next_level.push_back(tree.nodes.size());
                    tree.nodes.emplace_back(std::move(branch));
                }
                if (level.size() % 2 == 1)
                {
                    next_level.push_back(level.back());
                }
                level = std::move(next_level);
            }

            // The last reduction always pairs two nodes, so the root is the last slot.
            return tree;
        }

        const LeafNode &MerkleTree::leaf(size_t index) const
        {
            if (index >= leaf_count)
            {
                throw std::out_of_range("Chunk index " + std::to_string(index) + " out of range (tree has " +
                                        std::to_string(leaf_count) + " chunks).");
            }
            return std::get<LeafNode>(nodes[index]);
        }

        std::vector<Chunks::ChunkRange> MerkleTree::chunkRanges() const
        {
            std::vector<Chunks::ChunkRange> ranges;
            ranges.reserve(leaf_count);
            for (size_t i = 0; i < leaf_count; ++i)
            {
                const LeafNode &l = std::get<LeafNode>(nodes[i]);
                ranges.push_back({l.min_byte_range, l.max_byte_range});
            }
            return ranges;
        }

    } // namespace Merkle
} // namespace MerkleChunker
