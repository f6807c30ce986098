// src/merkle_proof.cpp
#include "merkle_chunker/merkle_proof.hpp"
#include <algorithm>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

namespace MerkleChunker
{
    namespace Merkle
    {

        namespace
        {
            constexpr size_t HASH_SIZE = Config::ChunkConfig::HASH_SIZE;
            constexpr size_t NOTE_SIZE = Config::ChunkConfig::NOTE_SIZE;
            constexpr size_t BRANCH_SIZE = 2 * HASH_SIZE + NOTE_SIZE;
            constexpr size_t LEAF_SIZE = HASH_SIZE + NOTE_SIZE;

            template <size_t N>
            void append(std::vector<char> &out, const std::array<unsigned char, N> &bytes)
            {
                out.insert(out.end(), bytes.begin(), bytes.end());
            }

            Digest readDigest(const std::vector<char> &in, size_t pos)
            {
                Digest digest;
                std::copy(in.begin() + static_cast<std::ptrdiff_t>(pos),
                          in.begin() + static_cast<std::ptrdiff_t>(pos + HASH_SIZE),
                          digest.begin());
                return digest;
            }

            uint64_t readOffset(const std::vector<char> &in, size_t pos)
            {
                return Hashing::HashUtility::decodeOffset(reinterpret_cast<const unsigned char *>(in.data() + pos));
            }
        } // namespace

        std::vector<char> Proof::serialize() const
        {
            std::vector<char> out;
            out.reserve(steps.size() * BRANCH_SIZE + LEAF_SIZE);
            for (const auto &step : steps)
            {
                append(out, step.left_id);
                append(out, step.right_id);
                append(out, Hashing::HashUtility::encodeOffset(step.byte_range));
            }
            append(out, data_hash);
            append(out, Hashing::HashUtility::encodeOffset(max_byte_range));
            return out;
        }

        Proof Proof::parse(const std::vector<char> &data_path)
        {
            if (data_path.size() < LEAF_SIZE || (data_path.size() - LEAF_SIZE) % BRANCH_SIZE != 0)
            {
                throw std::runtime_error("Malformed data path: unexpected length " + std::to_string(data_path.size()));
            }

            Proof proof;
            const size_t branch_count = (data_path.size() - LEAF_SIZE) / BRANCH_SIZE;
            proof.steps.reserve(branch_count);

            size_t pos = 0;
            for (size_t i = 0; i < branch_count; ++i)
            {
                ProofStep step;
                step.left_id = readDigest(data_path, pos);
                step.right_id = readDigest(data_path, pos + HASH_SIZE);
                step.byte_range = readOffset(data_path, pos + 2 * HASH_SIZE);
                proof.steps.push_back(step);
                pos += BRANCH_SIZE;
            }
            proof.data_hash = readDigest(data_path, pos);
            proof.max_byte_range = readOffset(data_path, pos + HASH_SIZE);
            return proof;
        }

        Proof ProofGenerator::descend(const MerkleTree &tree, uint64_t target)
        {
            Proof proof;
            size_t index = tree.rootIndex();
            for (;;)
            {
                const Node &current = tree.node(index);
                if (const auto *branch = std::get_if<BranchNode>(&current))
                {
                    proof.steps.push_back({nodeId(tree.node(branch->left)),
                                           nodeId(tree.node(branch->right)),
                                           branch->byte_range});
                    // Upper bounds are exclusive: an offset equal to byte_range
                    // belongs to the right subtree.
                    index = target < branch->byte_range ? branch->left : branch->right;
                    continue;
                }

                const auto &leaf = std::get<LeafNode>(current);
                proof.data_hash = leaf.data_hash;
                proof.max_byte_range = leaf.max_byte_range;
                return proof;
            }
        }

        Proof ProofGenerator::forChunk(const MerkleTree &tree, size_t chunk_index)
        {
            // leaf() throws std::out_of_range for a bad index.
            return descend(tree, tree.leaf(chunk_index).min_byte_range);
        }

        Proof ProofGenerator::forOffset(const MerkleTree &tree, uint64_t byte_offset)
        {
            if (byte_offset >= tree.dataSize())
            {
                throw std::out_of_range("Byte offset " + std::to_string(byte_offset) + " out of range (data size " +
                                        std::to_string(tree.dataSize()) + ").");
            }
            return descend(tree, byte_offset);
        }

        std::vector<Proof> ProofGenerator::forAllChunks(const MerkleTree &tree)
        {
            std::vector<Proof> proofs;
            proofs.reserve(tree.leafCount());
            for (size_t i = 0; i < tree.leafCount(); ++i)
            {
                proofs.push_back(forChunk(tree, i));
            }
            return proofs;
        }

        std::optional<PathBounds> ProofValidator::resolvePath(const Digest &data_root,
                                                              uint64_t byte_offset,
                                                              const Proof &proof)
        {
            Digest expected = data_root;
            uint64_t left_bound = 0;
            uint64_t right_bound = std::numeric_limits<uint64_t>::max();
            bool bounded = false;

            for (const auto &step : proof.steps)
            {
                if (branchId(step.left_id, step.right_id, step.byte_range) != expected)
                {
                    return std::nullopt;
                }
                if (byte_offset < step.byte_range)
                {
                    expected = step.left_id;
                    right_bound = std::min(right_bound, step.byte_range);
                    bounded = true;
                }
                else
                {
                    expected = step.right_id;
                    left_bound = std::max(left_bound, step.byte_range);
                }
            }

            if (leafId(proof.data_hash, proof.max_byte_range) != expected)
            {
                return std::nullopt;
            }

            // Offsets along the path must agree with the leaf's own end offset.
            if (bounded && right_bound != proof.max_byte_range)
            {
                return std::nullopt;
            }
            right_bound = proof.max_byte_range;

            // Only the single chunk of an empty payload may be empty.
            const bool empty_payload = proof.steps.empty() && right_bound == 0;
            if (empty_payload ? byte_offset != 0 : (left_bound >= right_bound || byte_offset >= right_bound))
            {
                return std::nullopt;
            }
            return PathBounds{left_bound, right_bound};
        }

        bool ProofValidator::validate(const Digest &data_root,
                                      const char *chunk, size_t chunk_length,
                                      uint64_t min_byte_range, uint64_t max_byte_range,
                                      const Proof &proof)
        {
            if (max_byte_range < min_byte_range || chunk_length != max_byte_range - min_byte_range)
            {
                return false;
            }
            if (proof.max_byte_range != max_byte_range)
            {
                return false;
            }
            if (Hashing::HashUtility::sha256(chunk, chunk_length) != proof.data_hash)
            {
                return false;
            }

            std::optional<PathBounds> bounds = resolvePath(data_root, min_byte_range, proof);
            if (!bounds)
            {
                return false;
            }
            return bounds->left_bound == min_byte_range && bounds->right_bound == max_byte_range;
        }

        bool ProofValidator::validate(const Digest &data_root,
                                      const std::vector<char> &chunk,
                                      uint64_t min_byte_range, uint64_t max_byte_range,
                                      const Proof &proof)
        {
            return validate(data_root, chunk.data(), chunk.size(), min_byte_range, max_byte_range, proof);
        }

        bool ProofValidator::validate(const Digest &data_root,
                                      const std::vector<char> &chunk,
                                      uint64_t min_byte_range, uint64_t max_byte_range,
                                      const std::vector<char> &data_path)
        {
            Proof proof;
            try
            {
                proof = Proof::parse(data_path);
            }
            catch (const std::runtime_error &e)
            {
                std::cerr << "[validator] Rejecting data path: " << e.what() << std::endl;
                return false;
            }
            return validate(data_root, chunk, min_byte_range, max_byte_range, proof);
        }

    } // namespace Merkle
} // namespace MerkleChunker
