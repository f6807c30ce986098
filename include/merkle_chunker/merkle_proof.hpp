// include/merkle_chunker/merkle_proof.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "merkle_tree.hpp"

namespace MerkleChunker
{
    namespace Merkle
    {

        // One branch on the path: both child ids and the offset splitting them.
        struct ProofStep
        {
            Digest left_id{};
            Digest right_id{};
            uint64_t byte_range = 0;

            bool operator==(const ProofStep &other) const
            {
                return left_id == other.left_id && right_id == other.right_id && byte_range == other.byte_range;
            }
        };

        // Inclusion proof for one chunk, root to leaf. Holds no reference to the
        // tree it was generated from.
        struct Proof
        {
            std::vector<ProofStep> steps;
            Digest data_hash{};
            uint64_t max_byte_range = 0;

            // Network-facing offset of the chunk: its last byte.
            uint64_t offset() const { return max_byte_range == 0 ? 0 : max_byte_range - 1; }

            // Wire layout ("data path"):
            //   [left_id | right_id | note(byte_range)]* | data_hash | note(max_byte_range)
            std::vector<char> serialize() const;

            // Throws std::runtime_error on a malformed path.
            static Proof parse(const std::vector<char> &data_path);

            bool operator==(const Proof &other) const
            {
                return steps == other.steps && data_hash == other.data_hash && max_byte_range == other.max_byte_range;
            }
            bool operator!=(const Proof &other) const { return !(*this == other); }
        };

        class ProofGenerator
        {
        public:
            // Throws std::out_of_range if chunk_index >= tree.leafCount().
            static Proof forChunk(const MerkleTree &tree, size_t chunk_index);

            // Proof for the chunk containing byte_offset.
            // Throws std::out_of_range if byte_offset >= tree.dataSize().
            static Proof forOffset(const MerkleTree &tree, uint64_t byte_offset);

            // Proofs for every chunk, in chunk order.
            static std::vector<Proof> forAllChunks(const MerkleTree &tree);

        private:
            static Proof descend(const MerkleTree &tree, uint64_t target);
        };

        // [left, right) bounds of a chunk recovered from a proof path.
        struct PathBounds
        {
            uint64_t left_bound = 0;
            uint64_t right_bound = 0;
        };

        class ProofValidator
        {
        public:
            // Accept iff chunk hashes to the proof's leaf, the hash chain reproduces
            // data_root, and the bounds implied by the path are exactly [min, max).
            static bool validate(const Digest &data_root,
                                 const char *chunk, size_t chunk_length,
                                 uint64_t min_byte_range, uint64_t max_byte_range,
                                 const Proof &proof);

            static bool validate(const Digest &data_root,
                                 const std::vector<char> &chunk,
                                 uint64_t min_byte_range, uint64_t max_byte_range,
                                 const Proof &proof);

            // Same as above for a serialized data path. A path that does not parse is
            // rejected rather than thrown.
            static bool validate(const Digest &data_root,
                                 const std::vector<char> &chunk,
                                 uint64_t min_byte_range, uint64_t max_byte_range,
                                 const std::vector<char> &data_path);

            // Walk the path towards the chunk containing byte_offset. Returns the
            // chunk's bounds if every node on the way hashes to its parent's
            // expectation, std::nullopt otherwise. The right bound of the last chunk
            // is the leaf's max_byte_range.
            static std::optional<PathBounds> resolvePath(const Digest &data_root,
                                                         uint64_t byte_offset,
                                                         const Proof &proof);
        };

    } // namespace Merkle
} // namespace MerkleChunker
