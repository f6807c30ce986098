// include/merkle_chunker/chunk.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "chunk_config.hpp"

namespace MerkleChunker
{
    namespace Chunks
    {

        // A contiguous byte range [start, end) of the original payload.
        struct ChunkRange
        {
            uint64_t start = 0;
            uint64_t end = 0;

            uint64_t size() const { return end - start; }

            bool operator==(const ChunkRange &other) const
            {
                return start == other.start && end == other.end;
            }
            bool operator!=(const ChunkRange &other) const { return !(*this == other); }
        };

        class Chunker
        {
        public:
            // Split a payload of payload_size bytes into ordered chunk ranges.
            //
            // Chunks are max_chunk_size bytes long except for the tail. When the tail
            // would be shorter than max_chunk_size / 2, the last two chunks are split
            // evenly instead (the first one taking the extra byte), so only a single
            // whole-payload chunk can be smaller than half the maximum. An empty
            // payload yields exactly one [0, 0) range.
            static std::vector<ChunkRange> split(uint64_t payload_size,
                                                 uint64_t max_chunk_size = Config::ChunkConfig::MAX_CHUNK_SIZE);
        };

        // Parse a chunk index given as plain decimal digits. Signs, whitespace and
        // trailing characters are rejected with std::invalid_argument; values that
        // do not fit in size_t throw std::out_of_range.
        size_t parseChunkIndex(const std::string &text);

    } // namespace Chunks
} // namespace MerkleChunker
