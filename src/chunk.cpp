// src/chunk.cpp
#include "merkle_chunker/chunk.hpp"
#include <cctype>
#include <limits>
#include <stdexcept>

namespace MerkleChunker
{
    namespace Chunks
    {

        std::vector<ChunkRange> Chunker::split(uint64_t payload_size, uint64_t max_chunk_size)
        {
            if (max_chunk_size == 0)
            {
                throw std::invalid_argument("Chunker: max_chunk_size must be positive.");
            }

            const uint64_t min_chunk_size = max_chunk_size / 2;
            std::vector<ChunkRange> ranges;
            ranges.reserve(static_cast<size_t>(payload_size / max_chunk_size + 1));

            uint64_t cursor = 0;
            uint64_t remaining = payload_size;

            while (remaining > max_chunk_size)
            {
                uint64_t chunk_size = max_chunk_size;
                const uint64_t tail = remaining - max_chunk_size;

                // Rebalance the last two chunks instead of leaving an undersized tail.
                if (tail < min_chunk_size)
                {
                    chunk_size = remaining - remaining / 2;
                }

                ranges.push_back({cursor, cursor + chunk_size});
                cursor += chunk_size;
                remaining -= chunk_size;
            }

            // Final chunk; [0, 0) for an empty payload.
            ranges.push_back({cursor, cursor + remaining});
            return ranges;
        }

        size_t parseChunkIndex(const std::string &text)
        {
            // stoull alone would accept "-1" (wrapping) and leading whitespace.
            if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front())))
            {
                throw std::invalid_argument("not a chunk index: " + text);
            }
            size_t consumed = 0;
            const unsigned long long value = std::stoull(text, &consumed);
            if (consumed != text.size())
            {
                throw std::invalid_argument("not a chunk index: " + text);
            }
            if (value > std::numeric_limits<size_t>::max())
            {
                throw std::out_of_range("chunk index too large: " + text);
            }
            return static_cast<size_t>(value);
        }

    } // namespace Chunks
} // namespace MerkleChunker
