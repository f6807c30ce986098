// include/merkle_chunker/hash_utility.hpp
#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>

#include "chunk_config.hpp"

namespace MerkleChunker
{
    namespace Hashing
    {

        // Raw SHA-256 digest.
        using Digest = std::array<unsigned char, Config::ChunkConfig::HASH_SIZE>;

        // Offset note: an offset as a fixed-width big-endian unsigned integer.
        using Note = std::array<unsigned char, Config::ChunkConfig::NOTE_SIZE>;

        class HashUtility
        {
        public:
            // SHA-256 of a byte range. An empty range hashes to SHA256("").
            static Digest sha256(const char *data, size_t length);
            static Digest sha256(const std::vector<char> &data_buffer);
            // Also covers offset notes, which share the digest's 32-byte layout.
            static Digest sha256(const Digest &digest);

            // SHA-256 over the concatenation of the given digests, without building
            // the concatenated buffer.
            static Digest hashConcat(std::initializer_list<Digest> parts);

            static Note encodeOffset(uint64_t offset);

            // Throws std::runtime_error if the note does not fit in 64 bits.
            static uint64_t decodeOffset(const unsigned char *note);

            static std::string toHex(const Digest &digest);

            // URL-safe base64 without padding, the network's text encoding for
            // binary fields.
            static std::string toBase64Url(const unsigned char *data, size_t length);
            static std::string toBase64Url(const Digest &digest);
            static std::string toBase64Url(const std::vector<char> &data_buffer);

            // Throws std::runtime_error on characters outside the alphabet or an
            // impossible length.
            static std::vector<char> fromBase64Url(const std::string &encoded);
            static Digest digestFromBase64Url(const std::string &encoded);
        };

    } // namespace Hashing
} // namespace MerkleChunker
