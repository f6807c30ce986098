// src/hash_utility.cpp
#include "merkle_chunker/hash_utility.hpp"
#include <algorithm>
#include <iomanip>   // For std::hex, std::setw, std::setfill
#include <sstream>   // For std::stringstream
#include <stdexcept> // For std::runtime_error

// OpenSSL headers for SHA256 and the base64 block codec
// Linked through OpenSSL::Crypto in CMakeLists.txt
#include <openssl/evp.h>
#include <openssl/sha.h>

namespace MerkleChunker
{
    namespace Hashing
    {

        namespace
        {
            class Sha256
            {
            public:
                Sha256()
                {
                    if (!SHA256_Init(&ctx))
                    {
                        throw std::runtime_error("Failed to initialize SHA256 context.");
                    }
                }

                void update(const void *data, size_t length)
                {
                    if (length == 0)
                    {
                        return;
                    }
                    if (!SHA256_Update(&ctx, data, length))
                    {
                        throw std::runtime_error("Failed to update SHA256 context with data.");
                    }
                }

                Digest finish()
                {
                    Digest hash;
                    if (!SHA256_Final(hash.data(), &ctx))
                    {
                        throw std::runtime_error("Failed to finalize SHA256 hash calculation.");
                    }
                    return hash;
                }

            private:
                SHA256_CTX ctx;
            };

            static_assert(SHA256_DIGEST_LENGTH == Config::ChunkConfig::HASH_SIZE,
                          "Digest size must match SHA-256 output");
        } // namespace

        Digest HashUtility::sha256(const char *data, size_t length)
        {
            Sha256 sha;
            sha.update(data, length);
            return sha.finish();
        }

        Digest HashUtility::sha256(const std::vector<char> &data_buffer)
        {
            return sha256(data_buffer.data(), data_buffer.size());
        }

        Digest HashUtility::sha256(const Digest &digest)
        {
            Sha256 sha;
            sha.update(digest.data(), digest.size());
            return sha.finish();
        }

        Digest HashUtility::hashConcat(std::initializer_list<Digest> parts)
        {
            Sha256 sha;
            for (const Digest &part : parts)
            {
                sha.update(part.data(), part.size());
            }
            return sha.finish();
        }

        Note HashUtility::encodeOffset(uint64_t offset)
        {
            Note note{};
            for (size_t i = 0; i < sizeof(offset); ++i)
            {
                note[note.size() - 1 - i] = static_cast<unsigned char>(offset & 0xFF);
                offset >>= 8;
            }
            return note;
        }

        uint64_t HashUtility::decodeOffset(const unsigned char *note)
        {
            const size_t high_bytes = Config::ChunkConfig::NOTE_SIZE - sizeof(uint64_t);
            for (size_t i = 0; i < high_bytes; ++i)
            {
                if (note[i] != 0)
                {
                    throw std::runtime_error("Offset note does not fit in 64 bits.");
                }
            }
            uint64_t offset = 0;
            for (size_t i = high_bytes; i < Config::ChunkConfig::NOTE_SIZE; ++i)
            {
                offset = (offset << 8) | note[i];
            }
            return offset;
        }

        std::string HashUtility::toHex(const Digest &digest)
        {
            std::stringstream ss;
            for (unsigned char byte : digest)
            {
                ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
            }
            return ss.str();
        }

        std::string HashUtility::toBase64Url(const unsigned char *data, size_t length)
        {
            if (length == 0)
            {
                return std::string();
            }

            std::vector<unsigned char> out(4 * ((length + 2) / 3) + 1);
            int written = EVP_EncodeBlock(out.data(), data, static_cast<int>(length));
            if (written < 0)
            {
                throw std::runtime_error("Failed to base64 encode data.");
            }

            std::string encoded(reinterpret_cast<const char *>(out.data()), static_cast<size_t>(written));
            while (!encoded.empty() && encoded.back() == '=')
            {
                encoded.pop_back();
            }
            std::replace(encoded.begin(), encoded.end(), '+', '-');
            std::replace(encoded.begin(), encoded.end(), '/', '_');
            return encoded;
        }

        std::string HashUtility::toBase64Url(const Digest &digest)
        {
            return toBase64Url(digest.data(), digest.size());
        }

        std::string HashUtility::toBase64Url(const std::vector<char> &data_buffer)
        {
            return toBase64Url(reinterpret_cast<const unsigned char *>(data_buffer.data()), data_buffer.size());
        }

        std::vector<char> HashUtility::fromBase64Url(const std::string &encoded)
        {
            if (encoded.empty())
            {
                return std::vector<char>();
            }
            if (encoded.size() % 4 == 1)
            {
                throw std::runtime_error("Invalid base64url length: " + std::to_string(encoded.size()));
            }

            std::string standard = encoded;
            for (char &c : standard)
            {
                if (c == '-')
                    c = '+';
                else if (c == '_')
                    c = '/';
                else if (c == '+' || c == '/' || c == '=')
                    throw std::runtime_error("Invalid base64url character in input.");
            }
            const size_t padding = (4 - standard.size() % 4) % 4;
            standard.append(padding, '=');

            std::vector<unsigned char> out(standard.size() / 4 * 3);
            int decoded = EVP_DecodeBlock(out.data(),
                                          reinterpret_cast<const unsigned char *>(standard.data()),
                                          static_cast<int>(standard.size()));
            if (decoded < 0)
            {
                throw std::runtime_error("Failed to decode base64url data.");
            }

            // EVP_DecodeBlock counts the bytes produced by padding characters too.
            const size_t length = static_cast<size_t>(decoded) - padding;
            return std::vector<char>(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(length));
        }

        Digest HashUtility::digestFromBase64Url(const std::string &encoded)
        {
            std::vector<char> raw = fromBase64Url(encoded);
            if (raw.size() != Config::ChunkConfig::HASH_SIZE)
            {
                throw std::runtime_error("Expected a " + std::to_string(Config::ChunkConfig::HASH_SIZE) +
                                         "-byte digest, got " + std::to_string(raw.size()) + " bytes.");
            }
            Digest digest;
            std::copy(raw.begin(), raw.end(), digest.begin());
            return digest;
        }

    } // namespace Hashing
} // namespace MerkleChunker
