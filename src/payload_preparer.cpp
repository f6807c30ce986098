// src/payload_preparer.cpp
#include "merkle_chunker/payload_preparer.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace MerkleChunker
{

    std::vector<char> PreparedPayload::chunkData(size_t chunk_index) const
    {
        const Merkle::LeafNode &leaf = tree.leaf(chunk_index);
        return std::vector<char>(data.begin() + static_cast<std::ptrdiff_t>(leaf.min_byte_range),
                                 data.begin() + static_cast<std::ptrdiff_t>(leaf.max_byte_range));
    }

    PayloadPreparer::PayloadPreparer(size_t num_threads, Config::ChunkConfig config)
        : config(std::move(config)), thread_pool(num_threads)
    {
    }

    std::vector<char> PayloadPreparer::readFile(const std::string &filepath)
    {
        fs::path input_path(filepath);
        if (!fs::exists(input_path))
        {
            throw std::runtime_error("Input file not found: " + filepath);
        }

        std::ifstream ifs(input_path, std::ios::binary | std::ios::ate);
        if (!ifs.is_open())
        {
            throw std::runtime_error("Failed to open input file: " + filepath);
        }

        std::streamsize size = ifs.tellg();
        if (size == -1)
        {
            throw std::runtime_error("Failed to get size of input file: " + filepath);
        }
        ifs.seekg(0, std::ios::beg);

        std::vector<char> buffer(static_cast<size_t>(size));
        if (size > 0 && !ifs.read(buffer.data(), size))
        {
            throw std::runtime_error("Failed to read all data from input file: " + filepath);
        }
        return buffer;
    }

    PreparedPayload PayloadPreparer::prepare(std::vector<char> data)
    {
        Merkle::MerkleTree tree = Merkle::MerkleTree::build(data, &thread_pool);
        std::vector<Merkle::Proof> proofs = Merkle::ProofGenerator::forAllChunks(tree);

        std::clog << "[preparer] " << data.size() << " bytes in " << tree.leafCount()
                  << " chunk(s), data root " << Hashing::HashUtility::toBase64Url(tree.dataRoot()) << std::endl;

        return PreparedPayload{std::move(data), std::move(tree), std::move(proofs)};
    }

    PreparedPayload PayloadPreparer::prepareFile(const std::string &input_filepath)
    {
        std::clog << "[preparer] Preparing file: " << input_filepath << std::endl;
        return prepare(readFile(input_filepath));
    }

    Manifest::DataManifest PayloadPreparer::saveManifest(const PreparedPayload &prepared, const std::string &manifest_name)
    {
        Manifest::DataManifest manifest(manifest_name, prepared.tree, prepared.proofs);
        manifest.save(config);
        std::clog << "[preparer] Manifest saved: " << manifest.getFullPath(config).string() << std::endl;
        return manifest;
    }

    Manifest::ChunkUpload PayloadPreparer::chunkUpload(const PreparedPayload &prepared, size_t chunk_index) const
    {
        if (chunk_index >= prepared.proofs.size())
        {
            throw std::out_of_range("Chunk index " + std::to_string(chunk_index) + " out of range (payload has " +
                                    std::to_string(prepared.proofs.size()) + " chunks).");
        }
        const Merkle::Proof &proof = prepared.proofs[chunk_index];

        Manifest::ChunkUpload upload;
        upload.data_root = Hashing::HashUtility::toBase64Url(prepared.tree.dataRoot());
        upload.data_size = prepared.tree.dataSize();
        upload.data_path = Hashing::HashUtility::toBase64Url(proof.serialize());
        upload.offset = proof.offset();
        upload.chunk = Hashing::HashUtility::toBase64Url(prepared.chunkData(chunk_index));
        return upload;
    }

    bool PayloadPreparer::verifyFile(const std::string &manifest_name, const std::string &input_filepath)
    {
        std::clog << "[preparer] Verifying '" << input_filepath << "' against manifest '" << manifest_name << "'" << std::endl;
        try
        {
            Manifest::DataManifest manifest = Manifest::DataManifest::load(config, manifest_name);
            std::vector<char> data = readFile(input_filepath);

            if (data.size() != manifest.data_size)
            {
                std::cerr << "[preparer] Size mismatch: file has " << data.size() << " bytes, manifest records "
                          << manifest.data_size << std::endl;
                return false;
            }

            // The chunk table must follow the canonical layout for this size.
            std::vector<Chunks::ChunkRange> expected = Chunks::Chunker::split(data.size());
            if (expected.size() != manifest.chunks.size())
            {
                std::cerr << "[preparer] Chunk count mismatch: expected " << expected.size() << ", manifest records "
                          << manifest.chunks.size() << std::endl;
                return false;
            }

            const Hashing::Digest data_root = manifest.dataRootDigest();
            for (size_t i = 0; i < manifest.chunks.size(); ++i)
            {
                const Manifest::ChunkEntry &entry = manifest.chunks[i];
                if (expected[i] != Chunks::ChunkRange{entry.min_byte_range, entry.max_byte_range})
                {
                    std::cerr << "[preparer] Chunk " << i << " has a non-canonical range" << std::endl;
                    return false;
                }

                std::vector<char> chunk(data.begin() + static_cast<std::ptrdiff_t>(entry.min_byte_range),
                                        data.begin() + static_cast<std::ptrdiff_t>(entry.max_byte_range));
                std::vector<char> data_path = Hashing::HashUtility::fromBase64Url(entry.data_path);
                if (!Merkle::ProofValidator::validate(data_root, chunk, entry.min_byte_range, entry.max_byte_range, data_path))
                {
                    std::cerr << "[preparer] Chunk " << i << " failed proof validation" << std::endl;
                    return false;
                }
            }

            std::clog << "[preparer] All " << manifest.chunks.size() << " chunk(s) verified." << std::endl;
            return true;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[preparer] Error verifying '" << input_filepath << "': " << e.what() << std::endl;
            return false;
        }
    }

} // namespace MerkleChunker
