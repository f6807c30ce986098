// include/merkle_chunker/payload_preparer.hpp
#pragma once

#include <string>
#include <vector>

#include "chunk_config.hpp"
#include "data_manifest.hpp"
#include "merkle_proof.hpp"
#include "merkle_tree.hpp"
#include "thread_pool.hpp"

namespace MerkleChunker
{

    // A payload together with its tree and per-chunk proofs.
    struct PreparedPayload
    {
        std::vector<char> data;
        Merkle::MerkleTree tree;
        std::vector<Merkle::Proof> proofs;

        // Bytes of chunk i. Throws std::out_of_range for a bad index.
        std::vector<char> chunkData(size_t chunk_index) const;
    };

    class PayloadPreparer
    {
    public:
        explicit PayloadPreparer(size_t num_threads, Config::ChunkConfig config = Config::ChunkConfig());

        // Chunk the payload, build its tree on the pool and generate every proof.
        PreparedPayload prepare(std::vector<char> data);

        // Same as prepare() for the contents of a file.
        PreparedPayload prepareFile(const std::string &input_filepath);

        // Write the manifest of a prepared payload under the given name.
        Manifest::DataManifest saveManifest(const PreparedPayload &prepared, const std::string &manifest_name);

        // Submission record for one chunk. Throws std::out_of_range for a bad index.
        Manifest::ChunkUpload chunkUpload(const PreparedPayload &prepared, size_t chunk_index) const;

        // Check every chunk of a file against a saved manifest. Returns false on any
        // mismatch, and also when the file or manifest cannot be read.
        bool verifyFile(const std::string &manifest_name, const std::string &input_filepath);

        const Config::ChunkConfig &getConfig() const { return config; }

    private:
        Config::ChunkConfig config;
        Concurrency::ThreadPool thread_pool;

        static std::vector<char> readFile(const std::string &filepath);
    };

} // namespace MerkleChunker
