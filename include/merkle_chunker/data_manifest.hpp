// include/merkle_chunker/data_manifest.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunk_config.hpp"
#include "merkle_proof.hpp"
#include "merkle_tree.hpp"

namespace MerkleChunker {
namespace Manifest {

// One row of the chunk table. Binary fields are base64url.
struct ChunkEntry {
    uint64_t min_byte_range = 0;
    uint64_t max_byte_range = 0;
    std::string data_hash;
    std::string data_path; // serialized Merkle::Proof
};

// Everything the upload workflow needs about a prepared payload, stored as JSON
// under <base>/manifests/<name>.json.
class DataManifest {
public:
    std::string name;
    std::string data_root;
    uint64_t data_size = 0;
    std::string created_at; // ISO 8601 format (e.g., "YYYY-MM-DDTHH:MM:SSZ")
    std::vector<ChunkEntry> chunks;

    DataManifest() = default;

    // Record a built tree and its proofs (one per chunk, in chunk order).
    DataManifest(std::string manifest_name,
                 const Merkle::MerkleTree& tree,
                 const std::vector<Merkle::Proof>& proofs);

    nlohmann::json toJson() const;
    static DataManifest fromJson(const nlohmann::json& j);

    // Decoded data root. Throws std::runtime_error if the field is not a digest.
    Hashing::Digest dataRootDigest() const;

    // Save manifest to <manifests dir>/<name>.json
    bool save(const Config::ChunkConfig& config) const;

    // Throws std::runtime_error if the manifest is missing or unreadable.
    static DataManifest load(const Config::ChunkConfig& config, const std::string& manifest_name);

    std::filesystem::path getFullPath(const Config::ChunkConfig& config) const;
};

void to_json(nlohmann::json& j, const ChunkEntry& e);
void from_json(const nlohmann::json& j, ChunkEntry& e);
void to_json(nlohmann::json& j, const DataManifest& m);
void from_json(const nlohmann::json& j, DataManifest& m);

// Body of a single chunk submission: the chunk, its proof and the root it
// belongs to. Sizes and offsets are decimal strings on the wire.
struct ChunkUpload {
    std::string data_root;
    uint64_t data_size = 0;
    std::string data_path;
    uint64_t offset = 0;
    std::string chunk;

    nlohmann::json toJson() const;
};

void to_json(nlohmann::json& j, const ChunkUpload& u);

} // namespace Manifest
} // namespace MerkleChunker
