// src/data_manifest.cpp
#include "merkle_chunker/data_manifest.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <stdexcept> // For std::runtime_error

namespace fs = std::filesystem;

namespace MerkleChunker {
namespace Manifest {

namespace {

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", std::gmtime(&now_c));
    return buf;
}

} // namespace

void to_json(nlohmann::json& j, const ChunkEntry& e) {
    j = nlohmann::json{
        {"min_byte_range", e.min_byte_range},
        {"max_byte_range", e.max_byte_range},
        {"data_hash", e.data_hash},
        {"data_path", e.data_path}
    };
}

void from_json(const nlohmann::json& j, ChunkEntry& e) {
    j.at("min_byte_range").get_to(e.min_byte_range);
    j.at("max_byte_range").get_to(e.max_byte_range);
    j.at("data_hash").get_to(e.data_hash);
    j.at("data_path").get_to(e.data_path);
}

void to_json(nlohmann::json& j, const DataManifest& m) {
    j = nlohmann::json{
        {"name", m.name},
        {"data_root", m.data_root},
        {"data_size", m.data_size},
        {"created_at", m.created_at},
        {"chunks", m.chunks}
    };
}

void from_json(const nlohmann::json& j, DataManifest& m) {
    j.at("name").get_to(m.name);
    j.at("data_root").get_to(m.data_root);
    j.at("data_size").get_to(m.data_size);
    j.at("created_at").get_to(m.created_at);
    j.at("chunks").get_to(m.chunks);
}

void to_json(nlohmann::json& j, const ChunkUpload& u) {
    j = nlohmann::json{
        {"data_root", u.data_root},
        {"data_size", std::to_string(u.data_size)},
        {"data_path", u.data_path},
        {"offset", std::to_string(u.offset)},
        {"chunk", u.chunk}
    };
}

DataManifest::DataManifest(std::string manifest_name,
                           const Merkle::MerkleTree& tree,
                           const std::vector<Merkle::Proof>& proofs)
    : name(std::move(manifest_name)),
      data_root(Hashing::HashUtility::toBase64Url(tree.dataRoot())),
      data_size(tree.dataSize()),
      created_at(currentTimestamp()) {
    if (proofs.size() != tree.leafCount()) {
        throw std::runtime_error("Manifest '" + name + "': expected " + std::to_string(tree.leafCount()) +
                                 " proofs, got " + std::to_string(proofs.size()));
    }

    chunks.reserve(tree.leafCount());
    for (size_t i = 0; i < tree.leafCount(); ++i) {
        const Merkle::LeafNode& leaf = tree.leaf(i);
        ChunkEntry entry;
        entry.min_byte_range = leaf.min_byte_range;
        entry.max_byte_range = leaf.max_byte_range;
        entry.data_hash = Hashing::HashUtility::toBase64Url(leaf.data_hash);
        entry.data_path = Hashing::HashUtility::toBase64Url(proofs[i].serialize());
        chunks.push_back(std::move(entry));
    }
}

nlohmann::json DataManifest::toJson() const {
    return *this; // Uses the to_json helper function
}

DataManifest DataManifest::fromJson(const nlohmann::json& j) {
    DataManifest manifest;
    j.get_to(manifest);
    return manifest;
}

Hashing::Digest DataManifest::dataRootDigest() const {
    return Hashing::HashUtility::digestFromBase64Url(data_root);
}

bool DataManifest::save(const Config::ChunkConfig& config) const {
    fs::path manifest_path = getFullPath(config);

    std::ofstream ofs(manifest_path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open file for writing manifest: " + manifest_path.string());
    }
    ofs << toJson().dump(4);
    if (!ofs.good()) {
        throw std::runtime_error("Failed to write all data to manifest file: " + manifest_path.string());
    }
    return true;
}

DataManifest DataManifest::load(const Config::ChunkConfig& config, const std::string& manifest_name) {
    fs::path manifest_path = config.getManifestsDirPath() / (manifest_name + ".json");

    if (!fs::exists(manifest_path)) {
        throw std::runtime_error("Manifest file not found: " + manifest_path.string());
    }

    std::ifstream ifs(manifest_path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open manifest file for reading: " + manifest_path.string());
    }

    nlohmann::json j;
    try {
        ifs >> j;
        return fromJson(j);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Error parsing JSON manifest file " + manifest_path.string() + ": " + e.what());
    }
}

fs::path DataManifest::getFullPath(const Config::ChunkConfig& config) const {
    return config.getManifestsDirPath() / (name + ".json");
}

nlohmann::json ChunkUpload::toJson() const {
    return *this;
}

} // namespace Manifest
} // namespace MerkleChunker
