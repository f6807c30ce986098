// include/merkle_chunker/chunk_config.hpp
#pragma once

#include <string>
#include <cstddef>    // For size_t
#include <filesystem> // For std::filesystem::path

namespace MerkleChunker
{
    namespace Config
    {

        class ChunkConfig
        {
        public:
            // Maximum size of each chunk (256 KiB). Part of the network's commitment
            // scheme: changing it changes every data root.
            static constexpr size_t MAX_CHUNK_SIZE = 256 * 1024;

            // Size of a digest and of an encoded offset note, in bytes.
            static constexpr size_t HASH_SIZE = 32;
            static constexpr size_t NOTE_SIZE = 32;

            static const std::string MANIFESTS_DIR_NAME;

            // Directories are resolved relative to base_dir.
            explicit ChunkConfig(std::filesystem::path base_dir = std::filesystem::current_path());

            // Get the absolute path for the manifests directory
            // This will create the directory if it doesn't exist
            std::filesystem::path getManifestsDirPath() const;

        private:
            std::filesystem::path base_dir;

            // Helper to ensure directories exist
            std::filesystem::path ensureDirectoryExists(const std::string &dir_name) const;
        };

    } // namespace Config
} // namespace MerkleChunker
