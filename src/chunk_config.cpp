// src/chunk_config.cpp
#include "merkle_chunker/chunk_config.hpp"
#include <iostream>
#include <stdexcept> // For std::runtime_error

namespace fs = std::filesystem;

namespace MerkleChunker
{
    namespace Config
    {

        const std::string ChunkConfig::MANIFESTS_DIR_NAME = "manifests";

        ChunkConfig::ChunkConfig(fs::path base_dir) : base_dir(std::move(base_dir))
        {
        }

        fs::path ChunkConfig::ensureDirectoryExists(const std::string &dir_name) const
        {
            fs::path dir_path = base_dir / dir_name;

            try
            {
                if (!fs::exists(dir_path))
                {
                    if (fs::create_directories(dir_path))
                    {
                        std::clog << "[config] Created directory: " << dir_path << std::endl;
                    }
                    else if (!fs::exists(dir_path))
                    {
                        // Another process may have raced us; only fail if it is still missing.
                        throw std::runtime_error("Failed to create directory: " + dir_path.string());
                    }
                }
            }
            catch (const fs::filesystem_error &e)
            {
                throw std::runtime_error("Filesystem error creating directory " + dir_path.string() + ": " + e.what());
            }
            return dir_path;
        }

        fs::path ChunkConfig::getManifestsDirPath() const
        {
            return ensureDirectoryExists(MANIFESTS_DIR_NAME);
        }

    } // namespace Config
} // namespace MerkleChunker
