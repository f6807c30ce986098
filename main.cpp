// main.cpp
#include <iostream>
#include <string>
#include <filesystem>
#include <stdexcept>
#include <thread>

#include "merkle_chunker/payload_preparer.hpp"

namespace fs = std::filesystem;

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << " prepare <file> [name]   build proofs and save manifests/<name>.json\n"
              << "  " << program << " verify <file> <name>    check a file against a saved manifest\n"
              << "  " << program << " chunk <file> <index>    print the upload record of one chunk\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        printUsage(argv[0]);
        return 2;
    }

    const std::string command = argv[1];
    const std::string input_file = argv[2];

    const size_t hw_threads = std::thread::hardware_concurrency();
    MerkleChunker::PayloadPreparer preparer(hw_threads == 0 ? 4 : hw_threads);

    try {
        if (command == "prepare") {
            const std::string name = argc > 3 ? argv[3] : fs::path(input_file).filename().string();
            MerkleChunker::PreparedPayload prepared = preparer.prepareFile(input_file);
            MerkleChunker::Manifest::DataManifest manifest = preparer.saveManifest(prepared, name);
            std::cout << manifest.data_root << std::endl;
            return 0;
        }

        if (command == "verify") {
            if (argc < 4) {
                printUsage(argv[0]);
                return 2;
            }
            const bool ok = preparer.verifyFile(argv[3], input_file);
            std::cout << (ok ? "valid" : "invalid") << std::endl;
            return ok ? 0 : 1;
        }

        if (command == "chunk") {
            if (argc < 4) {
                printUsage(argv[0]);
                return 2;
            }
            MerkleChunker::PreparedPayload prepared = preparer.prepareFile(input_file);
            std::cout << preparer.chunkUpload(prepared, MerkleChunker::Chunks::parseChunkIndex(argv[3])).toJson().dump(4) << std::endl;
            return 0;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    printUsage(argv[0]);
    return 2;
}
