#pragma once

#include "sharemesh/Types.hpp"
#include "sharemesh/protocol/Manifest.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <span>

namespace sharemesh::storage {

// Writes verified chunks into "<destination>.part" and promotes it once the whole file checks out.
// A partial file is left in place on failure so a later job can resume into it.
class FileAssembler {
public:
    FileAssembler(std::filesystem::path destination, protocol::FileManifest manifest);
    ~FileAssembler();

    FileAssembler(const FileAssembler&) = delete;
    FileAssembler& operator=(const FileAssembler&) = delete;

    // Throws std::runtime_error on I/O failure.
    void open();
    void write_chunk(ChunkIndex index, std::span<const std::uint8_t> plaintext);

    // Recomputes SHA-256 over the partial file and compares with the manifest.
    bool verify_content();

    // Renames the partial file to the destination. Throws std::runtime_error.
    void finalize();
    void close();

    const std::filesystem::path& destination() const noexcept { return destination_; }
    std::filesystem::path partial_path() const;

    static std::filesystem::path partial_path_for(const std::filesystem::path& destination);

private:
    std::filesystem::path destination_;
    protocol::FileManifest manifest_;
    std::fstream stream_;
    std::mutex mutex_;
};

}  // namespace sharemesh::storage
