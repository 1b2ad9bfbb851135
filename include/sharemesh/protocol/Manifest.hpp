#pragma once

#include "sharemesh/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace sharemesh::protocol {

struct FileManifest {
    std::uint32_t chunk_size{0};
    std::uint64_t file_size{0};
    std::vector<Hash256> chunk_hashes;
    Hash256 content_hash{};

    std::size_t chunk_count() const noexcept { return chunk_hashes.size(); }
    std::uint64_t chunk_offset(ChunkIndex index) const noexcept;
    std::size_t chunk_length(ChunkIndex index) const noexcept;

    // The hash count must match the chunk count implied by size and chunk size.
    bool consistent() const noexcept;
};

inline constexpr std::size_t kMaxManifestChunks = 1u << 20;

FileManifest build_manifest(std::span<const std::uint8_t> content, std::size_t chunk_size);
FileManifest build_manifest(const std::filesystem::path& path, std::size_t chunk_size);

std::vector<ChunkData> split_chunks(std::span<const std::uint8_t> content, std::size_t chunk_size);
ChunkData reassemble(const std::vector<ChunkData>& chunks);

// Throws std::out_of_range for an index past the manifest, std::runtime_error on I/O failure.
ChunkData read_chunk(const std::filesystem::path& path, const FileManifest& manifest, ChunkIndex index);
bool verify_chunk(const FileManifest& manifest, ChunkIndex index, std::span<const std::uint8_t> plaintext);

std::vector<std::uint8_t> encode_manifest(const FileManifest& manifest);
FileManifest decode_manifest(std::span<const std::uint8_t> data);

}  // namespace sharemesh::protocol
