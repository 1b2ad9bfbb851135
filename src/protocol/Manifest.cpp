#include "sharemesh/protocol/Manifest.hpp"

#include "sharemesh/crypto/Aead.hpp"
#include "sharemesh/crypto/Sha256.hpp"
#include "sharemesh/protocol/Wire.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace sharemesh::protocol {

namespace {

std::size_t expected_chunk_count(std::uint64_t file_size, std::uint32_t chunk_size) {
    if (chunk_size == 0) {
        return 0;
    }
    return static_cast<std::size_t>((file_size + chunk_size - 1) / chunk_size);
}

std::uint32_t checked_chunk_size(std::size_t chunk_size) {
    if (chunk_size == 0 || chunk_size > 0xFFFFFFFFu) {
        throw std::invalid_argument("chunk size out of range");
    }
    return static_cast<std::uint32_t>(chunk_size);
}

}  // namespace

std::uint64_t FileManifest::chunk_offset(ChunkIndex index) const noexcept {
    return static_cast<std::uint64_t>(index) * chunk_size;
}

std::size_t FileManifest::chunk_length(ChunkIndex index) const noexcept {
    const auto offset = chunk_offset(index);
    if (index >= chunk_count() || offset >= file_size) {
        return 0;
    }
    return static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size, file_size - offset));
}

bool FileManifest::consistent() const noexcept {
    return chunk_size != 0 && chunk_hashes.size() == expected_chunk_count(file_size, chunk_size);
}

FileManifest build_manifest(std::span<const std::uint8_t> content, std::size_t chunk_size) {
    FileManifest manifest{};
    manifest.chunk_size = checked_chunk_size(chunk_size);
    manifest.file_size = content.size();

    crypto::Sha256 whole;
    for (std::size_t offset = 0; offset < content.size(); offset += chunk_size) {
        const auto piece = content.subspan(offset, std::min(chunk_size, content.size() - offset));
        manifest.chunk_hashes.push_back(crypto::Sha256::digest(piece));
        whole.update(piece);
    }
    manifest.content_hash = whole.finalize();
    return manifest;
}

FileManifest build_manifest(const std::filesystem::path& path, std::size_t chunk_size) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Unable to open " + path.string());
    }

    FileManifest manifest{};
    manifest.chunk_size = checked_chunk_size(chunk_size);

    crypto::Sha256 whole;
    std::vector<std::uint8_t> buffer(chunk_size);
    while (input) {
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        const auto count = static_cast<std::size_t>(input.gcount());
        if (count == 0) {
            break;
        }
        const auto piece = std::span<const std::uint8_t>(buffer.data(), count);
        manifest.chunk_hashes.push_back(crypto::Sha256::digest(piece));
        whole.update(piece);
        manifest.file_size += count;
        if (manifest.chunk_hashes.size() > kMaxManifestChunks) {
            throw std::length_error("file has too many chunks for one manifest");
        }
    }
    if (input.bad()) {
        throw std::runtime_error("Read error on " + path.string());
    }
    manifest.content_hash = whole.finalize();
    return manifest;
}

std::vector<ChunkData> split_chunks(std::span<const std::uint8_t> content, std::size_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    std::vector<ChunkData> chunks;
    chunks.reserve((content.size() + chunk_size - 1) / chunk_size);
    for (std::size_t offset = 0; offset < content.size(); offset += chunk_size) {
        const auto length = std::min(chunk_size, content.size() - offset);
        chunks.emplace_back(content.begin() + static_cast<std::ptrdiff_t>(offset),
                            content.begin() + static_cast<std::ptrdiff_t>(offset + length));
    }
    return chunks;
}

ChunkData reassemble(const std::vector<ChunkData>& chunks) {
    ChunkData content;
    std::size_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.size();
    }
    content.reserve(total);
    for (const auto& chunk : chunks) {
        content.insert(content.end(), chunk.begin(), chunk.end());
    }
    return content;
}

ChunkData read_chunk(const std::filesystem::path& path, const FileManifest& manifest, ChunkIndex index) {
    if (index >= manifest.chunk_count()) {
        throw std::out_of_range("chunk index past end of manifest");
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Unable to open " + path.string());
    }

    ChunkData chunk(manifest.chunk_length(index));
    input.seekg(static_cast<std::streamoff>(manifest.chunk_offset(index)));
    input.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
    if (static_cast<std::size_t>(input.gcount()) != chunk.size()) {
        throw std::runtime_error("Short read on " + path.string());
    }
    return chunk;
}

bool verify_chunk(const FileManifest& manifest, ChunkIndex index, std::span<const std::uint8_t> plaintext) {
    if (index >= manifest.chunk_count() || plaintext.size() != manifest.chunk_length(index)) {
        return false;
    }
    const auto digest = crypto::Sha256::digest(plaintext);
    return crypto::constant_time_equal(digest, manifest.chunk_hashes[index]);
}

std::vector<std::uint8_t> encode_manifest(const FileManifest& manifest) {
    if (manifest.chunk_hashes.size() > kMaxManifestChunks) {
        throw std::length_error("manifest chunk count exceeds limit");
    }
    std::vector<std::uint8_t> out;
    out.reserve(4 + 8 + 4 + 32 * (manifest.chunk_hashes.size() + 1));
    ByteWriter writer(out);
    writer.u32(manifest.chunk_size);
    writer.u64(manifest.file_size);
    writer.fixed(manifest.content_hash);
    writer.u32(static_cast<std::uint32_t>(manifest.chunk_hashes.size()));
    for (const auto& hash : manifest.chunk_hashes) {
        writer.fixed(hash);
    }
    return out;
}

FileManifest decode_manifest(std::span<const std::uint8_t> data) {
    ByteReader reader(data);
    FileManifest manifest{};
    manifest.chunk_size = reader.u32();
    manifest.file_size = reader.u64();
    manifest.content_hash = reader.fixed<32>();
    const auto count = reader.u32();
    if (count > kMaxManifestChunks || count > reader.remaining() / 32) {
        throw std::invalid_argument("manifest chunk count exceeds payload");
    }
    manifest.chunk_hashes.reserve(count);
    for (std::uint32_t index = 0; index < count; ++index) {
        manifest.chunk_hashes.push_back(reader.fixed<32>());
    }
    if (!reader.exhausted()) {
        throw std::invalid_argument("trailing bytes after manifest");
    }
    if (!manifest.consistent()) {
        throw std::invalid_argument("manifest chunk count does not match file size");
    }
    return manifest;
}

}  // namespace sharemesh::protocol
