#include "sharemesh/storage/FileAssembler.hpp"

#include "sharemesh/crypto/Aead.hpp"
#include "sharemesh/crypto/Sha256.hpp"

#include <array>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace sharemesh::storage {

namespace {
constexpr std::size_t kHashBufferSize = 64 * 1024;
}

FileAssembler::FileAssembler(std::filesystem::path destination, protocol::FileManifest manifest)
    : destination_(std::move(destination)),
      manifest_(std::move(manifest)) {}

FileAssembler::~FileAssembler() {
    close();
}

std::filesystem::path FileAssembler::partial_path_for(const std::filesystem::path& destination) {
    auto partial = destination;
    partial += ".part";
    return partial;
}

std::filesystem::path FileAssembler::partial_path() const {
    return partial_path_for(destination_);
}

void FileAssembler::open() {
    std::scoped_lock lock(mutex_);
    if (stream_.is_open()) {
        return;
    }

    const auto partial = partial_path();
    std::error_code ec;
    if (destination_.has_parent_path()) {
        std::filesystem::create_directories(destination_.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("cannot create " + destination_.parent_path().string() + ": " + ec.message());
        }
    }
    if (!std::filesystem::exists(partial, ec)) {
        std::ofstream create(partial, std::ios::binary);
        if (!create) {
            throw std::runtime_error("cannot create " + partial.string());
        }
    }
    std::filesystem::resize_file(partial, manifest_.file_size, ec);
    if (ec) {
        throw std::runtime_error("cannot size " + partial.string() + ": " + ec.message());
    }

    stream_.open(partial, std::ios::binary | std::ios::in | std::ios::out);
    if (!stream_) {
        throw std::runtime_error("cannot open " + partial.string());
    }
}

void FileAssembler::write_chunk(ChunkIndex index, std::span<const std::uint8_t> plaintext) {
    if (index >= manifest_.chunk_count() || plaintext.size() != manifest_.chunk_length(index)) {
        throw std::out_of_range("chunk " + std::to_string(index) + " does not fit the manifest");
    }
    std::scoped_lock lock(mutex_);
    if (!stream_.is_open()) {
        throw std::runtime_error("partial file is not open");
    }
    stream_.seekp(static_cast<std::streamoff>(manifest_.chunk_offset(index)));
    stream_.write(reinterpret_cast<const char*>(plaintext.data()), static_cast<std::streamsize>(plaintext.size()));
    stream_.flush();
    if (!stream_) {
        stream_.clear();
        throw std::runtime_error("write failed for chunk " + std::to_string(index));
    }
}

bool FileAssembler::verify_content() {
    std::scoped_lock lock(mutex_);
    if (stream_.is_open()) {
        stream_.flush();
    }

    std::ifstream input(partial_path(), std::ios::binary);
    if (!input) {
        return false;
    }
    crypto::Sha256 hasher;
    std::array<char, kHashBufferSize> buffer{};
    std::uint64_t total = 0;
    while (input) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto read = input.gcount();
        if (read <= 0) {
            break;
        }
        hasher.update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(buffer.data()),
                                                    static_cast<std::size_t>(read)));
        total += static_cast<std::uint64_t>(read);
    }
    const auto digest = hasher.finalize();
    return total == manifest_.file_size && crypto::constant_time_equal(digest, manifest_.content_hash);
}

void FileAssembler::finalize() {
    close();
    std::error_code ec;
    std::filesystem::rename(partial_path(), destination_, ec);
    if (ec) {
        throw std::runtime_error("cannot move " + partial_path().string() + " into place: " + ec.message());
    }
}

void FileAssembler::close() {
    std::scoped_lock lock(mutex_);
    if (stream_.is_open()) {
        stream_.close();
    }
}

}  // namespace sharemesh::storage
