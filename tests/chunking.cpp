#include "sharemesh/crypto/Sha256.hpp"
#include "sharemesh/protocol/Manifest.hpp"
#include "sharemesh/storage/FileAssembler.hpp"
#include "test_access.hpp"

#include <cassert>
#include <filesystem>
#include <stdexcept>
#include <vector>

using namespace sharemesh;

namespace {

void check_split_and_reassemble() {
    for (const std::size_t size : {0u, 1u, 4095u, 4096u, 4097u, 40960u, 45000u}) {
        const auto content = test::patterned_bytes(size, static_cast<std::uint8_t>(size));
        const auto chunks = protocol::split_chunks(content, kMinChunkSize);
        assert(chunks.size() == (size + kMinChunkSize - 1) / kMinChunkSize);
        for (std::size_t i = 0; i + 1 < chunks.size(); ++i) {
            assert(chunks[i].size() == kMinChunkSize);
        }
        assert(protocol::reassemble(chunks) == content);
    }
}

void check_manifest() {
    const std::size_t mebibyte = 1024 * 1024;
    const auto content = test::patterned_bytes(10 * mebibyte);
    const auto manifest = protocol::build_manifest(content, mebibyte);
    assert(manifest.chunk_count() == 10);
    assert(manifest.file_size == content.size());
    assert(manifest.consistent());
    assert(manifest.content_hash == crypto::Sha256::digest(content));
    assert(manifest.chunk_offset(4) == 4 * mebibyte);
    assert(manifest.chunk_length(9) == mebibyte);
    assert(manifest.chunk_length(10) == 0);

    const auto chunks = protocol::split_chunks(content, mebibyte);
    for (ChunkIndex index = 0; index < manifest.chunk_count(); ++index) {
        assert(protocol::verify_chunk(manifest, index, chunks[index]));
    }
    auto corrupted = chunks[4];
    corrupted[17] ^= 0x01;
    assert(!protocol::verify_chunk(manifest, 4, corrupted));
    assert(!protocol::verify_chunk(manifest, 3, chunks[4]));
    assert(!protocol::verify_chunk(manifest, 10, chunks[0]));

    const auto uneven = protocol::build_manifest(test::patterned_bytes(10000), kMinChunkSize);
    assert(uneven.chunk_count() == 3);
    assert(uneven.chunk_length(2) == 10000 - 2 * kMinChunkSize);

    const auto encoded = protocol::encode_manifest(uneven);
    const auto decoded = protocol::decode_manifest(encoded);
    assert(decoded.chunk_hashes == uneven.chunk_hashes);
    assert(decoded.content_hash == uneven.content_hash);

    auto truncated = encoded;
    truncated.pop_back();
    bool rejected = false;
    try {
        (void)protocol::decode_manifest(truncated);
    } catch (const std::exception&) {
        rejected = true;
    }
    assert(rejected);
}

void check_assembler(const std::filesystem::path& root) {
    const auto content = test::patterned_bytes(3 * kMinChunkSize + 123, 3);
    const auto source = test::write_file(root / "source.bin", content);
    const auto manifest = protocol::build_manifest(source, kMinChunkSize);
    assert(manifest.chunk_count() == 4);
    assert(protocol::read_chunk(source, manifest, 3).size() == 123);

    bool out_of_range = false;
    try {
        (void)protocol::read_chunk(source, manifest, 4);
    } catch (const std::out_of_range&) {
        out_of_range = true;
    }
    assert(out_of_range);

    const auto destination = root / "nested" / "copy.bin";
    {
        storage::FileAssembler assembler(destination, manifest);
        assembler.open();
        // Out of order on purpose; each chunk lands at index * chunk size.
        for (const ChunkIndex index : {2u, 0u}) {
            assembler.write_chunk(index, protocol::read_chunk(source, manifest, index));
        }
        assembler.close();
    }
    assert(std::filesystem::exists(storage::FileAssembler::partial_path_for(destination)));
    assert(!std::filesystem::exists(destination));

    // Resume into the same partial file.
    storage::FileAssembler assembler(destination, manifest);
    assembler.open();
    assert(!assembler.verify_content());
    for (const ChunkIndex index : {3u, 1u}) {
        assembler.write_chunk(index, protocol::read_chunk(source, manifest, index));
    }
    assert(assembler.verify_content());
    assembler.finalize();
    assert(std::filesystem::exists(destination));
    assert(!std::filesystem::exists(assembler.partial_path()));
    assert(test::read_file(destination) == content);
}

}  // namespace

int main() {
    test::silence_logs();
    const auto root = test::scratch_directory("chunking");

    check_split_and_reassemble();
    check_manifest();
    check_assembler(root);

    std::filesystem::remove_all(root);
    return 0;
}
