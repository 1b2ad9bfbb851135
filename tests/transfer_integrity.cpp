#include "sharemesh/core/Node.hpp"
#include "test_access.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <set>
#include <vector>

using namespace std::chrono_literals;
using namespace sharemesh;

namespace {

constexpr ChunkIndex kCorruptChunk = 4;

void check_corrupted_chunk_exhausts_retries(const std::filesystem::path& root, Node& server, Node& client) {
    const auto content = test::patterned_bytes(10 * kMinChunkSize, 9);
    const auto shared = server.share_file(test::write_file(root / "ten.bin", content));
    assert(shared.manifest.chunk_count() == 10);

    test::ChunkRequestLog requests;
    TransferEngine::TestHooks hooks;
    hooks.on_chunk_request = [&](const FileId& file_id, ChunkIndex index, std::uint32_t attempt) {
        return file_id != shared.file_id || requests.observe(index, attempt);
    };
    hooks.tamper_outgoing_plaintext = [&](const FileId& file_id, ChunkIndex index, ChunkData& plaintext) {
        if (file_id == shared.file_id && index == kCorruptChunk) {
            plaintext[0] ^= 0xff;
        }
    };
    TransferEngine::set_test_hooks(&hooks);

    const auto job = client.fetch(shared.file_id, server.local_endpoint());
    const auto result = client.transfers().wait(job, 20s);
    TransferEngine::set_test_hooks(nullptr);

    assert(result.has_value());
    assert(result->state == JobState::Failed);
    assert(result->error.has_value());
    assert(result->error->kind == ErrorKind::Integrity);
    assert(result->error->chunk_index == kCorruptChunk);
    assert(result->retries.at(kCorruptChunk) == client.config().max_chunk_retries);
    assert(requests.count(kCorruptChunk) == client.config().max_chunk_retries);

    const std::set<ChunkIndex> expected{0, 1, 2, 3, 5, 6, 7, 8, 9};
    assert(result->completed == expected);
    for (const auto index : expected) {
        assert(requests.count(index) == 1);
        assert(!result->retries.contains(index));
    }
    assert(!std::filesystem::exists(root / "client" / "ten.bin"));
    assert(client.transfers().active_job_count() == 0);
    assert(client.tracker().by_file(shared.file_id).empty());
    assert(test::eventually([&] { return server.transfers().active_job_count() == 0; }));
    assert(server.tracker().by_file(shared.file_id).empty());
}

void check_transit_corruption_recovers(const std::filesystem::path& root, Node& server, Node& client) {
    const auto content = test::patterned_bytes(5 * kMinChunkSize + 99, 23);
    const auto shared = server.share_file(test::write_file(root / "transit.bin", content));

    test::ChunkRequestLog requests;
    std::atomic<int> flipped{0};
    TransferEngine::TestHooks hooks;
    hooks.on_chunk_request = [&](const FileId& file_id, ChunkIndex index, std::uint32_t attempt) {
        return file_id != shared.file_id || requests.observe(index, attempt);
    };
    // Corrupts the first copy of chunk 2 only.
    hooks.tamper_received_chunk = [&](JobId, ChunkIndex index, std::vector<std::uint8_t>& ciphertext) {
        if (index == 2 && flipped.fetch_add(1) == 0) {
            ciphertext.back() ^= 0x80;
        }
    };
    TransferEngine::set_test_hooks(&hooks);

    const auto job = client.fetch(shared.file_id, server.local_endpoint());
    const auto result = client.transfers().wait(job, 20s);
    TransferEngine::set_test_hooks(nullptr);

    assert(result.has_value());
    assert(result->state == JobState::Complete);
    assert(result->retries.at(2) == 1);
    assert(result->retries.size() == 1);
    assert(requests.count(2) == 2);
    assert(test::read_file(root / "client" / "transit.bin") == content);
}

void check_whole_file_mismatch(const std::filesystem::path& root, Node& server, Node& client) {
    const auto content = test::patterned_bytes(3 * kMinChunkSize + 5, 17);
    const auto shared = server.share_file(test::write_file(root / "whole.bin", content));

    TransferEngine::TestHooks hooks;
    hooks.tamper_outgoing_manifest = [](protocol::FileManifest& manifest) { manifest.content_hash[0] ^= 0x01; };
    TransferEngine::set_test_hooks(&hooks);

    const auto job = client.fetch(shared.file_id, server.local_endpoint());
    const auto result = client.transfers().wait(job, 20s);
    TransferEngine::set_test_hooks(nullptr);

    assert(result.has_value());
    assert(result->state == JobState::Failed);
    assert(result->error->kind == ErrorKind::Integrity);
    assert(!result->error->chunk_index.has_value());
    // Every chunk verified on its own; only the reassembled file is wrong.
    assert(result->completed.size() == 4);
    assert(result->retries.empty());
    assert(!std::filesystem::exists(root / "client" / "whole.bin"));
    assert(!std::filesystem::exists(root / "client" / "whole.bin.part"));
    assert(!test::TransferEngineTestAccess::ledger_chunks(client.transfers(), shared.file_id, server.id()).has_value());
    // Every chunk was acknowledged, yet the upload is not recorded as delivered.
    assert(test::eventually([&] { return server.transfers().active_job_count() == 0; }));
    assert(server.tracker().by_file(shared.file_id).empty());

    // Without tampering the same file arrives intact.
    const auto clean = client.fetch(shared.file_id, server.local_endpoint());
    const auto clean_result = client.transfers().wait(clean, 20s);
    assert(clean_result.has_value() && clean_result->state == JobState::Complete);
    assert(test::read_file(root / "client" / "whole.bin") == content);
    assert(test::eventually([&] { return server.tracker().by_file(shared.file_id).size() == 1; }));
}

}  // namespace

int main() {
    test::silence_logs();
    const auto root = test::scratch_directory("integrity");

    Node server(test::loopback_config("server", root / "server"));
    Node client(test::loopback_config("client", root / "client"));
    server.start();
    client.start();

    check_corrupted_chunk_exhausts_retries(root, server, client);
    check_whole_file_mismatch(root, server, client);
    check_transit_corruption_recovers(root, server, client);

    client.stop();
    server.stop();
    std::filesystem::remove_all(root);
    return 0;
}
