#include "sharemesh/core/Node.hpp"
#include "test_access.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <set>

using namespace std::chrono_literals;
using namespace sharemesh;

namespace {

constexpr ChunkIndex kServedBeforeRevocation = 4;

void check_private_file(const std::filesystem::path& root, Node& carol, Node& alice, Node& bob) {
    const auto content = test::patterned_bytes(10 * kMinChunkSize + 123, 42);
    const auto source = test::write_file(root / "report.bin", content);
    const auto shared = carol.share_file(source, Visibility::Private, {"alice"});
    const auto open_file = carol.share_file(test::write_file(root / "readme.txt", test::patterned_bytes(64, 1)));
    assert(shared.manifest.chunk_count() == 11);

    // Listings only show what the caller may fetch.
    const auto bob_listing = bob.transfers().list_remote_files(carol.local_endpoint(), 5s);
    assert(bob_listing.size() == 1);
    assert(bob_listing[0].file_id == open_file.file_id);
    const auto alice_listing = alice.transfers().list_remote_files(carol.local_endpoint(), 5s);
    assert(alice_listing.size() == 2);

    const auto denied = bob.fetch(shared.file_id, carol.local_endpoint());
    const auto denied_result = bob.transfers().wait(denied, 10s);
    assert(denied_result.has_value());
    assert(denied_result->state == JobState::Failed);
    assert(denied_result->error.has_value());
    assert(denied_result->error->kind == ErrorKind::Permission);
    assert(denied_result->completed.empty());
    assert(!std::filesystem::exists(root / "bob" / "report.bin"));
    assert(bob.tracker().size() == 0);

    const auto allowed = alice.fetch(shared.file_id, carol.local_endpoint());
    const auto allowed_result = alice.transfers().wait(allowed, 20s);
    assert(allowed_result.has_value());
    assert(allowed_result->state == JobState::Complete);
    assert(allowed_result->completed.size() == 11);
    assert(allowed_result->bytes_transferred == content.size());
    assert(test::read_file(root / "alice" / "report.bin") == content);
    assert(!std::filesystem::exists(root / "alice" / "report.bin.part"));

    const auto downloads = alice.tracker().by_file(shared.file_id);
    assert(downloads.size() == 1);
    assert(downloads[0].peer_id == carol.id());
    assert(downloads[0].direction == TransferDirection::Download);
    assert(downloads[0].bytes == content.size());
    assert(test::eventually([&] { return carol.tracker().by_peer(alice.id()).size() == 1; }));
    assert(carol.tracker().by_peer(alice.id())[0].direction == TransferDirection::Upload);
    assert(carol.tracker().by_peer(bob.id()).empty());

    // The owner opens the file to everyone; bob's next attempt succeeds.
    assert(carol.catalog().set_visibility(shared.file_id, Visibility::Public));
    const auto retry = bob.fetch(shared.file_id, carol.local_endpoint(), root / "bob" / "copy.bin");
    const auto retry_result = bob.transfers().wait(retry, 20s);
    assert(retry_result.has_value() && retry_result->state == JobState::Complete);
    assert(test::read_file(root / "bob" / "copy.bin") == content);

    // Unknown files are a protocol failure, not a permission one.
    const auto missing = alice.fetch("0000", carol.local_endpoint());
    const auto missing_result = alice.transfers().wait(missing, 10s);
    assert(missing_result.has_value() && missing_result->state == JobState::Failed);
    assert(missing_result->error->kind == ErrorKind::Protocol);

    assert(test::eventually([&] { return carol.transfers().active_job_count() == 0; }));
    assert(alice.transfers().active_job_count() == 0);
}

// A second identity configured with alice's user id gets nothing private.
void check_claimed_user_needs_binding(const std::filesystem::path& root, Node& carol) {
    const auto content = test::patterned_bytes(3 * kMinChunkSize, 5);
    const auto shared = carol.share_file(test::write_file(root / "secret.bin", content), Visibility::Private,
                                         {"alice"});

    Node impostor(test::loopback_config("alice", root / "impostor"));
    impostor.start();
    assert(impostor.id() != carol.catalog().peer_for_user("alice"));

    const auto listing = impostor.transfers().list_remote_files(carol.local_endpoint(), 5s);
    for (const auto& entry : listing) {
        assert(entry.file_id != shared.file_id);
    }

    const auto job = impostor.fetch(shared.file_id, carol.local_endpoint());
    const auto result = impostor.transfers().wait(job, 10s);
    assert(result.has_value());
    assert(result->state == JobState::Failed);
    assert(result->error->kind == ErrorKind::Permission);
    assert(!std::filesystem::exists(root / "impostor" / "secret.bin"));
    assert(carol.tracker().by_peer(impostor.id()).empty());
    impostor.stop();
}

void check_revocation_mid_transfer(const std::filesystem::path& root, Node& carol, Node& alice) {
    const auto content = test::patterned_bytes(10 * kMinChunkSize, 61);
    const auto shared = carol.share_file(test::write_file(root / "live.bin", content), Visibility::Private,
                                         {"alice"});

    // Chunks past the first few stay unanswered until the client asks again.
    test::ChunkRequestLog requests([](ChunkIndex index, std::uint32_t) { return index < kServedBeforeRevocation; });
    TransferEngine::TestHooks hooks;
    hooks.on_chunk_request = [&](const FileId& file_id, ChunkIndex index, std::uint32_t attempt) {
        return file_id != shared.file_id || requests.observe(index, attempt);
    };
    TransferEngine::set_test_hooks(&hooks);

    const std::set<ChunkIndex> served{0, 1, 2, 3};
    const auto job = alice.fetch(shared.file_id, carol.local_endpoint());
    assert(test::eventually([&] {
        const auto snapshot = alice.transfers().snapshot(job);
        return snapshot.has_value() && snapshot->completed == served;
    }));
    assert(test::eventually([&] { return carol.transfers().active_job_count() == 1; }));

    assert(carol.catalog().set_visibility(shared.file_id, Visibility::Private, {}));
    const auto result = alice.transfers().wait(job, 20s);
    TransferEngine::set_test_hooks(nullptr);

    assert(result.has_value());
    assert(result->state == JobState::Failed);
    assert(result->error.has_value());
    assert(result->error->kind == ErrorKind::Permission);
    assert(result->completed == served);
    assert(!std::filesystem::exists(root / "alice" / "live.bin"));
    assert(alice.tracker().by_file(shared.file_id).empty());

    assert(test::eventually([&] { return carol.transfers().active_job_count() == 0; }));
    assert(carol.tracker().by_file(shared.file_id).empty());
    bool upload_failed = false;
    for (const auto& snapshot : carol.transfers().jobs()) {
        if (snapshot.file_id == shared.file_id && snapshot.direction == TransferDirection::Upload) {
            upload_failed = snapshot.state == JobState::Failed && snapshot.error.has_value() &&
                            snapshot.error->kind == ErrorKind::Permission;
        }
    }
    assert(upload_failed);
}

}  // namespace

int main() {
    test::silence_logs();
    const auto root = test::scratch_directory("permissions");

    Node carol(test::loopback_config("carol", root / "carol"));
    Node alice(test::loopback_config("alice", root / "alice"));
    Node bob(test::loopback_config("bob", root / "bob"));
    carol.start();
    alice.start();
    bob.start();
    carol.catalog().bind_user("alice", alice.id());

    check_private_file(root, carol, alice, bob);
    check_claimed_user_needs_binding(root, carol);
    check_revocation_mid_transfer(root, carol, alice);

    bob.stop();
    alice.stop();
    carol.stop();
    std::filesystem::remove_all(root);
    return 0;
}
