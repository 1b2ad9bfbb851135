#include "sharemesh/storage/DownloadTracker.hpp"
#include "test_access.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>

using namespace sharemesh;
using namespace sharemesh::storage;

namespace {

PeerId peer(std::uint8_t fill) {
    PeerId id{};
    id.fill(fill);
    return id;
}

DownloadRecord make_record(const FileId& file, std::uint8_t peer_fill, std::uint64_t bytes,
                           TransferDirection direction = TransferDirection::Download) {
    DownloadRecord record;
    record.file_id = file;
    record.peer_id = peer(peer_fill);
    record.completed_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));
    record.bytes = bytes;
    record.direction = direction;
    return record;
}

void check_in_memory_queries() {
    DownloadTracker tracker;
    assert(tracker.size() == 0);
    tracker.record(make_record("f1", 1, 100));
    tracker.record(make_record("f1", 2, 100, TransferDirection::Upload));
    tracker.record(make_record("f2", 1, 50));

    assert(tracker.size() == 3);
    assert(tracker.by_file("f1").size() == 2);
    assert(tracker.by_file("missing").empty());
    const auto from_first = tracker.by_peer(peer(1));
    assert(from_first.size() == 2);
    // Insertion order is preserved.
    assert(from_first[0].file_id == "f1");
    assert(from_first[1].file_id == "f2");
    assert(tracker.by_peer(peer(2)).front().direction == TransferDirection::Upload);
}

void check_journal_replay() {
    const auto dir = test::scratch_directory("tracker");
    const auto journal = dir / "transfers.log";
    {
        DownloadTracker tracker(journal);
        tracker.record(make_record("alpha", 9, 4096));
        tracker.record(make_record("beta", 9, 10, TransferDirection::Upload));
    }
    {
        std::ofstream out(journal, std::ios::app);
        out << "garbage line without tabs\n";
        out << "\n";
        out << "gamma\tnot-a-peer\t1\t2\tdownload\n";
    }

    DownloadTracker reloaded(journal);
    assert(reloaded.size() == 2);
    const auto alpha = reloaded.by_file("alpha");
    assert(alpha.size() == 1);
    assert(alpha[0].peer_id == peer(9));
    assert(alpha[0].bytes == 4096);
    assert(alpha[0].completed_at == make_record("alpha", 9, 0).completed_at);
    assert(alpha[0].direction == TransferDirection::Download);
    assert(reloaded.by_file("beta")[0].direction == TransferDirection::Upload);

    reloaded.record(make_record("delta", 3, 1));
    assert(DownloadTracker(journal).size() == 3);

    std::filesystem::remove_all(dir);
}

}  // namespace

int main() {
    test::silence_logs();
    check_in_memory_queries();
    check_journal_replay();
    return 0;
}
