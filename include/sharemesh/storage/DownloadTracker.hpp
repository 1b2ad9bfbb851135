#pragma once

#include "sharemesh/Types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <vector>

namespace sharemesh::storage {

struct DownloadRecord {
    FileId file_id;
    PeerId peer_id{};
    std::chrono::system_clock::time_point completed_at{};
    std::uint64_t bytes{0};
    // Download: peer_id served the file to us. Upload: peer_id fetched it from us.
    TransferDirection direction{TransferDirection::Download};
};

// Append-only transfer log. With a journal path, every record is also appended to a
// tab separated file that is replayed on construction.
class DownloadTracker {
public:
    explicit DownloadTracker(std::optional<std::filesystem::path> journal = std::nullopt);

    void record(DownloadRecord record);

    std::vector<DownloadRecord> by_file(const FileId& file_id) const;
    std::vector<DownloadRecord> by_peer(const PeerId& peer_id) const;
    std::vector<DownloadRecord> all() const;
    std::size_t size() const;

private:
    void load();
    bool append_to_journal(const DownloadRecord& record);

    std::optional<std::filesystem::path> journal_;
    mutable std::mutex mutex_;
    std::vector<DownloadRecord> records_;
};

}  // namespace sharemesh::storage
