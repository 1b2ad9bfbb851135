#include "sharemesh/storage/DownloadTracker.hpp"

#include "sharemesh/daemon/StructuredLogger.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

namespace sharemesh::storage {

namespace {

std::int64_t to_millis(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

template <typename Integer>
bool parse_integer(const std::string& text, Integer& value) {
    const auto* end = text.data() + text.size();
    const auto result = std::from_chars(text.data(), end, value);
    return result.ec == std::errc{} && result.ptr == end;
}

std::optional<DownloadRecord> parse_line(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream stream(line);
    std::string field;
    while (std::getline(stream, field, '\t')) {
        fields.push_back(field);
    }
    if (fields.size() != 5 || fields[0].empty()) {
        return std::nullopt;
    }

    DownloadRecord record;
    record.file_id = fields[0];
    const auto peer = peer_id_from_string(fields[1]);
    std::int64_t millis = 0;
    if (!peer.has_value() || !parse_integer(fields[2], millis) || !parse_integer(fields[3], record.bytes)) {
        return std::nullopt;
    }
    record.peer_id = *peer;
    record.completed_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
    if (fields[4] == "upload") {
        record.direction = TransferDirection::Upload;
    } else if (fields[4] == "download") {
        record.direction = TransferDirection::Download;
    } else {
        return std::nullopt;
    }
    return record;
}

}  // namespace

DownloadTracker::DownloadTracker(std::optional<std::filesystem::path> journal)
    : journal_(std::move(journal)) {
    if (journal_.has_value()) {
        load();
    }
}

void DownloadTracker::load() {
    std::ifstream input(*journal_);
    if (!input) {
        return;
    }
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        if (line.empty()) {
            continue;
        }
        if (auto record = parse_line(line)) {
            records_.push_back(std::move(*record));
        } else {
            daemon::StructuredLogger::instance().warning(
                "tracker.journal_skipped",
                {{"path", journal_->string()}, {"line", std::to_string(line_number)}});
        }
    }
}

bool DownloadTracker::append_to_journal(const DownloadRecord& record) {
    std::ofstream output(*journal_, std::ios::app);
    if (!output) {
        return false;
    }
    output << record.file_id << '\t' << peer_id_to_string(record.peer_id) << '\t' << to_millis(record.completed_at)
           << '\t' << record.bytes << '\t' << to_string(record.direction) << '\n';
    return static_cast<bool>(output);
}

void DownloadTracker::record(DownloadRecord record) {
    {
        std::scoped_lock lock(mutex_);
        if (journal_.has_value() && !append_to_journal(record)) {
            daemon::StructuredLogger::instance().error("tracker.journal_failed", {{"path", journal_->string()}});
        }
        records_.push_back(record);
    }
    daemon::StructuredLogger::instance().info("tracker.record",
                                              {{"file", record.file_id},
                                               {"peer", peer_id_to_string(record.peer_id)},
                                               {"bytes", std::to_string(record.bytes)},
                                               {"direction", std::string(to_string(record.direction))}});
}

std::vector<DownloadRecord> DownloadTracker::by_file(const FileId& file_id) const {
    std::scoped_lock lock(mutex_);
    std::vector<DownloadRecord> matches;
    for (const auto& record : records_) {
        if (record.file_id == file_id) {
            matches.push_back(record);
        }
    }
    return matches;
}

std::vector<DownloadRecord> DownloadTracker::by_peer(const PeerId& peer_id) const {
    std::scoped_lock lock(mutex_);
    std::vector<DownloadRecord> matches;
    for (const auto& record : records_) {
        if (record.peer_id == peer_id) {
            matches.push_back(record);
        }
    }
    return matches;
}

std::vector<DownloadRecord> DownloadTracker::all() const {
    std::scoped_lock lock(mutex_);
    return records_;
}

std::size_t DownloadTracker::size() const {
    std::scoped_lock lock(mutex_);
    return records_.size();
}

}  // namespace sharemesh::storage
