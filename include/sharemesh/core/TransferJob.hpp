#pragma once

#include "sharemesh/Error.hpp"
#include "sharemesh/Types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>

namespace sharemesh {

enum class JobState : std::uint8_t {
    Pending,
    Authorizing,
    Active,
    Complete,
    Failed,
    Cancelled
};

std::string_view to_string(JobState state) noexcept;
bool is_terminal(JobState state) noexcept;

struct JobSnapshot {
    JobId id{0};
    FileId file_id;
    PeerId peer_id{};
    TransferDirection direction{TransferDirection::Download};
    JobState state{JobState::Pending};
    std::string name;
    std::set<ChunkIndex> completed;
    std::map<ChunkIndex, std::uint32_t> retries;
    std::size_t chunk_count{0};
    std::uint64_t file_size{0};
    std::uint64_t bytes_transferred{0};
    std::size_t in_flight{0};
    std::optional<ErrorInfo> error;
    std::string cancel_reason;
};

// One upload or download. State changes go through explicit variant transitions; the
// completed chunk set only grows.
class TransferJob {
public:
    using Clock = std::chrono::steady_clock;

    struct Pending {};
    struct Authorizing {
        Clock::time_point since{};
    };
    struct Active {
        Clock::time_point since{};
    };
    struct Complete {
        std::chrono::system_clock::time_point finished{};
    };
    struct Failed {
        ErrorInfo error;
    };
    struct Cancelled {
        std::string reason;
    };
    using State = std::variant<Pending, Authorizing, Active, Complete, Failed, Cancelled>;

    TransferJob(JobId id, FileId file_id, PeerId peer_id, TransferDirection direction);

    TransferJob(const TransferJob&) = delete;
    TransferJob& operator=(const TransferJob&) = delete;

    JobId id() const noexcept { return id_; }
    const FileId& file_id() const noexcept { return file_id_; }
    const PeerId& peer_id() const noexcept { return peer_id_; }
    TransferDirection direction() const noexcept { return direction_; }

    JobState state() const;
    bool is_terminal() const { return sharemesh::is_terminal(state()); }

    bool begin_authorization(Clock::time_point now = Clock::now());
    bool activate(Clock::time_point now = Clock::now());
    bool complete();
    bool fail(ErrorInfo error);
    bool cancel(std::string reason);

    void describe_file(std::string name, std::size_t chunk_count, std::uint64_t file_size);
    // Seeds completed chunks from an earlier attempt.
    void restore(const std::set<ChunkIndex>& completed, std::uint64_t bytes);
    // Drops restored chunks that no longer match the file. Only legal before activation.
    void forget_restored();

    bool mark_completed(ChunkIndex index, std::uint64_t bytes);
    bool is_completed(ChunkIndex index) const;
    std::set<ChunkIndex> completed() const;
    std::uint32_t note_retry(ChunkIndex index);
    std::uint32_t retries(ChunkIndex index) const;
    void set_in_flight(std::size_t count);

    JobSnapshot snapshot() const;

private:
    template <typename Transition>
    bool transition(Transition&& next_state);

    static JobState state_of(const State& state) noexcept;

    const JobId id_;
    const FileId file_id_;
    const PeerId peer_id_;
    const TransferDirection direction_;

    mutable std::mutex mutex_;
    State state_{Pending{}};
    std::string name_;
    std::size_t chunk_count_{0};
    std::uint64_t file_size_{0};
    std::uint64_t bytes_transferred_{0};
    std::size_t in_flight_{0};
    std::set<ChunkIndex> completed_;
    std::map<ChunkIndex, std::uint32_t> retries_;
};

}  // namespace sharemesh
