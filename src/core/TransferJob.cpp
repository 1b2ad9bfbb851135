#include "sharemesh/core/TransferJob.hpp"

#include "sharemesh/daemon/StructuredLogger.hpp"

#include <type_traits>
#include <utility>

namespace sharemesh {

std::string_view to_string(JobState state) noexcept {
    switch (state) {
        case JobState::Pending:
            return "PENDING";
        case JobState::Authorizing:
            return "AUTHORIZING";
        case JobState::Active:
            return "ACTIVE";
        case JobState::Complete:
            return "COMPLETE";
        case JobState::Failed:
            return "FAILED";
        case JobState::Cancelled:
            return "CANCELLED";
    }
    return "UNKNOWN";
}

bool is_terminal(JobState state) noexcept {
    return state == JobState::Complete || state == JobState::Failed || state == JobState::Cancelled;
}

TransferJob::TransferJob(JobId id, FileId file_id, PeerId peer_id, TransferDirection direction)
    : id_(id),
      file_id_(std::move(file_id)),
      peer_id_(peer_id),
      direction_(direction) {}

JobState TransferJob::state_of(const State& state) noexcept {
    return std::visit(
        [](const auto& current) {
            using S = std::decay_t<decltype(current)>;
            if constexpr (std::is_same_v<S, Pending>) {
                return JobState::Pending;
            } else if constexpr (std::is_same_v<S, Authorizing>) {
                return JobState::Authorizing;
            } else if constexpr (std::is_same_v<S, Active>) {
                return JobState::Active;
            } else if constexpr (std::is_same_v<S, Complete>) {
                return JobState::Complete;
            } else if constexpr (std::is_same_v<S, Failed>) {
                return JobState::Failed;
            } else {
                return JobState::Cancelled;
            }
        },
        state);
}

template <typename Transition>
bool TransferJob::transition(Transition&& next_state) {
    JobState from{};
    JobState to{};
    {
        std::scoped_lock lock(mutex_);
        std::optional<State> next = std::visit(next_state, state_);
        if (!next.has_value()) {
            return false;
        }
        from = state_of(state_);
        state_ = std::move(*next);
        to = state_of(state_);
    }

    daemon::StructuredLogger::instance().info("transfer.job.state",
                                              {{"job", std::to_string(id_)},
                                               {"direction", std::string(to_string(direction_))},
                                               {"file", file_id_},
                                               {"peer", peer_id_to_string(peer_id_)},
                                               {"from", std::string(to_string(from))},
                                               {"to", std::string(to_string(to))}});
    return true;
}

JobState TransferJob::state() const {
    std::scoped_lock lock(mutex_);
    return state_of(state_);
}

bool TransferJob::begin_authorization(Clock::time_point now) {
    return transition([now](const auto& current) -> std::optional<State> {
        using S = std::decay_t<decltype(current)>;
        if constexpr (std::is_same_v<S, Pending>) {
            return Authorizing{now};
        } else {
            return std::nullopt;
        }
    });
}

bool TransferJob::activate(Clock::time_point now) {
    return transition([now](const auto& current) -> std::optional<State> {
        using S = std::decay_t<decltype(current)>;
        if constexpr (std::is_same_v<S, Authorizing>) {
            return Active{now};
        } else {
            return std::nullopt;
        }
    });
}

bool TransferJob::complete() {
    return transition([](const auto& current) -> std::optional<State> {
        using S = std::decay_t<decltype(current)>;
        if constexpr (std::is_same_v<S, Active>) {
            return Complete{std::chrono::system_clock::now()};
        } else {
            return std::nullopt;
        }
    });
}

bool TransferJob::fail(ErrorInfo error) {
    if (is_unset(error.peer)) {
        error.peer = peer_id_;
    }
    if (!error.file_id.has_value()) {
        error.file_id = file_id_;
    }
    const bool changed = transition([&error](const auto& current) -> std::optional<State> {
        using S = std::decay_t<decltype(current)>;
        if constexpr (std::is_same_v<S, Complete> || std::is_same_v<S, Failed> || std::is_same_v<S, Cancelled>) {
            return std::nullopt;
        } else {
            return Failed{error};
        }
    });
    if (changed) {
        daemon::StructuredLogger::instance().warning(
            "transfer.job.failed",
            {{"job", std::to_string(id_)},
             {"kind", std::string(to_string(error.kind))},
             {"reason", error.message},
             {"file", file_id_},
             {"chunk", error.chunk_index ? std::to_string(*error.chunk_index) : std::string("-")},
             {"peer", peer_id_to_string(error.peer)}});
    }
    return changed;
}

bool TransferJob::cancel(std::string reason) {
    return transition([&reason](const auto& current) -> std::optional<State> {
        using S = std::decay_t<decltype(current)>;
        if constexpr (std::is_same_v<S, Complete> || std::is_same_v<S, Failed> || std::is_same_v<S, Cancelled>) {
            return std::nullopt;
        } else {
            return Cancelled{reason};
        }
    });
}

void TransferJob::describe_file(std::string name, std::size_t chunk_count, std::uint64_t file_size) {
    std::scoped_lock lock(mutex_);
    name_ = std::move(name);
    chunk_count_ = chunk_count;
    file_size_ = file_size;
}

void TransferJob::restore(const std::set<ChunkIndex>& completed, std::uint64_t bytes) {
    std::scoped_lock lock(mutex_);
    completed_.insert(completed.begin(), completed.end());
    bytes_transferred_ += bytes;
}

void TransferJob::forget_restored() {
    std::scoped_lock lock(mutex_);
    if (std::holds_alternative<Pending>(state_) || std::holds_alternative<Authorizing>(state_)) {
        completed_.clear();
        bytes_transferred_ = 0;
    }
}

bool TransferJob::mark_completed(ChunkIndex index, std::uint64_t bytes) {
    std::scoped_lock lock(mutex_);
    if (sharemesh::is_terminal(state_of(state_)) || !completed_.insert(index).second) {
        return false;
    }
    bytes_transferred_ += bytes;
    return true;
}

bool TransferJob::is_completed(ChunkIndex index) const {
    std::scoped_lock lock(mutex_);
    return completed_.contains(index);
}

std::set<ChunkIndex> TransferJob::completed() const {
    std::scoped_lock lock(mutex_);
    return completed_;
}

std::uint32_t TransferJob::note_retry(ChunkIndex index) {
    std::scoped_lock lock(mutex_);
    return ++retries_[index];
}

std::uint32_t TransferJob::retries(ChunkIndex index) const {
    std::scoped_lock lock(mutex_);
    const auto it = retries_.find(index);
    return it == retries_.end() ? 0 : it->second;
}

void TransferJob::set_in_flight(std::size_t count) {
    std::scoped_lock lock(mutex_);
    in_flight_ = count;
}

JobSnapshot TransferJob::snapshot() const {
    std::scoped_lock lock(mutex_);
    JobSnapshot snapshot;
    snapshot.id = id_;
    snapshot.file_id = file_id_;
    snapshot.peer_id = peer_id_;
    snapshot.direction = direction_;
    snapshot.state = state_of(state_);
    snapshot.name = name_;
    snapshot.completed = completed_;
    snapshot.retries = retries_;
    snapshot.chunk_count = chunk_count_;
    snapshot.file_size = file_size_;
    snapshot.bytes_transferred = bytes_transferred_;
    snapshot.in_flight = in_flight_;
    if (const auto* failed = std::get_if<Failed>(&state_)) {
        snapshot.error = failed->error;
    }
    if (const auto* cancelled = std::get_if<Cancelled>(&state_)) {
        snapshot.cancel_reason = cancelled->reason;
    }
    return snapshot;
}

}  // namespace sharemesh
