#pragma once

#include "sharemesh/Error.hpp"
#include "sharemesh/Types.hpp"
#include "sharemesh/network/Connection.hpp"
#include "sharemesh/network/Handshake.hpp"
#include "sharemesh/protocol/Message.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <variant>

namespace sharemesh::network {

enum class SessionState {
    Init,
    KeyExchange,
    Authenticated,
    Closed,
    Failed
};

std::string_view to_string(SessionState state) noexcept;

// Authenticated encryption for one session. Control messages travel in SEALED
// envelopes with per-direction sequence numbers; chunks are sealed on their own.
class SecureChannel {
public:
    explicit SecureChannel(HandshakeKeys keys);
    ~SecureChannel();

    SecureChannel(const SecureChannel&) = delete;
    SecureChannel& operator=(const SecureChannel&) = delete;

    std::optional<protocol::Message> seal(const protocol::Message& inner);
    // Rejects tampered envelopes and sequence numbers that do not increase.
    std::optional<protocol::Message> open(const protocol::SealedPayload& sealed);

    std::optional<std::vector<std::uint8_t>> seal_chunk(std::uint64_t transfer_id,
                                                        const FileId& file_id,
                                                        ChunkIndex index,
                                                        std::uint32_t attempt,
                                                        std::span<const std::uint8_t> plaintext) const;
    std::optional<ChunkData> open_chunk(std::uint64_t transfer_id,
                                        const FileId& file_id,
                                        ChunkIndex index,
                                        std::uint32_t attempt,
                                        std::span<const std::uint8_t> sealed) const;

    const SessionId& session_id() const noexcept { return session_id_; }
    bool initiator() const noexcept { return initiator_; }

    void wipe() noexcept;

private:
    crypto::Nonce frame_nonce(std::uint8_t direction, std::uint64_t sequence) const;
    crypto::Nonce chunk_nonce(std::uint8_t direction,
                              std::uint64_t transfer_id,
                              const FileId& file_id,
                              ChunkIndex index,
                              std::uint32_t attempt) const;

    std::uint8_t outbound_direction() const noexcept { return initiator_ ? 0 : 1; }
    std::uint8_t inbound_direction() const noexcept { return initiator_ ? 1 : 0; }

    mutable std::mutex mutex_;
    crypto::Key key_{};
    SessionId session_id_{};
    bool initiator_{false};
    bool wiped_{false};
    std::uint64_t send_sequence_{0};
    std::uint64_t receive_sequence_{0};
};

class Session {
public:
    using Clock = std::chrono::steady_clock;

    enum class Role {
        Initiator,
        Responder
    };

    struct Init {};
    struct KeyExchanging {
        Clock::time_point started{};
    };
    struct Authenticated {
        std::shared_ptr<SecureChannel> channel;
        Clock::time_point established{};
    };
    struct Closed {
        std::string reason;
    };
    struct Failed {
        ErrorInfo error;
    };
    using State = std::variant<Init, KeyExchanging, Authenticated, Closed, Failed>;

    Session(Role role, std::unique_ptr<Connection> connection, Clock::time_point now = Clock::now());
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    SessionState state() const;
    bool is_authenticated() const { return state() == SessionState::Authenticated; }
    bool is_terminal() const;
    Role role() const noexcept { return role_; }
    std::uint64_t id() const noexcept { return id_; }

    bool begin_key_exchange(Clock::time_point now = Clock::now());
    bool authenticate(HandshakeKeys keys, Clock::time_point now = Clock::now());
    bool close(std::string reason);
    bool fail(ErrorInfo error);

    std::optional<ErrorInfo> failure() const;
    std::string close_reason() const;

    // Valid once authenticated; kept after close for reporting.
    PeerId remote_peer() const;
    UserId remote_user() const;
    std::uint16_t remote_listen_port() const;
    std::string remote_host() const;

    std::shared_ptr<SecureChannel> channel() const;

    bool send_plain(const protocol::Message& message);
    bool send(const protocol::Message& inner);
    bool send_chunk(std::uint64_t transfer_id,
                    const FileId& file_id,
                    ChunkIndex index,
                    std::uint32_t attempt,
                    std::span<const std::uint8_t> plaintext);

    Connection& connection() noexcept { return *connection_; }

    void touch(Clock::time_point now = Clock::now());
    Clock::time_point last_activity() const;
    Clock::time_point created_at() const noexcept { return created_at_; }
    Clock::time_point established_at() const;

    void attach_job();
    void detach_job();
    std::size_t job_count() const noexcept { return jobs_.load(); }

    void start_reader(std::thread reader);
    void mark_reader_finished() noexcept { reader_finished_.store(true); }
    bool reader_finished() const noexcept { return reader_finished_.load(); }
    void join_reader();

private:
    template <typename Transition>
    bool transition(Transition&& next_state);

    static SessionState state_of(const State& state) noexcept;

    const Role role_;
    const std::uint64_t id_;
    std::unique_ptr<Connection> connection_;
    const Clock::time_point created_at_;

    mutable std::mutex mutex_;
    State state_{Init{}};
    PeerId remote_peer_{};
    UserId remote_user_;
    std::uint16_t remote_listen_port_{0};
    Clock::time_point last_activity_;

    std::mutex send_mutex_;
    std::atomic<std::size_t> jobs_{0};
    std::mutex reader_mutex_;
    std::thread reader_;
    std::atomic<bool> reader_finished_{false};
};

}  // namespace sharemesh::network
