#pragma once

#include "sharemesh/Config.hpp"
#include "sharemesh/Error.hpp"
#include "sharemesh/Types.hpp"
#include "sharemesh/network/Connection.hpp"
#include "sharemesh/network/Handshake.hpp"
#include "sharemesh/network/Identity.hpp"
#include "sharemesh/network/Session.hpp"
#include "sharemesh/protocol/Message.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace sharemesh::test {
class SessionManagerTestAccess;
}  // namespace sharemesh::test

namespace sharemesh::network {

struct PeerEndpoint {
    PeerId peer_id{};
    std::string host;
    std::uint16_t port{0};
};

class SessionManager {
public:
    using Clock = std::chrono::steady_clock;
    using SessionHandle = std::shared_ptr<Session>;
    // Runs on the session's reader thread; must not block for long.
    using MessageHandler = std::function<void(const SessionHandle&, const protocol::Message&)>;
    using ClosedHandler = std::function<void(const SessionHandle&)>;
    using AuthFailureHandler = std::function<void(const PeerId&, const ErrorInfo&)>;

    SessionManager(const Identity& identity, Config config);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Throws std::runtime_error when the listen address cannot be bound.
    void start();
    void stop();

    std::uint16_t listening_port() const noexcept;

    void set_message_handler(MessageHandler handler);
    void set_closed_handler(ClosedHandler handler);
    void set_auth_failure_handler(AuthFailureHandler handler);

    // Returns an authenticated session, reusing one when the peer already has it.
    // Throws Error: Network once connect attempts are exhausted, Auth or Protocol
    // when the handshake is rejected. Failed handshakes are not retried here.
    SessionHandle open(const PeerEndpoint& endpoint);

    // Sends GOODBYE and closes.
    void close(const SessionHandle& session, const std::string& reason);

    // Closes idle or expired sessions without jobs, pings quiet ones, reaps finished ones.
    std::size_t sweep(Clock::time_point now = Clock::now());

    std::size_t active_session_count() const;
    std::size_t session_count(const PeerId& peer_id) const;
    std::vector<SessionHandle> sessions() const;

    struct TestHooks {
        std::function<void(protocol::HelloPayload&)> mutate_outgoing_hello;
        std::function<void(protocol::HelloAckPayload&)> mutate_outgoing_ack;
    };

    static void set_test_hooks(const TestHooks* hooks);

private:
    friend class test::SessionManagerTestAccess;

    struct PeerSlot {
        std::mutex open_mutex;
        std::mutex mutex;
        std::vector<SessionHandle> sessions;
    };

    HandshakeParameters handshake_parameters() const;
    std::shared_ptr<PeerSlot> slot_for(const PeerId& peer_id);
    std::shared_ptr<PeerSlot> find_slot(const PeerId& peer_id) const;
    SessionHandle reusable_session(PeerSlot& slot) const;
    std::size_t live_count(PeerSlot& slot) const;
    // Registers an authenticated session unless the peer is at its limit.
    bool attach_session(const PeerId& peer_id, const SessionHandle& session);
    void drop_slot_if_empty(const PeerId& peer_id);

    std::unique_ptr<Connection> connect_with_backoff(const PeerEndpoint& endpoint);
    SessionHandle run_initiator(std::unique_ptr<Connection> connection, const PeerEndpoint& endpoint);
    void run_responder(const SessionHandle& session);
    void receive_loop(const SessionHandle& session);
    void dispatch(const SessionHandle& session, const protocol::Message& message);
    void launch_reader(const SessionHandle& session, bool responder);
    void finish_session(const SessionHandle& session);
    void report_failure(const SessionHandle& session, const ErrorInfo& error);
    void reject_handshake(const SessionHandle& session, const ErrorInfo& error);
    void accept_loop();
    void reap();

    const Identity& identity_;
    Config config_;
    NonceCache nonces_;
    Listener listener_;

    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    mutable std::mutex handler_mutex_;
    MessageHandler message_handler_{};
    ClosedHandler closed_handler_{};
    AuthFailureHandler auth_failure_handler_{};

    mutable std::shared_mutex slots_mutex_;
    std::unordered_map<std::string, std::shared_ptr<PeerSlot>> slots_;

    mutable std::mutex tracked_mutex_;
    std::vector<SessionHandle> tracked_;
};

}  // namespace sharemesh::network
