#include "sharemesh/network/SessionManager.hpp"
#include "test_access.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <mutex>
#include <optional>
#include <variant>
#include <vector>

using namespace std::chrono_literals;
using namespace sharemesh;
using namespace sharemesh::network;

namespace {

Config session_config(const std::string& user) {
    auto config = test::loopback_config(user, std::filesystem::temp_directory_path());
    config.connect_attempts = 1;
    config.handshake_timeout = 2000ms;
    return config;
}

PeerEndpoint endpoint_of(const Identity& identity, const SessionManager& manager) {
    return {identity.peer_id(), "127.0.0.1", manager.listening_port()};
}

template <typename Body>
std::optional<ErrorKind> failure_kind(Body&& body) {
    try {
        body();
    } catch (const Error& error) {
        return error.kind();
    }
    return std::nullopt;
}

}  // namespace

int main() {
    test::silence_logs();

    const auto alice = Identity::generate();
    const auto bob = Identity::generate();
    const auto carol = Identity::generate();
    const auto mallory = Identity::generate();

    SessionManager alice_sessions(alice, session_config("alice"));
    SessionManager bob_sessions(bob, session_config("bob"));
    alice_sessions.start();
    bob_sessions.start();
    assert(bob_sessions.listening_port() != 0);

    std::mutex received_mutex;
    std::vector<protocol::ChunkAckPayload> received;
    std::optional<UserId> sender_user;
    bob_sessions.set_message_handler([&](const SessionManager::SessionHandle& session, const protocol::Message& message) {
        if (const auto* ack = std::get_if<protocol::ChunkAckPayload>(&message.payload)) {
            std::scoped_lock lock(received_mutex);
            received.push_back(*ack);
            sender_user = session->remote_user();
        }
    });
    std::atomic<int> bob_closed{0};
    bob_sessions.set_closed_handler([&](const SessionManager::SessionHandle&) { ++bob_closed; });

    std::atomic<int> auth_failures{0};
    alice_sessions.set_auth_failure_handler([&](const PeerId&, const ErrorInfo& error) {
        assert(error.kind == ErrorKind::Auth);
        ++auth_failures;
    });

    // Handshake, then sealed traffic both ways through the reader threads.
    const auto session = alice_sessions.open(endpoint_of(bob, bob_sessions));
    assert(session && session->is_authenticated());
    assert(session->remote_peer() == bob.peer_id());
    assert(session->remote_user() == "bob");
    assert(alice_sessions.open(endpoint_of(bob, bob_sessions)) == session);
    assert(test::eventually([&] { return bob_sessions.session_count(alice.peer_id()) == 1; }));

    protocol::ChunkAckPayload ack{};
    ack.transfer_id = 11;
    ack.file_id = "abc";
    ack.index = 2;
    assert(session->send(protocol::make_message(ack)));
    assert(test::eventually([&] {
        std::scoped_lock lock(received_mutex);
        return received.size() == 1;
    }));
    {
        std::scoped_lock lock(received_mutex);
        assert(received[0].transfer_id == 11);
        assert(received[0].index == 2);
        assert(sender_user == "alice");
    }

    // The responder is not the peer we expected.
    assert(failure_kind([&] { (void)alice_sessions.open({mallory.peer_id(), "127.0.0.1", bob_sessions.listening_port()}); }) ==
           ErrorKind::Auth);
    assert(auth_failures.load() == 1);
    assert(alice_sessions.session_count(mallory.peer_id()) == 0);
    // Only bob keeps a slot; the failed attempt left nothing behind.
    assert(test::SessionManagerTestAccess::slot_count(alice_sessions) == 1);

    {
        // A HELLO altered after signing is refused by the responder.
        SessionManager::TestHooks hooks;
        hooks.mutate_outgoing_hello = [](protocol::HelloPayload& hello) { hello.user_id = "admin"; };
        SessionManager::set_test_hooks(&hooks);
        SessionManager carol_sessions(carol, session_config("carol"));
        carol_sessions.start();
        assert(failure_kind([&] { (void)carol_sessions.open(endpoint_of(bob, bob_sessions)); }) == ErrorKind::Auth);
        SessionManager::set_test_hooks(nullptr);
        assert(bob_sessions.session_count(carol.peer_id()) == 0);

        // Without tampering the same peer gets in.
        assert(carol_sessions.open(endpoint_of(bob, bob_sessions))->is_authenticated());
        carol_sessions.stop();
    }
    {
        auto config = session_config("dave");
        config.protocol_version = 2;
        const auto dave = Identity::generate();
        SessionManager dave_sessions(dave, config);
        dave_sessions.start();
        assert(failure_kind([&] { (void)dave_sessions.open(endpoint_of(bob, bob_sessions)); }) == ErrorKind::Protocol);
        dave_sessions.stop();
    }
    {
        // Nothing listens on a stopped manager's port.
        const auto erin = Identity::generate();
        SessionManager erin_sessions(erin, session_config("erin"));
        erin_sessions.start();
        const auto port = erin_sessions.listening_port();
        erin_sessions.stop();
        assert(failure_kind([&] { (void)alice_sessions.open({erin.peer_id(), "127.0.0.1", port}); }) ==
               ErrorKind::Network);
    }

    {
        // With one session per peer a second connection from the same identity is turned away.
        auto limited_config = session_config("bob");
        limited_config.max_sessions_per_peer = 1;
        SessionManager limited(bob, limited_config);
        SessionManager first(alice, session_config("alice"));
        SessionManager second(alice, session_config("alice"));
        limited.start();
        first.start();
        second.start();

        const auto kept = first.open(endpoint_of(bob, limited));
        assert(kept->is_authenticated());
        assert(test::eventually([&] { return limited.session_count(alice.peer_id()) == 1; }));
        assert(first.open(endpoint_of(bob, limited)) == kept);

        const auto extra = second.open(endpoint_of(bob, limited));
        assert(test::eventually([&] { return extra->is_terminal(); }));
        assert(test::eventually([&] { return second.session_count(bob.peer_id()) == 0; }));
        assert(limited.session_count(alice.peer_id()) == 1);
        assert(kept->is_authenticated());

        // Once the first one closes the identity may connect again.
        first.close(kept, "done");
        assert(test::eventually([&] { return limited.session_count(alice.peer_id()) == 0; }));
        assert(test::eventually([&] { return test::SessionManagerTestAccess::slot_count(limited) == 0; }));
        const auto again = second.open(endpoint_of(bob, limited));
        assert(again->is_authenticated());
        assert(test::eventually([&] { return limited.session_count(alice.peer_id()) == 1; }));

        second.stop();
        first.stop();
        limited.stop();
    }

    // GOODBYE ends the session on both sides.
    const int closed_before = bob_closed.load();
    alice_sessions.close(session, "done");
    assert(session->state() == SessionState::Closed);
    assert(test::eventually([&] { return bob_sessions.session_count(alice.peer_id()) == 0; }));
    assert(test::eventually([&] { return bob_closed.load() > closed_before; }));
    assert(test::eventually([&] { return test::SessionManagerTestAccess::slot_count(alice_sessions) == 0; }));
    assert(alice_sessions.open(endpoint_of(bob, bob_sessions)) != session);

    alice_sessions.stop();
    bob_sessions.stop();
    assert(alice_sessions.active_session_count() == 0);
    return 0;
}
