#include "sharemesh/Error.hpp"
#include "sharemesh/network/Handshake.hpp"
#include "sharemesh/network/Identity.hpp"
#include "sharemesh/network/Session.hpp"
#include "sharemesh/protocol/Message.hpp"

#include <cassert>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using namespace std::chrono_literals;
using namespace sharemesh;
using namespace sharemesh::network;

namespace {

HandshakeParameters parameters(const std::string& user, std::uint8_t version = protocol::kProtocolVersion) {
    HandshakeParameters params{};
    params.protocol_version = version;
    params.user_id = user;
    params.listen_port = 5001;
    params.freshness_window = 30s;
    return params;
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

void check_successful_exchange() {
    const auto alice = Identity::generate();
    const auto bob = Identity::generate();
    NonceCache nonces(30s);

    HandshakeInitiator initiator(alice, parameters("alice"));
    HandshakeResponder responder(bob, parameters("bob"), nonces);

    auto accepted = responder.accept(initiator.hello());
    auto initiator_keys = initiator.complete(accepted.ack, bob.peer_id());
    const auto& responder_keys = accepted.keys;

    assert(initiator_keys.session_key == responder_keys.session_key);
    assert(initiator_keys.session_id == responder_keys.session_id);
    assert(initiator_keys.remote_peer == bob.peer_id());
    assert(responder_keys.remote_peer == alice.peer_id());
    assert(initiator_keys.remote_user == "bob");
    assert(responder_keys.remote_user == "alice");
    assert(initiator_keys.initiator && !responder_keys.initiator);

    // Channels built from both halves interoperate in both directions.
    SecureChannel to_bob(initiator_keys);
    SecureChannel to_alice(responder_keys);

    protocol::PingPayload ping{};
    ping.token = 77;
    const auto sealed = to_bob.seal(protocol::make_message(ping));
    assert(sealed.has_value());
    const auto* envelope = std::get_if<protocol::SealedPayload>(&sealed->payload);
    assert(envelope != nullptr);

    const auto opened = to_alice.open(*envelope);
    assert(opened.has_value());
    assert(opened->type == protocol::MessageType::Ping);
    assert(std::get<protocol::PingPayload>(opened->payload).token == 77);

    // Replaying an envelope is rejected.
    assert(!to_alice.open(*envelope).has_value());

    auto tampered = *to_bob.seal(protocol::make_message(ping));
    std::get<protocol::SealedPayload>(tampered.payload).ciphertext[0] ^= 0x01;
    assert(!to_alice.open(std::get<protocol::SealedPayload>(tampered.payload)).has_value());

    const std::vector<std::uint8_t> chunk(1000, 0x5a);
    const auto sealed_chunk = to_alice.seal_chunk(3, "file", 4, 0, chunk);
    assert(sealed_chunk.has_value());
    const auto opened_chunk = to_bob.open_chunk(3, "file", 4, 0, *sealed_chunk);
    assert(opened_chunk.has_value() && *opened_chunk == chunk);
    // The nonce and associated data bind transfer, file, index and attempt.
    assert(!to_bob.open_chunk(3, "file", 5, 0, *sealed_chunk).has_value());
    assert(!to_bob.open_chunk(3, "file", 4, 1, *sealed_chunk).has_value());
    assert(!to_bob.open_chunk(4, "file", 4, 0, *sealed_chunk).has_value());
    assert(!to_bob.open_chunk(3, "other", 4, 0, *sealed_chunk).has_value());
    auto flipped = *sealed_chunk;
    flipped[500] ^= 0x10;
    assert(!to_bob.open_chunk(3, "file", 4, 0, flipped).has_value());

    to_bob.wipe();
    assert(!to_bob.seal(protocol::make_message(ping)).has_value());
}

void check_rejections() {
    const auto alice = Identity::generate();
    const auto bob = Identity::generate();
    const auto mallory = Identity::generate();

    {
        NonceCache nonces(30s);
        const auto past = std::chrono::system_clock::now() - 5min;
        HandshakeInitiator initiator(alice, parameters("alice"), past);
        HandshakeResponder responder(bob, parameters("bob"), nonces);
        assert(failure_kind([&] { (void)responder.accept(initiator.hello()); }) == ErrorKind::Auth);
    }
    {
        NonceCache nonces(30s);
        HandshakeInitiator initiator(alice, parameters("alice"));
        HandshakeResponder responder(bob, parameters("bob"), nonces);
        (void)responder.accept(initiator.hello());
        assert(failure_kind([&] { (void)responder.accept(initiator.hello()); }) == ErrorKind::Auth);
        assert(nonces.size() == 1);
    }
    {
        NonceCache nonces(30s);
        HandshakeInitiator initiator(alice, parameters("alice", 2));
        HandshakeResponder responder(bob, parameters("bob", 1), nonces);
        assert(failure_kind([&] { (void)responder.accept(initiator.hello()); }) == ErrorKind::Protocol);
    }
    {
        NonceCache nonces(30s);
        HandshakeInitiator initiator(alice, parameters("alice"));
        auto hello = initiator.hello();
        hello.user_id = "admin";
        HandshakeResponder responder(bob, parameters("bob"), nonces);
        assert(failure_kind([&] { (void)responder.accept(hello); }) == ErrorKind::Auth);
    }
    {
        NonceCache nonces(30s);
        HandshakeInitiator initiator(alice, parameters("alice"));
        HandshakeResponder responder(bob, parameters("bob"), nonces);
        auto accepted = responder.accept(initiator.hello());
        accepted.ack.signature[10] ^= 0x01;
        assert(failure_kind([&] { (void)initiator.complete(accepted.ack); }) == ErrorKind::Auth);
    }
    {
        // A valid responder that is not the peer we meant to reach.
        NonceCache nonces(30s);
        HandshakeInitiator initiator(alice, parameters("alice"));
        HandshakeResponder responder(mallory, parameters("bob"), nonces);
        auto accepted = responder.accept(initiator.hello());
        assert(failure_kind([&] { (void)initiator.complete(accepted.ack, bob.peer_id()); }) == ErrorKind::Auth);
    }
    {
        // HELLO_ACK for another HELLO.
        NonceCache nonces(30s);
        HandshakeInitiator first(alice, parameters("alice"));
        HandshakeInitiator second(alice, parameters("alice"));
        HandshakeResponder responder(bob, parameters("bob"), nonces);
        auto accepted = responder.accept(first.hello());
        assert(failure_kind([&] { (void)second.complete(accepted.ack); }) == ErrorKind::Auth);
    }
}

void check_session_state_machine() {
    const auto alice = Identity::generate();
    const auto bob = Identity::generate();
    NonceCache nonces(30s);
    HandshakeInitiator initiator(alice, parameters("alice"));
    HandshakeResponder responder(bob, parameters("bob"), nonces);
    auto accepted = responder.accept(initiator.hello());
    auto keys = initiator.complete(accepted.ack);

    Session session(Session::Role::Initiator, nullptr);
    assert(session.state() == SessionState::Init);
    assert(!session.authenticate(keys));
    assert(session.begin_key_exchange());
    assert(session.state() == SessionState::KeyExchange);
    assert(session.authenticate(keys));
    assert(session.is_authenticated());
    assert(session.remote_peer() == bob.peer_id());
    assert(session.channel() != nullptr);

    assert(session.close("done"));
    assert(session.state() == SessionState::Closed);
    assert(session.channel() == nullptr);
    assert(!session.fail(make_error(ErrorKind::Network, "late")));
    assert(session.close_reason() == "done");

    Session failing(Session::Role::Responder, nullptr);
    assert(failing.fail(make_error(ErrorKind::Auth, "bad signature")));
    assert(failing.state() == SessionState::Failed);
    assert(failing.failure().has_value() && failing.failure()->kind == ErrorKind::Auth);
    assert(!failing.begin_key_exchange());
}

}  // namespace

int main() {
    check_successful_exchange();
    check_rejections();
    check_session_state_machine();
    return 0;
}
