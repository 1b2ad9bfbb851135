#pragma once

#include "sharemesh/Error.hpp"
#include "sharemesh/Types.hpp"
#include "sharemesh/crypto/Aead.hpp"
#include "sharemesh/network/Identity.hpp"
#include "sharemesh/network/KeyExchange.hpp"
#include "sharemesh/protocol/Message.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>

namespace sharemesh::network {

using SessionId = std::array<std::uint8_t, 16>;

struct HandshakeKeys {
    crypto::Key session_key{};
    SessionId session_id{};
    PeerId local_peer{};
    PeerId remote_peer{};
    PublicKey remote_identity{};
    UserId remote_user;
    std::uint16_t remote_listen_port{0};
    bool initiator{false};

    void wipe() noexcept;
};

struct HandshakeParameters {
    std::uint8_t protocol_version{protocol::kProtocolVersion};
    UserId user_id;
    std::uint16_t listen_port{0};
    std::chrono::seconds freshness_window{std::chrono::seconds(30)};
};

// Remembers HELLO nonces for the freshness window so a captured HELLO cannot be replayed.
class NonceCache {
public:
    explicit NonceCache(std::chrono::seconds window);

    // false when the nonce was already seen inside the window.
    bool remember(const protocol::Nonce32& nonce,
                  std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());
    std::size_t size() const;

private:
    void prune(std::chrono::steady_clock::time_point now);

    std::chrono::seconds window_;
    mutable std::mutex mutex_;
    std::deque<std::pair<std::chrono::steady_clock::time_point, std::string>> order_;
    std::unordered_set<std::string> seen_;
};

std::uint64_t to_unix_millis(std::chrono::system_clock::time_point time);
Hash256 hello_digest(const protocol::HelloPayload& hello);

class HandshakeInitiator {
public:
    HandshakeInitiator(const Identity& identity,
                       HandshakeParameters parameters,
                       std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
    ~HandshakeInitiator();

    HandshakeInitiator(const HandshakeInitiator&) = delete;
    HandshakeInitiator& operator=(const HandshakeInitiator&) = delete;

    const protocol::HelloPayload& hello() const noexcept { return hello_; }

    // Throws Error with kind Protocol or Auth.
    HandshakeKeys complete(const protocol::HelloAckPayload& ack,
                           const std::optional<PeerId>& expected_peer = std::nullopt);

private:
    const Identity& identity_;
    HandshakeParameters parameters_;
    KeyPair ephemeral_;
    protocol::HelloPayload hello_{};
    Hash256 hello_digest_{};
};

class HandshakeResponder {
public:
    struct Accepted {
        protocol::HelloAckPayload ack;
        HandshakeKeys keys;
    };

    HandshakeResponder(const Identity& identity, HandshakeParameters parameters, NonceCache& nonces);

    // Throws Error with kind Protocol or Auth.
    Accepted accept(const protocol::HelloPayload& hello,
                    std::chrono::system_clock::time_point now = std::chrono::system_clock::now(),
                    std::chrono::steady_clock::time_point monotonic_now = std::chrono::steady_clock::now());

private:
    const Identity& identity_;
    HandshakeParameters parameters_;
    NonceCache& nonces_;
};

}  // namespace sharemesh::network
