#include "sharemesh/network/Handshake.hpp"

#include "sharemesh/crypto/Hkdf.hpp"
#include "sharemesh/crypto/Sha256.hpp"

#include <algorithm>
#include <string_view>
#include <vector>

namespace sharemesh::network {

namespace {

constexpr std::string_view kSessionInfoLabel = "sharemesh-session-v1";
constexpr std::string_view kSessionIdLabel = "sharemesh-session-id-v1";

void append(std::vector<std::uint8_t>& out, std::span<const std::uint8_t> bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

void append(std::vector<std::uint8_t>& out, std::string_view text) {
    out.insert(out.end(), text.begin(), text.end());
}

Hash256 ack_digest(const protocol::HelloAckPayload& ack) {
    crypto::Sha256 hasher;
    hasher.update(protocol::hello_ack_signing_bytes(ack));
    hasher.update(ack.signature);
    return hasher.finalize();
}

HandshakeKeys derive_keys(const crypto::Key& shared_secret,
                          const protocol::HelloPayload& hello,
                          const protocol::HelloAckPayload& ack,
                          bool initiator) {
    const auto initiator_peer = Identity::derive_peer_id(hello.identity_key);
    const auto responder_peer = Identity::derive_peer_id(ack.identity_key);

    std::vector<std::uint8_t> salt;
    append(salt, hello.nonce);
    append(salt, ack.nonce);

    std::vector<std::uint8_t> info;
    append(info, kSessionInfoLabel);
    append(info, initiator_peer);
    append(info, responder_peer);

    HandshakeKeys keys{};
    keys.session_key = crypto::hkdf_sha256(shared_secret, salt, info);

    crypto::Sha256 transcript;
    transcript.update(kSessionIdLabel);
    transcript.update(ack.hello_digest);
    transcript.update(ack_digest(ack));
    const auto transcript_hash = transcript.finalize();
    std::copy_n(transcript_hash.begin(), keys.session_id.size(), keys.session_id.begin());

    keys.initiator = initiator;
    if (initiator) {
        keys.local_peer = initiator_peer;
        keys.remote_peer = responder_peer;
        keys.remote_identity = ack.identity_key;
        keys.remote_user = ack.user_id;
        keys.remote_listen_port = ack.listen_port;
    } else {
        keys.local_peer = responder_peer;
        keys.remote_peer = initiator_peer;
        keys.remote_identity = hello.identity_key;
        keys.remote_user = hello.user_id;
        keys.remote_listen_port = hello.listen_port;
    }
    return keys;
}

}  // namespace

void HandshakeKeys::wipe() noexcept {
    crypto::secure_wipe(session_key);
}

NonceCache::NonceCache(std::chrono::seconds window)
    : window_(window) {}

bool NonceCache::remember(const protocol::Nonce32& nonce, std::chrono::steady_clock::time_point now) {
    std::scoped_lock lock(mutex_);
    prune(now);
    auto key = to_hex(nonce);
    if (!seen_.insert(key).second) {
        return false;
    }
    order_.emplace_back(now, std::move(key));
    return true;
}

std::size_t NonceCache::size() const {
    std::scoped_lock lock(mutex_);
    return seen_.size();
}

void NonceCache::prune(std::chrono::steady_clock::time_point now) {
    // Twice the window: a timestamp may sit at either edge of it.
    while (!order_.empty() && now - order_.front().first > window_ * 2) {
        seen_.erase(order_.front().second);
        order_.pop_front();
    }
}

std::uint64_t to_unix_millis(std::chrono::system_clock::time_point time) {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
    return millis < 0 ? 0 : static_cast<std::uint64_t>(millis);
}

Hash256 hello_digest(const protocol::HelloPayload& hello) {
    crypto::Sha256 hasher;
    hasher.update(protocol::hello_signing_bytes(hello));
    hasher.update(hello.signature);
    return hasher.finalize();
}

HandshakeInitiator::HandshakeInitiator(const Identity& identity,
                                       HandshakeParameters parameters,
                                       std::chrono::system_clock::time_point now)
    : identity_(identity),
      parameters_(std::move(parameters)),
      ephemeral_(KeyExchange::make_keypair()) {
    hello_.protocol_version = parameters_.protocol_version;
    hello_.identity_key = identity_.public_key();
    hello_.ephemeral_key = ephemeral_.public_key;
    crypto::random_bytes(hello_.nonce);
    hello_.timestamp_ms = to_unix_millis(now);
    hello_.user_id = parameters_.user_id;
    hello_.listen_port = parameters_.listen_port;
    hello_.signature = identity_.sign(protocol::hello_signing_bytes(hello_));
    hello_digest_ = hello_digest(hello_);
}

HandshakeInitiator::~HandshakeInitiator() {
    ephemeral_.wipe();
}

HandshakeKeys HandshakeInitiator::complete(const protocol::HelloAckPayload& ack,
                                           const std::optional<PeerId>& expected_peer) {
    const auto remote_peer = Identity::derive_peer_id(ack.identity_key);
    if (ack.protocol_version != parameters_.protocol_version) {
        throw Error(ErrorKind::Protocol,
                    "protocol version mismatch: remote " + std::to_string(ack.protocol_version) +
                        ", local " + std::to_string(parameters_.protocol_version),
                    remote_peer);
    }
    if (!crypto::constant_time_equal(ack.hello_digest, hello_digest_)) {
        throw Error(ErrorKind::Auth, "HELLO_ACK answers a different HELLO", remote_peer);
    }
    if (!Identity::verify(ack.identity_key, protocol::hello_ack_signing_bytes(ack), ack.signature)) {
        throw Error(ErrorKind::Auth, "invalid HELLO_ACK signature", remote_peer);
    }
    if (expected_peer.has_value() && *expected_peer != remote_peer) {
        throw Error(ErrorKind::Auth, "responder identity does not match the announced peer", remote_peer);
    }

    auto shared = KeyExchange::derive_shared_secret(ephemeral_, ack.ephemeral_key);
    if (!shared.has_value()) {
        throw Error(ErrorKind::Auth, "key agreement rejected the remote ephemeral key", remote_peer);
    }
    auto keys = derive_keys(*shared, hello_, ack, true);
    crypto::secure_wipe(*shared);
    ephemeral_.wipe();
    return keys;
}

HandshakeResponder::HandshakeResponder(const Identity& identity, HandshakeParameters parameters, NonceCache& nonces)
    : identity_(identity),
      parameters_(std::move(parameters)),
      nonces_(nonces) {}

HandshakeResponder::Accepted HandshakeResponder::accept(const protocol::HelloPayload& hello,
                                                        std::chrono::system_clock::time_point now,
                                                        std::chrono::steady_clock::time_point monotonic_now) {
    const auto remote_peer = Identity::derive_peer_id(hello.identity_key);
    if (hello.protocol_version != parameters_.protocol_version) {
        throw Error(ErrorKind::Protocol,
                    "protocol version mismatch: remote " + std::to_string(hello.protocol_version) +
                        ", local " + std::to_string(parameters_.protocol_version),
                    remote_peer);
    }
    if (!Identity::verify(hello.identity_key, protocol::hello_signing_bytes(hello), hello.signature)) {
        throw Error(ErrorKind::Auth, "invalid HELLO signature", remote_peer);
    }

    const auto now_ms = static_cast<std::int64_t>(to_unix_millis(now));
    const auto skew = now_ms - static_cast<std::int64_t>(hello.timestamp_ms);
    const auto window_ms = std::chrono::duration_cast<std::chrono::milliseconds>(parameters_.freshness_window).count();
    if (skew > window_ms || skew < -window_ms) {
        throw Error(ErrorKind::Auth, "stale HELLO timestamp", remote_peer);
    }
    if (!nonces_.remember(hello.nonce, monotonic_now)) {
        throw Error(ErrorKind::Auth, "replayed HELLO nonce", remote_peer);
    }

    auto ephemeral = KeyExchange::make_keypair();
    auto shared = KeyExchange::derive_shared_secret(ephemeral, hello.ephemeral_key);
    if (!shared.has_value()) {
        ephemeral.wipe();
        throw Error(ErrorKind::Auth, "key agreement rejected the remote ephemeral key", remote_peer);
    }

    Accepted accepted{};
    auto& ack = accepted.ack;
    ack.protocol_version = parameters_.protocol_version;
    ack.identity_key = identity_.public_key();
    ack.ephemeral_key = ephemeral.public_key;
    crypto::random_bytes(ack.nonce);
    ack.timestamp_ms = to_unix_millis(now);
    ack.user_id = parameters_.user_id;
    ack.listen_port = parameters_.listen_port;
    ack.hello_digest = hello_digest(hello);
    ack.signature = identity_.sign(protocol::hello_ack_signing_bytes(ack));

    accepted.keys = derive_keys(*shared, hello, ack, false);
    crypto::secure_wipe(*shared);
    ephemeral.wipe();
    return accepted;
}

}  // namespace sharemesh::network
