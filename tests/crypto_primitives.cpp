#include "sharemesh/Types.hpp"
#include "sharemesh/crypto/Aead.hpp"
#include "sharemesh/crypto/Hkdf.hpp"
#include "sharemesh/crypto/Sha256.hpp"
#include "sharemesh/network/Identity.hpp"
#include "sharemesh/network/KeyExchange.hpp"

#include <array>
#include <cassert>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

using namespace sharemesh;

namespace {

std::vector<std::uint8_t> bytes_of(std::string_view text) {
    return {text.begin(), text.end()};
}

void check_sha256() {
    const auto digest = crypto::Sha256::digest(bytes_of("abc"));
    assert(to_hex(digest) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    crypto::Sha256 incremental;
    incremental.update(std::string_view("a"));
    incremental.update(std::string_view("bc"));
    assert(incremental.finalize() == digest);

    assert(to_hex(crypto::Sha256::digest({})) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

void check_hkdf() {
    // RFC 5869 test case 1.
    const std::vector<std::uint8_t> ikm(22, 0x0b);
    std::vector<std::uint8_t> salt;
    for (std::uint8_t value = 0x00; value <= 0x0c; ++value) {
        salt.push_back(value);
    }
    std::vector<std::uint8_t> info;
    for (std::uint8_t value = 0xf0; value <= 0xf9; ++value) {
        info.push_back(value);
    }
    const auto okm = crypto::hkdf_sha256(ikm, salt, info);
    assert(to_hex(okm) == "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf");
}

void check_aead() {
    crypto::Key key{};
    crypto::random_bytes(key);
    crypto::Nonce nonce{};
    crypto::random_bytes(nonce.bytes);
    const auto plaintext = bytes_of("chunk payload under test");
    const auto aad = bytes_of("transfer=7;index=4");

    const auto sealed = crypto::Aead::seal(key, nonce, plaintext, aad);
    assert(sealed.size() == plaintext.size() + crypto::Aead::kTagSize);

    const auto opened = crypto::Aead::open(key, nonce, sealed, aad);
    assert(opened.has_value());
    assert(*opened == plaintext);

    // Any single flipped bit is detected.
    for (std::size_t bit = 0; bit < sealed.size() * 8; bit += 7) {
        auto tampered = sealed;
        tampered[bit / 8] ^= static_cast<std::uint8_t>(1u << (bit % 8));
        assert(!crypto::Aead::open(key, nonce, tampered, aad).has_value());
    }

    assert(!crypto::Aead::open(key, nonce, sealed, bytes_of("transfer=7;index=5")).has_value());
    auto other_nonce = nonce;
    other_nonce.bytes[0] ^= 0x80;
    assert(!crypto::Aead::open(key, other_nonce, sealed).has_value());
    assert(!crypto::Aead::open(key, nonce, std::vector<std::uint8_t>(4, 0)).has_value());

    assert(crypto::constant_time_equal(plaintext, plaintext));
    assert(!crypto::constant_time_equal(plaintext, aad));
}

void check_key_exchange() {
    const auto alice = network::KeyExchange::make_keypair();
    const auto bob = network::KeyExchange::make_keypair();
    assert(network::KeyExchange::validate_public(alice.public_key));

    const auto alice_secret = network::KeyExchange::derive_shared_secret(alice, bob.public_key);
    const auto bob_secret = network::KeyExchange::derive_shared_secret(bob, alice.public_key);
    assert(alice_secret.has_value() && bob_secret.has_value());
    assert(*alice_secret == *bob_secret);

    // The all-zero point is refused.
    const network::PublicKey zero{};
    assert(!network::KeyExchange::derive_shared_secret(alice, zero).has_value());
}

void check_identity() {
    network::Identity::Seed seed{};
    seed.fill(0x21);
    const auto identity = network::Identity::from_seed(seed);
    const auto same = network::Identity::from_seed(seed);
    assert(identity.peer_id() == same.peer_id());
    assert(identity.peer_id() == network::Identity::derive_peer_id(identity.public_key()));
    assert(identity.peer_id() == crypto::Sha256::digest(identity.public_key()));

    const auto message = bytes_of("announce body");
    const auto signature = identity.sign(message);
    assert(network::Identity::verify(identity.public_key(), message, signature));

    auto tampered = message;
    tampered[0] ^= 0x01;
    assert(!network::Identity::verify(identity.public_key(), tampered, signature));

    const auto stranger = network::Identity::generate();
    assert(stranger.peer_id() != identity.peer_id());
    assert(!network::Identity::verify(stranger.public_key(), message, signature));
}

}  // namespace

int main() {
    check_sha256();
    check_hkdf();
    check_aead();
    check_key_exchange();
    check_identity();
    return 0;
}
