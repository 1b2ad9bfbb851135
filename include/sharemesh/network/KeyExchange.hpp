#pragma once

#include "sharemesh/crypto/Aead.hpp"

#include <array>
#include <cstdint>
#include <optional>

namespace sharemesh::network {

using PublicKey = std::array<std::uint8_t, 32>;

struct KeyPair {
    std::array<std::uint8_t, 32> private_key{};
    PublicKey public_key{};

    void wipe() noexcept;
};

// Ephemeral X25519 key agreement.
class KeyExchange {
public:
    static KeyPair make_keypair();
    static KeyPair make_keypair(const std::array<std::uint8_t, 32>& private_key);
    static bool validate_public(const PublicKey& candidate) noexcept;
    static std::optional<crypto::Key> derive_shared_secret(const KeyPair& local, const PublicKey& remote_public);
};

}  // namespace sharemesh::network
