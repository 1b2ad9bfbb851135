#pragma once

#include "sharemesh/Types.hpp"
#include "sharemesh/network/KeyExchange.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <span>

namespace sharemesh::network {

using Signature = std::array<std::uint8_t, 64>;

// Long-term Ed25519 identity. The peer id is SHA-256 of the public key.
class Identity {
public:
    using Seed = std::array<std::uint8_t, 32>;

    static Identity generate();
    static Identity from_seed(const Seed& seed);

    // Reads a hex seed from path, creating it when missing. Throws std::runtime_error.
    static Identity load_or_create(const std::filesystem::path& path);
    void save(const std::filesystem::path& path) const;

    const PublicKey& public_key() const noexcept { return public_key_; }
    const PeerId& peer_id() const noexcept { return peer_id_; }

    Signature sign(std::span<const std::uint8_t> message) const;

    static bool verify(const PublicKey& public_key,
                       std::span<const std::uint8_t> message,
                       const Signature& signature);
    static PeerId derive_peer_id(const PublicKey& public_key);

private:
    explicit Identity(const Seed& seed);

    Seed seed_{};
    PublicKey public_key_{};
    PeerId peer_id_{};
};

}  // namespace sharemesh::network
