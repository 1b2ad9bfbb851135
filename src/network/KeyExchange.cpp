#include "sharemesh/network/KeyExchange.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace sharemesh::network {

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const noexcept { EVP_PKEY_free(key); }
};

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const noexcept { EVP_PKEY_CTX_free(ctx); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

}  // namespace

void KeyPair::wipe() noexcept {
    crypto::secure_wipe(private_key);
}

KeyPair KeyExchange::make_keypair() {
    std::array<std::uint8_t, 32> private_key{};
    crypto::random_bytes(private_key);
    auto pair = make_keypair(private_key);
    crypto::secure_wipe(private_key);
    return pair;
}

KeyPair KeyExchange::make_keypair(const std::array<std::uint8_t, 32>& private_key) {
    PkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, private_key.data(), private_key.size()));
    if (!key) {
        throw std::runtime_error("X25519 key creation failed");
    }

    KeyPair pair{};
    pair.private_key = private_key;
    std::size_t length = pair.public_key.size();
    if (EVP_PKEY_get_raw_public_key(key.get(), pair.public_key.data(), &length) != 1 ||
        length != pair.public_key.size()) {
        pair.wipe();
        throw std::runtime_error("X25519 public key extraction failed");
    }
    return pair;
}

bool KeyExchange::validate_public(const PublicKey& candidate) noexcept {
    return std::any_of(candidate.begin(), candidate.end(), [](std::uint8_t byte) { return byte != 0; });
}

std::optional<crypto::Key> KeyExchange::derive_shared_secret(const KeyPair& local, const PublicKey& remote_public) {
    if (!validate_public(remote_public)) {
        return std::nullopt;
    }

    PkeyPtr private_key(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr,
                                                     local.private_key.data(), local.private_key.size()));
    PkeyPtr peer_key(EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr,
                                                 remote_public.data(), remote_public.size()));
    if (!private_key || !peer_key) {
        return std::nullopt;
    }

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(private_key.get(), nullptr));
    if (!ctx) {
        return std::nullopt;
    }

    crypto::Key secret{};
    std::size_t length = secret.size();
    if (EVP_PKEY_derive_init(ctx.get()) != 1 ||
        EVP_PKEY_derive_set_peer(ctx.get(), peer_key.get()) != 1 ||
        EVP_PKEY_derive(ctx.get(), secret.data(), &length) != 1 ||
        length != secret.size()) {
        crypto::secure_wipe(secret);
        return std::nullopt;
    }

    // Low-order remote points produce an all-zero secret.
    if (std::all_of(secret.begin(), secret.end(), [](std::uint8_t byte) { return byte == 0; })) {
        return std::nullopt;
    }
    return secret;
}

}  // namespace sharemesh::network
