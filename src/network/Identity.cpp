#include "sharemesh/network/Identity.hpp"

#include "sharemesh/crypto/Aead.hpp"
#include "sharemesh/crypto/Sha256.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

namespace sharemesh::network {

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const noexcept { EVP_PKEY_free(key); }
};

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

PkeyPtr private_key_from_seed(const Identity::Seed& seed) {
    PkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()));
    if (!key) {
        throw std::runtime_error("Ed25519 key creation failed");
    }
    return key;
}

}  // namespace

Identity::Identity(const Seed& seed)
    : seed_(seed) {
    const auto key = private_key_from_seed(seed_);
    std::size_t length = public_key_.size();
    if (EVP_PKEY_get_raw_public_key(key.get(), public_key_.data(), &length) != 1 || length != public_key_.size()) {
        throw std::runtime_error("Ed25519 public key extraction failed");
    }
    peer_id_ = derive_peer_id(public_key_);
}

Identity Identity::generate() {
    Seed seed{};
    crypto::random_bytes(seed);
    Identity identity(seed);
    crypto::secure_wipe(seed);
    return identity;
}

Identity Identity::from_seed(const Seed& seed) {
    return Identity(seed);
}

Identity Identity::load_or_create(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        auto identity = generate();
        identity.save(path);
        return identity;
    }

    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Unable to read identity key " + path.string());
    }
    std::string text;
    input >> text;
    const auto bytes = from_hex(text);
    if (!bytes.has_value() || bytes->size() != Seed{}.size()) {
        throw std::runtime_error("Identity key " + path.string() + " is not a 32 byte hex seed");
    }

    Seed seed{};
    std::copy(bytes->begin(), bytes->end(), seed.begin());
    Identity identity(seed);
    crypto::secure_wipe(seed);
    return identity;
}

void Identity::save(const std::filesystem::path& path) const {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    {
        std::ofstream output(path, std::ios::trunc);
        if (!output) {
            throw std::runtime_error("Unable to write identity key " + path.string());
        }
        output << to_hex(seed_) << '\n';
    }
    std::error_code ec;
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace,
                                 ec);
}

Signature Identity::sign(std::span<const std::uint8_t> message) const {
    const auto key = private_key_from_seed(seed_);
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    Signature signature{};
    std::size_t length = signature.size();
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1 ||
        EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(), message.size()) != 1 ||
        length != signature.size()) {
        throw std::runtime_error("Ed25519 signing failed");
    }
    return signature;
}

bool Identity::verify(const PublicKey& public_key,
                      std::span<const std::uint8_t> message,
                      const Signature& signature) {
    PkeyPtr key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size()));
    if (!key) {
        return false;
    }
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return false;
    }
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), message.data(), message.size()) == 1;
}

PeerId Identity::derive_peer_id(const PublicKey& public_key) {
    return crypto::Sha256::digest(public_key);
}

}  // namespace sharemesh::network
