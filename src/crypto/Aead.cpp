#include "sharemesh/crypto/Aead.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cstddef>
#include <limits>
#include <stdexcept>

namespace sharemesh::crypto {

namespace {

struct CipherContext {
    CipherContext() : ctx(EVP_CIPHER_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("EVP_CIPHER_CTX_new failed");
        }
    }
    ~CipherContext() { EVP_CIPHER_CTX_free(ctx); }

    CipherContext(const CipherContext&) = delete;
    CipherContext& operator=(const CipherContext&) = delete;

    EVP_CIPHER_CTX* ctx;
};

bool fits_int(std::size_t size) {
    return size <= static_cast<std::size_t>(std::numeric_limits<int>::max());
}

}  // namespace

std::vector<std::uint8_t> Aead::seal(const Key& key,
                                     const Nonce& nonce,
                                     std::span<const std::uint8_t> plaintext,
                                     std::span<const std::uint8_t> associated_data) {
    if (!fits_int(plaintext.size()) || !fits_int(associated_data.size())) {
        throw std::length_error("AEAD input too large");
    }

    CipherContext cipher;
    std::vector<std::uint8_t> sealed(plaintext.size() + kTagSize);
    int length = 0;
    int final_length = 0;

    bool ok = false;
    do {
        if (EVP_EncryptInit_ex(cipher.ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1) break;
        if (EVP_CIPHER_CTX_ctrl(cipher.ctx, EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1) break;
        if (EVP_EncryptInit_ex(cipher.ctx, nullptr, nullptr, key.data(), nonce.bytes.data()) != 1) break;
        if (!associated_data.empty() &&
            EVP_EncryptUpdate(cipher.ctx, nullptr, &length, associated_data.data(),
                              static_cast<int>(associated_data.size())) != 1) break;
        length = 0;
        if (!plaintext.empty() &&
            EVP_EncryptUpdate(cipher.ctx, sealed.data(), &length, plaintext.data(),
                              static_cast<int>(plaintext.size())) != 1) break;
        if (EVP_EncryptFinal_ex(cipher.ctx, sealed.data() + length, &final_length) != 1) break;
        if (EVP_CIPHER_CTX_ctrl(cipher.ctx, EVP_CTRL_AEAD_GET_TAG, static_cast<int>(kTagSize),
                                sealed.data() + plaintext.size()) != 1) break;
        ok = true;
    } while (false);

    if (!ok) {
        throw std::runtime_error("ChaCha20-Poly1305 encryption failed");
    }
    return sealed;
}

std::optional<std::vector<std::uint8_t>> Aead::open(const Key& key,
                                                    const Nonce& nonce,
                                                    std::span<const std::uint8_t> sealed,
                                                    std::span<const std::uint8_t> associated_data) {
    if (sealed.size() < kTagSize || !fits_int(sealed.size()) || !fits_int(associated_data.size())) {
        return std::nullopt;
    }

    const auto ciphertext = sealed.first(sealed.size() - kTagSize);
    std::array<std::uint8_t, kTagSize> tag{};
    std::copy(sealed.end() - static_cast<std::ptrdiff_t>(kTagSize), sealed.end(), tag.begin());

    CipherContext cipher;
    std::vector<std::uint8_t> plaintext(ciphertext.size());
    int length = 0;
    int final_length = 0;

    bool ok = false;
    do {
        if (EVP_DecryptInit_ex(cipher.ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1) break;
        if (EVP_CIPHER_CTX_ctrl(cipher.ctx, EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1) break;
        if (EVP_DecryptInit_ex(cipher.ctx, nullptr, nullptr, key.data(), nonce.bytes.data()) != 1) break;
        if (!associated_data.empty() &&
            EVP_DecryptUpdate(cipher.ctx, nullptr, &length, associated_data.data(),
                              static_cast<int>(associated_data.size())) != 1) break;
        length = 0;
        if (!ciphertext.empty() &&
            EVP_DecryptUpdate(cipher.ctx, plaintext.data(), &length, ciphertext.data(),
                              static_cast<int>(ciphertext.size())) != 1) break;
        if (EVP_CIPHER_CTX_ctrl(cipher.ctx, EVP_CTRL_AEAD_SET_TAG, static_cast<int>(kTagSize), tag.data()) != 1) break;
        if (EVP_DecryptFinal_ex(cipher.ctx, plaintext.data() + length, &final_length) != 1) break;
        ok = true;
    } while (false);

    if (!ok) {
        secure_wipe(plaintext);
        return std::nullopt;
    }
    return plaintext;
}

void random_bytes(std::span<std::uint8_t> buffer) {
    if (buffer.empty()) {
        return;
    }
    if (!fits_int(buffer.size()) || RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
}

void secure_wipe(std::span<std::uint8_t> buffer) noexcept {
    if (!buffer.empty()) {
        OPENSSL_cleanse(buffer.data(), buffer.size());
    }
}

bool constant_time_equal(std::span<const std::uint8_t> lhs, std::span<const std::uint8_t> rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    if (lhs.empty()) {
        return true;
    }
    return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

}  // namespace sharemesh::crypto
