#include "sharemesh/crypto/Hkdf.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>

#include <stdexcept>

namespace sharemesh::crypto {

Key hkdf_sha256(std::span<const std::uint8_t> input_key_material,
                std::span<const std::uint8_t> salt,
                std::span<const std::uint8_t> info) {
    if (input_key_material.empty()) {
        throw std::invalid_argument("HKDF requires input key material");
    }

    Key output{};
    std::size_t output_length = output.size();

    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    bool ok = false;
    do {
        if (!pctx) break;
        if (EVP_PKEY_derive_init(pctx) <= 0) break;
        if (EVP_PKEY_CTX_set_hkdf_md(pctx, EVP_sha256()) <= 0) break;
        if (!salt.empty() &&
            EVP_PKEY_CTX_set1_hkdf_salt(pctx, salt.data(), static_cast<int>(salt.size())) <= 0) break;
        if (EVP_PKEY_CTX_set1_hkdf_key(pctx, input_key_material.data(),
                                       static_cast<int>(input_key_material.size())) <= 0) break;
        if (!info.empty() &&
            EVP_PKEY_CTX_add1_hkdf_info(pctx, info.data(), static_cast<int>(info.size())) <= 0) break;
        if (EVP_PKEY_derive(pctx, output.data(), &output_length) <= 0) break;
        ok = output_length == output.size();
    } while (false);
    EVP_PKEY_CTX_free(pctx);

    if (!ok) {
        secure_wipe(output);
        throw std::runtime_error("HKDF-SHA256 derivation failed");
    }
    return output;
}

}  // namespace sharemesh::crypto
