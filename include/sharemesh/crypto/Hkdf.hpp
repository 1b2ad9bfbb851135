#pragma once

#include "sharemesh/crypto/Aead.hpp"

#include <cstdint>
#include <span>

namespace sharemesh::crypto {

// HKDF-SHA256 (RFC 5869) producing one 32 byte key.
Key hkdf_sha256(std::span<const std::uint8_t> input_key_material,
                std::span<const std::uint8_t> salt,
                std::span<const std::uint8_t> info);

}  // namespace sharemesh::crypto
