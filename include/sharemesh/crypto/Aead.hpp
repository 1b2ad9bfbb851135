#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace sharemesh::crypto {

using Key = std::array<std::uint8_t, 32>;

struct Nonce {
    std::array<std::uint8_t, 12> bytes{};
};

// ChaCha20-Poly1305. Sealed output is ciphertext followed by the 16 byte tag.
class Aead {
public:
    static constexpr std::size_t kKeySize = 32;
    static constexpr std::size_t kNonceSize = 12;
    static constexpr std::size_t kTagSize = 16;

    static std::vector<std::uint8_t> seal(const Key& key,
                                          const Nonce& nonce,
                                          std::span<const std::uint8_t> plaintext,
                                          std::span<const std::uint8_t> associated_data = {});

    // nullopt when the tag does not verify.
    static std::optional<std::vector<std::uint8_t>> open(const Key& key,
                                                         const Nonce& nonce,
                                                         std::span<const std::uint8_t> sealed,
                                                         std::span<const std::uint8_t> associated_data = {});
};

void random_bytes(std::span<std::uint8_t> buffer);
void secure_wipe(std::span<std::uint8_t> buffer) noexcept;
bool constant_time_equal(std::span<const std::uint8_t> lhs, std::span<const std::uint8_t> rhs) noexcept;

}  // namespace sharemesh::crypto
