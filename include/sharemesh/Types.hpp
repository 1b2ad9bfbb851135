#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sharemesh {

using PeerId = std::array<std::uint8_t, 32>;
using Hash256 = std::array<std::uint8_t, 32>;
using FileId = std::string;
using UserId = std::string;
using ChunkIndex = std::uint32_t;
using ChunkData = std::vector<std::uint8_t>;
using JobId = std::uint64_t;

enum class Visibility : std::uint8_t {
    Public = 0,
    Private = 1
};

enum class TransferDirection : std::uint8_t {
    Upload = 0,
    Download = 1
};

std::string to_hex(std::span<const std::uint8_t> bytes);
std::optional<std::vector<std::uint8_t>> from_hex(std::string_view text);

std::string peer_id_to_string(const PeerId& id);
std::optional<PeerId> peer_id_from_string(const std::string& text);
std::string hash_to_string(const Hash256& hash);

// An all-zero peer id never belongs to an authenticated peer.
bool is_unset(const PeerId& id) noexcept;

std::string_view to_string(Visibility visibility) noexcept;
std::string_view to_string(TransferDirection direction) noexcept;

}  // namespace sharemesh
