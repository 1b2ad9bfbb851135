#include "sharemesh/Types.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace sharemesh {

namespace {

int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return 10 + (ch - 'a');
    }
    if (ch >= 'A' && ch <= 'F') {
        return 10 + (ch - 'A');
    }
    return -1;
}

}  // namespace

std::string to_hex(std::span<const std::uint8_t> bytes) {
    std::ostringstream oss;
    for (const auto byte : bytes) {
        oss << std::hex << std::nouppercase << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return oss.str();
}

std::optional<std::vector<std::uint8_t>> from_hex(std::string_view text) {
    if (text.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> bytes;
    bytes.reserve(text.size() / 2);
    for (std::size_t offset = 0; offset < text.size(); offset += 2) {
        const auto high = hex_value(text[offset]);
        const auto low = hex_value(text[offset + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        bytes.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }
    return bytes;
}

std::string peer_id_to_string(const PeerId& id) {
    return to_hex(id);
}

std::optional<PeerId> peer_id_from_string(const std::string& text) {
    if (text.size() != PeerId{}.size() * 2) {
        return std::nullopt;
    }

    const auto bytes = from_hex(text);
    if (!bytes.has_value()) {
        return std::nullopt;
    }

    PeerId id{};
    std::copy(bytes->begin(), bytes->end(), id.begin());
    return id;
}

std::string hash_to_string(const Hash256& hash) {
    return to_hex(hash);
}

bool is_unset(const PeerId& id) noexcept {
    return std::all_of(id.begin(), id.end(), [](std::uint8_t byte) { return byte == 0; });
}

std::string_view to_string(Visibility visibility) noexcept {
    switch (visibility) {
        case Visibility::Public:
            return "public";
        case Visibility::Private:
            return "private";
    }
    return "private";
}

std::string_view to_string(TransferDirection direction) noexcept {
    switch (direction) {
        case TransferDirection::Upload:
            return "upload";
        case TransferDirection::Download:
            return "download";
    }
    return "download";
}

}  // namespace sharemesh
