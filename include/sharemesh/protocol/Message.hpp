#pragma once

#include "sharemesh/Error.hpp"
#include "sharemesh/Types.hpp"
#include "sharemesh/protocol/Manifest.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace sharemesh::protocol {

inline constexpr std::uint8_t kProtocolVersion = 1;
inline constexpr std::size_t kLengthFieldSize = 4;
inline constexpr std::size_t kMaxFrameSize = 32u * 1024u * 1024u;
inline constexpr std::size_t kMaxTextField = 4096;

using Key32 = std::array<std::uint8_t, 32>;
using Nonce32 = std::array<std::uint8_t, 32>;
using Signature64 = std::array<std::uint8_t, 64>;

enum class MessageType : std::uint8_t {
    Discover = 0x01,
    Announce = 0x02,
    Hello = 0x10,
    HelloAck = 0x11,
    Sealed = 0x12,
    FileRequest = 0x20,
    FileManifest = 0x21,
    ChunkRequest = 0x22,
    ChunkData = 0x23,
    ChunkAck = 0x24,
    TransferCancel = 0x25,
    FileListRequest = 0x26,
    FileList = 0x27,
    TransferComplete = 0x28,
    Error = 0x30,
    Ping = 0x31,
    Pong = 0x32,
    Goodbye = 0x33,
};

enum class ErrorCode : std::uint8_t {
    Network = 1,
    Protocol = 2,
    Auth = 3,
    Permission = 4,
    Integrity = 5,
    NotFound = 6,
    Busy = 7,
};

ErrorKind error_kind(ErrorCode code) noexcept;
ErrorCode error_code(ErrorKind kind) noexcept;

struct DiscoverPayload {
    PeerId sender{};
};

// ttl_seconds == 0 announces absence.
struct AnnouncePayload {
    Key32 identity_key{};
    std::uint16_t transport_port{0};
    std::string user_id;
    std::uint64_t timestamp_ms{0};
    std::uint32_t ttl_seconds{0};
    Signature64 signature{};
};

struct HelloPayload {
    std::uint8_t protocol_version{kProtocolVersion};
    Key32 identity_key{};
    Key32 ephemeral_key{};
    Nonce32 nonce{};
    std::uint64_t timestamp_ms{0};
    std::string user_id;
    std::uint16_t listen_port{0};
    Signature64 signature{};
};

struct HelloAckPayload {
    std::uint8_t protocol_version{kProtocolVersion};
    Key32 identity_key{};
    Key32 ephemeral_key{};
    Nonce32 nonce{};
    std::uint64_t timestamp_ms{0};
    std::string user_id;
    std::uint16_t listen_port{0};
    Hash256 hello_digest{};
    Signature64 signature{};
};

struct SealedPayload {
    std::uint64_t sequence{0};
    std::vector<std::uint8_t> ciphertext;
};

struct FileRequestPayload {
    std::uint64_t transfer_id{0};
    FileId file_id;
};

struct FileManifestPayload {
    std::uint64_t transfer_id{0};
    FileId file_id;
    std::string name;
    FileManifest manifest;
};

struct ChunkRequestPayload {
    std::uint64_t transfer_id{0};
    FileId file_id;
    ChunkIndex index{0};
    std::uint32_t attempt{0};
};

// ciphertext is sealed with the nonce for (transfer, index, attempt), tag appended.
struct ChunkDataPayload {
    std::uint64_t transfer_id{0};
    FileId file_id;
    ChunkIndex index{0};
    std::uint32_t attempt{0};
    std::vector<std::uint8_t> ciphertext;
};

struct ChunkAckPayload {
    std::uint64_t transfer_id{0};
    FileId file_id;
    ChunkIndex index{0};
};

struct TransferCancelPayload {
    std::uint64_t transfer_id{0};
    std::string reason;
};

// Sent by the downloader once the reassembled file verified; ends the serving job.
struct TransferCompletePayload {
    std::uint64_t transfer_id{0};
    FileId file_id;
};

struct FileListRequestPayload {
    std::uint64_t request_id{0};
};

struct FileListEntry {
    FileId file_id;
    std::string name;
    std::uint64_t size{0};
    Visibility visibility{Visibility::Public};
    UserId owner;
};

struct FileListPayload {
    std::uint64_t request_id{0};
    std::vector<FileListEntry> entries;
};

inline constexpr ChunkIndex kNoChunk = 0xFFFFFFFFu;

struct ErrorPayload {
    ErrorCode code{ErrorCode::Protocol};
    std::uint64_t transfer_id{0};
    ChunkIndex chunk_index{kNoChunk};
    std::string reason;
};

struct PingPayload {
    std::uint64_t token{0};
};

struct PongPayload {
    std::uint64_t token{0};
};

struct GoodbyePayload {
    std::string reason;
};

using Payload = std::variant<DiscoverPayload,
                             AnnouncePayload,
                             HelloPayload,
                             HelloAckPayload,
                             SealedPayload,
                             FileRequestPayload,
                             FileManifestPayload,
                             ChunkRequestPayload,
                             ChunkDataPayload,
                             ChunkAckPayload,
                             TransferCancelPayload,
                             TransferCompletePayload,
                             FileListRequestPayload,
                             FileListPayload,
                             ErrorPayload,
                             PingPayload,
                             PongPayload,
                             GoodbyePayload>;

struct Message {
    std::uint8_t version{kProtocolVersion};
    MessageType type{MessageType::Discover};
    Payload payload{};
};

MessageType type_of(const Payload& payload) noexcept;
Message make_message(Payload payload, std::uint8_t version = kProtocolVersion);

// Frame layout: u32 length | u8 version | u8 type | payload, big endian.
std::vector<std::uint8_t> encode(const Message& message);
std::optional<Message> decode(std::span<const std::uint8_t> frame);
// Same as decode, for a frame whose length prefix was already consumed.
std::optional<Message> decode_body(std::span<const std::uint8_t> body);

std::string_view to_string(MessageType type) noexcept;

// Canonical byte strings covered by signatures.
std::vector<std::uint8_t> announce_signing_bytes(const AnnouncePayload& payload);
std::vector<std::uint8_t> hello_signing_bytes(const HelloPayload& payload);
std::vector<std::uint8_t> hello_ack_signing_bytes(const HelloAckPayload& payload);

}  // namespace sharemesh::protocol
