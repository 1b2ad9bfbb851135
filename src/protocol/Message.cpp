#include "sharemesh/protocol/Message.hpp"

#include "sharemesh/protocol/Wire.hpp"

#include <iterator>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace sharemesh::protocol {

namespace {

constexpr std::size_t kMaxFileListEntries = 65536;

template <typename T>
inline constexpr bool kAlwaysFalse = false;

void write_payload(ByteWriter& writer, const Payload& payload) {
    std::visit(
        [&writer](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, DiscoverPayload>) {
                writer.fixed(value.sender);
            } else if constexpr (std::is_same_v<T, AnnouncePayload>) {
                writer.fixed(value.identity_key);
                writer.u16(value.transport_port);
                writer.text(value.user_id);
                writer.u64(value.timestamp_ms);
                writer.u32(value.ttl_seconds);
                writer.fixed(value.signature);
            } else if constexpr (std::is_same_v<T, HelloPayload>) {
                writer.u8(value.protocol_version);
                writer.fixed(value.identity_key);
                writer.fixed(value.ephemeral_key);
                writer.fixed(value.nonce);
                writer.u64(value.timestamp_ms);
                writer.text(value.user_id);
                writer.u16(value.listen_port);
                writer.fixed(value.signature);
            } else if constexpr (std::is_same_v<T, HelloAckPayload>) {
                writer.u8(value.protocol_version);
                writer.fixed(value.identity_key);
                writer.fixed(value.ephemeral_key);
                writer.fixed(value.nonce);
                writer.u64(value.timestamp_ms);
                writer.text(value.user_id);
                writer.u16(value.listen_port);
                writer.fixed(value.hello_digest);
                writer.fixed(value.signature);
            } else if constexpr (std::is_same_v<T, SealedPayload>) {
                writer.u64(value.sequence);
                writer.blob(value.ciphertext);
            } else if constexpr (std::is_same_v<T, FileRequestPayload>) {
                writer.u64(value.transfer_id);
                writer.text(value.file_id);
            } else if constexpr (std::is_same_v<T, FileManifestPayload>) {
                writer.u64(value.transfer_id);
                writer.text(value.file_id);
                writer.text(value.name);
                writer.blob(encode_manifest(value.manifest));
            } else if constexpr (std::is_same_v<T, ChunkRequestPayload>) {
                writer.u64(value.transfer_id);
                writer.text(value.file_id);
                writer.u32(value.index);
                writer.u32(value.attempt);
            } else if constexpr (std::is_same_v<T, ChunkAckPayload>) {
                writer.u64(value.transfer_id);
                writer.text(value.file_id);
                writer.u32(value.index);
            } else if constexpr (std::is_same_v<T, ChunkDataPayload>) {
                writer.u64(value.transfer_id);
                writer.text(value.file_id);
                writer.u32(value.index);
                writer.u32(value.attempt);
                writer.blob(value.ciphertext);
            } else if constexpr (std::is_same_v<T, TransferCancelPayload>) {
                writer.u64(value.transfer_id);
                writer.text(value.reason);
            } else if constexpr (std::is_same_v<T, TransferCompletePayload>) {
                writer.u64(value.transfer_id);
                writer.text(value.file_id);
            } else if constexpr (std::is_same_v<T, FileListRequestPayload>) {
                writer.u64(value.request_id);
            } else if constexpr (std::is_same_v<T, FileListPayload>) {
                writer.u64(value.request_id);
                writer.u32(static_cast<std::uint32_t>(value.entries.size()));
                for (const auto& entry : value.entries) {
                    writer.text(entry.file_id);
                    writer.text(entry.name);
                    writer.u64(entry.size);
                    writer.u8(static_cast<std::uint8_t>(entry.visibility));
                    writer.text(entry.owner);
                }
            } else if constexpr (std::is_same_v<T, ErrorPayload>) {
                writer.u8(static_cast<std::uint8_t>(value.code));
                writer.u64(value.transfer_id);
                writer.u32(value.chunk_index);
                writer.text(value.reason);
            } else if constexpr (std::is_same_v<T, PingPayload> || std::is_same_v<T, PongPayload>) {
                writer.u64(value.token);
            } else if constexpr (std::is_same_v<T, GoodbyePayload>) {
                writer.text(value.reason);
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled payload type");
            }
        },
        payload);
}

Visibility read_visibility(ByteReader& reader) {
    const auto raw = reader.u8();
    if (raw > static_cast<std::uint8_t>(Visibility::Private)) {
        throw std::invalid_argument("unknown visibility");
    }
    return static_cast<Visibility>(raw);
}

ErrorCode read_error_code(ByteReader& reader) {
    const auto raw = reader.u8();
    if (raw < static_cast<std::uint8_t>(ErrorCode::Network) || raw > static_cast<std::uint8_t>(ErrorCode::Busy)) {
        throw std::invalid_argument("unknown error code");
    }
    return static_cast<ErrorCode>(raw);
}

Payload read_payload(MessageType type, ByteReader& reader) {
    switch (type) {
        case MessageType::Discover: {
            DiscoverPayload payload{};
            payload.sender = reader.fixed<32>();
            return payload;
        }
        case MessageType::Announce: {
            AnnouncePayload payload{};
            payload.identity_key = reader.fixed<32>();
            payload.transport_port = reader.u16();
            payload.user_id = reader.text(kMaxTextField);
            payload.timestamp_ms = reader.u64();
            payload.ttl_seconds = reader.u32();
            payload.signature = reader.fixed<64>();
            return payload;
        }
        case MessageType::Hello: {
            HelloPayload payload{};
            payload.protocol_version = reader.u8();
            payload.identity_key = reader.fixed<32>();
            payload.ephemeral_key = reader.fixed<32>();
            payload.nonce = reader.fixed<32>();
            payload.timestamp_ms = reader.u64();
            payload.user_id = reader.text(kMaxTextField);
            payload.listen_port = reader.u16();
            payload.signature = reader.fixed<64>();
            return payload;
        }
        case MessageType::HelloAck: {
            HelloAckPayload payload{};
            payload.protocol_version = reader.u8();
            payload.identity_key = reader.fixed<32>();
            payload.ephemeral_key = reader.fixed<32>();
            payload.nonce = reader.fixed<32>();
            payload.timestamp_ms = reader.u64();
            payload.user_id = reader.text(kMaxTextField);
            payload.listen_port = reader.u16();
            payload.hello_digest = reader.fixed<32>();
            payload.signature = reader.fixed<64>();
            return payload;
        }
        case MessageType::Sealed: {
            SealedPayload payload{};
            payload.sequence = reader.u64();
            payload.ciphertext = reader.blob(kMaxFrameSize);
            return payload;
        }
        case MessageType::FileRequest: {
            FileRequestPayload payload{};
            payload.transfer_id = reader.u64();
            payload.file_id = reader.text(kMaxTextField);
            return payload;
        }
        case MessageType::FileManifest: {
            FileManifestPayload payload{};
            payload.transfer_id = reader.u64();
            payload.file_id = reader.text(kMaxTextField);
            payload.name = reader.text(kMaxTextField);
            const auto manifest_bytes = reader.blob(kMaxFrameSize);
            payload.manifest = decode_manifest(manifest_bytes);
            return payload;
        }
        case MessageType::ChunkRequest: {
            ChunkRequestPayload payload{};
            payload.transfer_id = reader.u64();
            payload.file_id = reader.text(kMaxTextField);
            payload.index = reader.u32();
            payload.attempt = reader.u32();
            return payload;
        }
        case MessageType::ChunkData: {
            ChunkDataPayload payload{};
            payload.transfer_id = reader.u64();
            payload.file_id = reader.text(kMaxTextField);
            payload.index = reader.u32();
            payload.attempt = reader.u32();
            payload.ciphertext = reader.blob(kMaxFrameSize);
            return payload;
        }
        case MessageType::ChunkAck: {
            ChunkAckPayload payload{};
            payload.transfer_id = reader.u64();
            payload.file_id = reader.text(kMaxTextField);
            payload.index = reader.u32();
            return payload;
        }
        case MessageType::TransferCancel: {
            TransferCancelPayload payload{};
            payload.transfer_id = reader.u64();
            payload.reason = reader.text(kMaxTextField);
            return payload;
        }
        case MessageType::TransferComplete: {
            TransferCompletePayload payload{};
            payload.transfer_id = reader.u64();
            payload.file_id = reader.text(kMaxTextField);
            return payload;
        }
        case MessageType::FileListRequest: {
            FileListRequestPayload payload{};
            payload.request_id = reader.u64();
            return payload;
        }
        case MessageType::FileList: {
            FileListPayload payload{};
            payload.request_id = reader.u64();
            const auto count = reader.u32();
            if (count > kMaxFileListEntries) {
                throw std::invalid_argument("file list too long");
            }
            for (std::uint32_t index = 0; index < count; ++index) {
                FileListEntry entry{};
                entry.file_id = reader.text(kMaxTextField);
                entry.name = reader.text(kMaxTextField);
                entry.size = reader.u64();
                entry.visibility = read_visibility(reader);
                entry.owner = reader.text(kMaxTextField);
                payload.entries.push_back(std::move(entry));
            }
            return payload;
        }
        case MessageType::Error: {
            ErrorPayload payload{};
            payload.code = read_error_code(reader);
            payload.transfer_id = reader.u64();
            payload.chunk_index = reader.u32();
            payload.reason = reader.text(kMaxTextField);
            return payload;
        }
        case MessageType::Ping: {
            PingPayload payload{};
            payload.token = reader.u64();
            return payload;
        }
        case MessageType::Pong: {
            PongPayload payload{};
            payload.token = reader.u64();
            return payload;
        }
        case MessageType::Goodbye: {
            GoodbyePayload payload{};
            payload.reason = reader.text(kMaxTextField);
            return payload;
        }
    }
    throw std::invalid_argument("unknown message type");
}

bool is_known_type(std::uint8_t raw) {
    switch (static_cast<MessageType>(raw)) {
        case MessageType::Discover:
        case MessageType::Announce:
        case MessageType::Hello:
        case MessageType::HelloAck:
        case MessageType::Sealed:
        case MessageType::FileRequest:
        case MessageType::FileManifest:
        case MessageType::ChunkRequest:
        case MessageType::ChunkData:
        case MessageType::ChunkAck:
        case MessageType::TransferCancel:
        case MessageType::TransferComplete:
        case MessageType::FileListRequest:
        case MessageType::FileList:
        case MessageType::Error:
        case MessageType::Ping:
        case MessageType::Pong:
        case MessageType::Goodbye:
            return true;
    }
    return false;
}

template <typename HelloFields>
void write_hello_fields(ByteWriter& writer, const HelloFields& payload) {
    writer.u8(payload.protocol_version);
    writer.fixed(payload.identity_key);
    writer.fixed(payload.ephemeral_key);
    writer.fixed(payload.nonce);
    writer.u64(payload.timestamp_ms);
    writer.text(payload.user_id);
    writer.u16(payload.listen_port);
}

void write_label(std::vector<std::uint8_t>& out, std::string_view label) {
    out.insert(out.end(), label.begin(), label.end());
    out.push_back(0);
}

}  // namespace

ErrorKind error_kind(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Network:
        case ErrorCode::Busy:
            return ErrorKind::Network;
        case ErrorCode::Protocol:
        case ErrorCode::NotFound:
            return ErrorKind::Protocol;
        case ErrorCode::Auth:
            return ErrorKind::Auth;
        case ErrorCode::Permission:
            return ErrorKind::Permission;
        case ErrorCode::Integrity:
            return ErrorKind::Integrity;
    }
    return ErrorKind::Protocol;
}

ErrorCode error_code(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Network:
            return ErrorCode::Network;
        case ErrorKind::Protocol:
            return ErrorCode::Protocol;
        case ErrorKind::Auth:
            return ErrorCode::Auth;
        case ErrorKind::Permission:
            return ErrorCode::Permission;
        case ErrorKind::Integrity:
            return ErrorCode::Integrity;
    }
    return ErrorCode::Protocol;
}

MessageType type_of(const Payload& payload) noexcept {
    constexpr MessageType kTypes[] = {
        MessageType::Discover,       MessageType::Announce,         MessageType::Hello,
        MessageType::HelloAck,       MessageType::Sealed,           MessageType::FileRequest,
        MessageType::FileManifest,   MessageType::ChunkRequest,     MessageType::ChunkData,
        MessageType::ChunkAck,       MessageType::TransferCancel,   MessageType::TransferComplete,
        MessageType::FileListRequest, MessageType::FileList,        MessageType::Error,
        MessageType::Ping,           MessageType::Pong,             MessageType::Goodbye,
    };
    static_assert(std::size(kTypes) == std::variant_size_v<Payload>);
    return kTypes[payload.index()];
}

Message make_message(Payload payload, std::uint8_t version) {
    Message message{};
    message.version = version;
    message.type = type_of(payload);
    message.payload = std::move(payload);
    return message;
}

std::vector<std::uint8_t> encode(const Message& message) {
    std::vector<std::uint8_t> frame(kLengthFieldSize, 0);
    ByteWriter writer(frame);
    writer.u8(message.version);
    writer.u8(static_cast<std::uint8_t>(type_of(message.payload)));
    write_payload(writer, message.payload);

    const auto body_size = frame.size() - kLengthFieldSize;
    if (body_size > kMaxFrameSize) {
        throw std::length_error("frame exceeds maximum size");
    }
    frame[0] = static_cast<std::uint8_t>((body_size >> 24) & 0xFFu);
    frame[1] = static_cast<std::uint8_t>((body_size >> 16) & 0xFFu);
    frame[2] = static_cast<std::uint8_t>((body_size >> 8) & 0xFFu);
    frame[3] = static_cast<std::uint8_t>(body_size & 0xFFu);
    return frame;
}

std::optional<Message> decode(std::span<const std::uint8_t> frame) {
    if (frame.size() < kLengthFieldSize) {
        return std::nullopt;
    }
    ByteReader prefix(frame.first(kLengthFieldSize));
    const auto length = prefix.u32();
    if (length != frame.size() - kLengthFieldSize) {
        return std::nullopt;
    }
    return decode_body(frame.subspan(kLengthFieldSize));
}

std::optional<Message> decode_body(std::span<const std::uint8_t> body) {
    if (body.size() < 2 || body.size() > kMaxFrameSize) {
        return std::nullopt;
    }

    try {
        ByteReader reader(body);
        Message message{};
        message.version = reader.u8();
        const auto raw_type = reader.u8();
        if (!is_known_type(raw_type)) {
            return std::nullopt;
        }
        message.type = static_cast<MessageType>(raw_type);
        message.payload = read_payload(message.type, reader);
        if (!reader.exhausted()) {
            return std::nullopt;
        }
        return message;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::length_error&) {
        return std::nullopt;
    }
}

std::string_view to_string(MessageType type) noexcept {
    switch (type) {
        case MessageType::Discover:
            return "DISCOVER";
        case MessageType::Announce:
            return "ANNOUNCE";
        case MessageType::Hello:
            return "HELLO";
        case MessageType::HelloAck:
            return "HELLO_ACK";
        case MessageType::Sealed:
            return "SEALED";
        case MessageType::FileRequest:
            return "FILE_REQUEST";
        case MessageType::FileManifest:
            return "FILE_MANIFEST";
        case MessageType::ChunkRequest:
            return "CHUNK_REQUEST";
        case MessageType::ChunkData:
            return "CHUNK_DATA";
        case MessageType::ChunkAck:
            return "CHUNK_ACK";
        case MessageType::TransferCancel:
            return "TRANSFER_CANCEL";
        case MessageType::TransferComplete:
            return "TRANSFER_COMPLETE";
        case MessageType::FileListRequest:
            return "FILE_LIST_REQUEST";
        case MessageType::FileList:
            return "FILE_LIST";
        case MessageType::Error:
            return "ERROR";
        case MessageType::Ping:
            return "PING";
        case MessageType::Pong:
            return "PONG";
        case MessageType::Goodbye:
            return "GOODBYE";
    }
    return "UNKNOWN";
}

std::vector<std::uint8_t> announce_signing_bytes(const AnnouncePayload& payload) {
    std::vector<std::uint8_t> out;
    write_label(out, "sharemesh-announce-v1");
    ByteWriter writer(out);
    writer.fixed(payload.identity_key);
    writer.u16(payload.transport_port);
    writer.text(payload.user_id);
    writer.u64(payload.timestamp_ms);
    writer.u32(payload.ttl_seconds);
    return out;
}

std::vector<std::uint8_t> hello_signing_bytes(const HelloPayload& payload) {
    std::vector<std::uint8_t> out;
    write_label(out, "sharemesh-hello-v1");
    ByteWriter writer(out);
    write_hello_fields(writer, payload);
    return out;
}

std::vector<std::uint8_t> hello_ack_signing_bytes(const HelloAckPayload& payload) {
    std::vector<std::uint8_t> out;
    write_label(out, "sharemesh-hello-ack-v1");
    ByteWriter writer(out);
    write_hello_fields(writer, payload);
    writer.fixed(payload.hello_digest);
    return out;
}

}  // namespace sharemesh::protocol
