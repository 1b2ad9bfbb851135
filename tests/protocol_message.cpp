#include "sharemesh/protocol/Message.hpp"

#include <cassert>
#include <cstdint>
#include <span>
#include <variant>
#include <vector>

using namespace sharemesh;
using namespace sharemesh::protocol;

namespace {

template <typename T>
const T& round_trip(const Payload& payload, Message& storage) {
    const auto frame = encode(make_message(payload));
    const auto decoded = decode(frame);
    assert(decoded.has_value());
    assert(decoded->version == kProtocolVersion);
    assert(decoded->type == type_of(payload));
    storage = *decoded;
    const auto* typed = std::get_if<T>(&storage.payload);
    assert(typed != nullptr);
    return *typed;
}

void check_transfer_messages() {
    Message storage;

    ChunkRequestPayload request{};
    request.transfer_id = 0x0102030405060708ull;
    request.file_id = "f00d";
    request.index = 4;
    request.attempt = 2;
    const auto& decoded_request = round_trip<ChunkRequestPayload>(request, storage);
    assert(decoded_request.transfer_id == request.transfer_id);
    assert(decoded_request.file_id == request.file_id);
    assert(decoded_request.index == 4);
    assert(decoded_request.attempt == 2);

    FileManifestPayload manifest{};
    manifest.transfer_id = 9;
    manifest.file_id = "cafe";
    manifest.name = "report.pdf";
    manifest.manifest.chunk_size = 4096;
    manifest.manifest.file_size = 5000;
    manifest.manifest.chunk_hashes.resize(2);
    manifest.manifest.chunk_hashes[1].fill(0x44);
    manifest.manifest.content_hash.fill(0x55);
    const auto& decoded_manifest = round_trip<FileManifestPayload>(manifest, storage);
    assert(decoded_manifest.name == "report.pdf");
    assert(decoded_manifest.manifest.chunk_hashes == manifest.manifest.chunk_hashes);
    assert(decoded_manifest.manifest.content_hash == manifest.manifest.content_hash);

    ErrorPayload error{};
    error.code = ErrorCode::Permission;
    error.transfer_id = 12;
    error.reason = "private file";
    const auto& decoded_error = round_trip<ErrorPayload>(error, storage);
    assert(decoded_error.code == ErrorCode::Permission);
    assert(decoded_error.chunk_index == kNoChunk);
    assert(decoded_error.reason == "private file");
    assert(error_kind(ErrorCode::NotFound) == ErrorKind::Protocol);
    assert(error_kind(ErrorCode::Busy) == ErrorKind::Network);
    assert(error_code(ErrorKind::Integrity) == ErrorCode::Integrity);

    TransferCompletePayload complete{};
    complete.transfer_id = 77;
    complete.file_id = "beef";
    const auto& decoded_complete = round_trip<TransferCompletePayload>(complete, storage);
    assert(storage.type == MessageType::TransferComplete);
    assert(decoded_complete.transfer_id == 77);
    assert(decoded_complete.file_id == "beef");
    assert(to_string(MessageType::TransferComplete) == "TRANSFER_COMPLETE");

    FileListPayload list{};
    list.request_id = 3;
    list.entries.push_back({"id-1", "a.txt", 10, Visibility::Public, "alice"});
    list.entries.push_back({"id-2", "b.txt", 20, Visibility::Private, "bob"});
    const auto& decoded_list = round_trip<FileListPayload>(list, storage);
    assert(decoded_list.entries.size() == 2);
    assert(decoded_list.entries[1].visibility == Visibility::Private);
    assert(decoded_list.entries[1].owner == "bob");
}

void check_discovery_messages() {
    Message storage;
    AnnouncePayload announce{};
    announce.identity_key.fill(0x11);
    announce.transport_port = 5001;
    announce.user_id = "alice";
    announce.timestamp_ms = 1700000000000ull;
    announce.ttl_seconds = 30;
    announce.signature.fill(0x22);
    const auto& decoded = round_trip<AnnouncePayload>(announce, storage);
    assert(decoded.identity_key == announce.identity_key);
    assert(decoded.transport_port == 5001);
    assert(decoded.ttl_seconds == 30);
    assert(decoded.signature == announce.signature);

    // The signed bytes cover the fields but never the signature itself.
    auto resigned = announce;
    resigned.signature.fill(0x33);
    assert(announce_signing_bytes(resigned) == announce_signing_bytes(announce));
    resigned.transport_port = 5002;
    assert(announce_signing_bytes(resigned) != announce_signing_bytes(announce));
}

void check_malformed_frames() {
    ChunkAckPayload ack{};
    ack.transfer_id = 1;
    ack.file_id = "abc";
    ack.index = 7;
    const auto frame = encode(make_message(ack));
    assert(frame.size() > kLengthFieldSize + 2);
    assert(frame[kLengthFieldSize + 1] == static_cast<std::uint8_t>(MessageType::ChunkAck));

    for (std::size_t cut = 0; cut < frame.size(); ++cut) {
        assert(!decode(std::span<const std::uint8_t>(frame.data(), cut)).has_value());
    }

    auto unknown = frame;
    unknown[kLengthFieldSize + 1] = 0x7f;
    assert(!decode(unknown).has_value());

    auto trailing = frame;
    trailing.push_back(0x00);
    trailing[3] = static_cast<std::uint8_t>(trailing[3] + 1);
    assert(!decode(trailing).has_value());

    assert(!decode_body(std::vector<std::uint8_t>{kProtocolVersion}).has_value());
}

}  // namespace

int main() {
    check_transfer_messages();
    check_discovery_messages();
    check_malformed_frames();
    return 0;
}
