#include "sharemesh/Error.hpp"

#include <sstream>
#include <utility>

namespace sharemesh {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Network:
            return "NetworkError";
        case ErrorKind::Protocol:
            return "ProtocolError";
        case ErrorKind::Auth:
            return "AuthError";
        case ErrorKind::Permission:
            return "PermissionError";
        case ErrorKind::Integrity:
            return "IntegrityError";
    }
    return "NetworkError";
}

std::string ErrorInfo::describe() const {
    std::ostringstream oss;
    oss << to_string(kind) << ": " << message;
    if (!is_unset(peer)) {
        oss << " (peer " << peer_id_to_string(peer).substr(0, 16);
        if (file_id.has_value()) {
            oss << ", file " << *file_id;
        }
        if (chunk_index.has_value()) {
            oss << ", chunk " << *chunk_index;
        }
        oss << ')';
    } else if (file_id.has_value()) {
        oss << " (file " << *file_id << ')';
    }
    return oss.str();
}

ErrorInfo make_error(ErrorKind kind,
                     std::string message,
                     const PeerId& peer,
                     std::optional<FileId> file_id,
                     std::optional<ChunkIndex> chunk_index) {
    ErrorInfo info{};
    info.kind = kind;
    info.message = std::move(message);
    info.peer = peer;
    info.file_id = std::move(file_id);
    info.chunk_index = chunk_index;
    return info;
}

Error::Error(ErrorInfo info)
    : std::runtime_error(info.describe()),
      info_(std::move(info)) {}

Error::Error(ErrorKind kind, std::string message, const PeerId& peer)
    : Error(make_error(kind, std::move(message), peer)) {}

}  // namespace sharemesh
