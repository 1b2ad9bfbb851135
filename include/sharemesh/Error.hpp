#pragma once

#include "sharemesh/Types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sharemesh {

enum class ErrorKind : std::uint8_t {
    Network,
    Protocol,
    Auth,
    Permission,
    Integrity
};

std::string_view to_string(ErrorKind kind) noexcept;

struct ErrorInfo {
    ErrorKind kind{ErrorKind::Network};
    std::string message;
    PeerId peer{};
    std::optional<FileId> file_id;
    std::optional<ChunkIndex> chunk_index;

    [[nodiscard]] std::string describe() const;
};

ErrorInfo make_error(ErrorKind kind,
                     std::string message,
                     const PeerId& peer = {},
                     std::optional<FileId> file_id = std::nullopt,
                     std::optional<ChunkIndex> chunk_index = std::nullopt);

class Error : public std::runtime_error {
public:
    explicit Error(ErrorInfo info);
    Error(ErrorKind kind, std::string message, const PeerId& peer = {});

    const ErrorInfo& info() const noexcept { return info_; }
    ErrorKind kind() const noexcept { return info_.kind; }

private:
    ErrorInfo info_;
};

}  // namespace sharemesh
