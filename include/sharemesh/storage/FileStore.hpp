#pragma once

#include "sharemesh/Types.hpp"
#include "sharemesh/protocol/Manifest.hpp"

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sharemesh::storage {

struct FileDescriptor {
    FileId file_id;
    std::string name;
    UserId owner_id;
    Visibility visibility{Visibility::Public};
    // Only consulted when visibility is Private.
    std::set<UserId> permitted_users;
    protocol::FileManifest manifest;
};

// File and user records the transfer core reads but never owns.
class FileStore {
public:
    virtual ~FileStore() = default;

    virtual std::optional<FileDescriptor> find_file(const FileId& file_id) const = 0;
    virtual std::optional<std::filesystem::path> local_path(const FileId& file_id) const = 0;
    virtual std::vector<FileDescriptor> list_files() const = 0;
    virtual bool is_admin(const UserId& user_id) const = 0;
    // Peer whose identity key may speak for user_id, if any.
    virtual std::optional<PeerId> peer_for_user(const UserId& user_id) const = 0;
};

}  // namespace sharemesh::storage
