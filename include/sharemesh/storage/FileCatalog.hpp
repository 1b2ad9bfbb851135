#pragma once

#include "sharemesh/Config.hpp"
#include "sharemesh/storage/FileStore.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace sharemesh::storage {

// In-memory file/user store backed by files on local disk.
class FileCatalog : public FileStore {
public:
    explicit FileCatalog(Config config = {});

    // Chunks and hashes the file. Throws std::invalid_argument when the file is missing,
    // not regular or larger than the configured maximum; std::runtime_error on read failure.
    FileDescriptor share_file(const std::filesystem::path& path,
                              const UserId& owner,
                              Visibility visibility = Visibility::Public,
                              std::set<UserId> permitted_users = {});

    bool unshare(const FileId& file_id);
    bool set_visibility(const FileId& file_id, Visibility visibility, std::set<UserId> permitted_users = {});
    void set_admin(const UserId& user_id, bool admin);
    // Pins user_id to one peer identity; a later call replaces the binding.
    void bind_user(const UserId& user_id, const PeerId& peer_id);
    bool unbind_user(const UserId& user_id);

    std::optional<FileDescriptor> find_file(const FileId& file_id) const override;
    std::optional<std::filesystem::path> local_path(const FileId& file_id) const override;
    std::vector<FileDescriptor> list_files() const override;
    bool is_admin(const UserId& user_id) const override;
    std::optional<PeerId> peer_for_user(const UserId& user_id) const override;

    static FileId make_file_id(const UserId& owner, const Hash256& content_hash, const std::string& name);

private:
    struct Entry {
        FileDescriptor descriptor;
        std::filesystem::path path;
    };

    Config config_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<FileId, Entry> files_;
    std::unordered_set<UserId> admins_;
    std::unordered_map<UserId, PeerId> user_peers_;
};

}  // namespace sharemesh::storage
