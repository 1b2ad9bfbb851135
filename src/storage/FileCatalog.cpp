#include "sharemesh/storage/FileCatalog.hpp"

#include "sharemesh/crypto/Sha256.hpp"
#include "sharemesh/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace sharemesh::storage {

FileCatalog::FileCatalog(Config config)
    : config_(sanitize(std::move(config))) {}

FileId FileCatalog::make_file_id(const UserId& owner, const Hash256& content_hash, const std::string& name) {
    crypto::Sha256 hasher;
    hasher.update(owner);
    hasher.update(std::string_view("\0", 1));
    hasher.update(content_hash);
    hasher.update(name);
    return to_hex(hasher.finalize());
}

FileDescriptor FileCatalog::share_file(const std::filesystem::path& path,
                                       const UserId& owner,
                                       Visibility visibility,
                                       std::set<UserId> permitted_users) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw std::invalid_argument("not a regular file: " + path.string());
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("cannot stat " + path.string() + ": " + ec.message());
    }
    if (size > config_.max_file_size) {
        throw std::invalid_argument("file " + path.string() + " is " + std::to_string(size) +
                                    " bytes, above the limit of " + std::to_string(config_.max_file_size));
    }

    FileDescriptor descriptor;
    descriptor.name = path.filename().string();
    descriptor.owner_id = owner;
    descriptor.visibility = visibility;
    if (visibility == Visibility::Private) {
        descriptor.permitted_users = std::move(permitted_users);
    }
    descriptor.manifest = protocol::build_manifest(path, config_.chunk_size);
    descriptor.file_id = make_file_id(owner, descriptor.manifest.content_hash, descriptor.name);

    {
        std::unique_lock lock(mutex_);
        files_.insert_or_assign(descriptor.file_id, Entry{descriptor, std::filesystem::absolute(path)});
    }

    daemon::StructuredLogger::instance().info("catalog.shared",
                                              {{"file", descriptor.file_id},
                                               {"name", descriptor.name},
                                               {"owner", owner},
                                               {"visibility", std::string(to_string(visibility))},
                                               {"chunks", std::to_string(descriptor.manifest.chunk_count())},
                                               {"bytes", std::to_string(descriptor.manifest.file_size)}});
    return descriptor;
}

bool FileCatalog::unshare(const FileId& file_id) {
    std::unique_lock lock(mutex_);
    return files_.erase(file_id) > 0;
}

bool FileCatalog::set_visibility(const FileId& file_id, Visibility visibility, std::set<UserId> permitted_users) {
    {
        std::unique_lock lock(mutex_);
        const auto it = files_.find(file_id);
        if (it == files_.end()) {
            return false;
        }
        auto& descriptor = it->second.descriptor;
        descriptor.visibility = visibility;
        descriptor.permitted_users.clear();
        if (visibility == Visibility::Private) {
            descriptor.permitted_users = std::move(permitted_users);
        }
    }
    daemon::StructuredLogger::instance().info(
        "catalog.visibility", {{"file", file_id}, {"visibility", std::string(to_string(visibility))}});
    return true;
}

void FileCatalog::set_admin(const UserId& user_id, bool admin) {
    std::unique_lock lock(mutex_);
    if (admin) {
        admins_.insert(user_id);
    } else {
        admins_.erase(user_id);
    }
}

void FileCatalog::bind_user(const UserId& user_id, const PeerId& peer_id) {
    {
        std::unique_lock lock(mutex_);
        user_peers_.insert_or_assign(user_id, peer_id);
    }
    daemon::StructuredLogger::instance().info("catalog.user_bound",
                                              {{"user", user_id}, {"peer", peer_id_to_string(peer_id)}});
}

bool FileCatalog::unbind_user(const UserId& user_id) {
    std::unique_lock lock(mutex_);
    return user_peers_.erase(user_id) > 0;
}

std::optional<FileDescriptor> FileCatalog::find_file(const FileId& file_id) const {
    std::shared_lock lock(mutex_);
    const auto it = files_.find(file_id);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second.descriptor;
}

std::optional<std::filesystem::path> FileCatalog::local_path(const FileId& file_id) const {
    std::shared_lock lock(mutex_);
    const auto it = files_.find(file_id);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second.path;
}

std::vector<FileDescriptor> FileCatalog::list_files() const {
    std::vector<FileDescriptor> files;
    {
        std::shared_lock lock(mutex_);
        files.reserve(files_.size());
        for (const auto& [_, entry] : files_) {
            files.push_back(entry.descriptor);
        }
    }
    std::sort(files.begin(), files.end(), [](const FileDescriptor& lhs, const FileDescriptor& rhs) {
        return lhs.name != rhs.name ? lhs.name < rhs.name : lhs.file_id < rhs.file_id;
    });
    return files;
}

bool FileCatalog::is_admin(const UserId& user_id) const {
    std::shared_lock lock(mutex_);
    return admins_.contains(user_id);
}

std::optional<PeerId> FileCatalog::peer_for_user(const UserId& user_id) const {
    std::shared_lock lock(mutex_);
    const auto it = user_peers_.find(user_id);
    if (it == user_peers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace sharemesh::storage
