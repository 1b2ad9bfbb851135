#include "sharemesh/core/AccessControl.hpp"

#include <utility>

namespace sharemesh {

Decision AccessControlEngine::authorize(const UserId& requesting_user,
                                        const PeerId& requesting_peer,
                                        const storage::FileDescriptor& descriptor,
                                        bool is_admin) const {
    if (is_unset(requesting_peer)) {
        return {Verdict::Deny, "request does not come from an authenticated peer"};
    }
    if (descriptor.visibility == Visibility::Public) {
        return {Verdict::Allow, "public file"};
    }
    if (!requesting_user.empty() && requesting_user == descriptor.owner_id) {
        return {Verdict::Allow, "owner"};
    }
    if (!requesting_user.empty() && descriptor.permitted_users.contains(requesting_user)) {
        return {Verdict::Allow, "permitted user"};
    }
    if (is_admin) {
        return {Verdict::Allow, "admin"};
    }
    if (requesting_user.empty()) {
        return {Verdict::Deny, "peer is not bound to a user; private file " + descriptor.file_id + " is off limits"};
    }
    return {Verdict::Deny, "user '" + requesting_user + "' may not access private file " + descriptor.file_id};
}

UserId AccessControlEngine::resolve_user(const UserId& claimed_user,
                                        const PeerId& requesting_peer,
                                        const storage::FileStore& store) const {
    if (claimed_user.empty() || is_unset(requesting_peer)) {
        return {};
    }
    const auto bound = store.peer_for_user(claimed_user);
    if (!bound.has_value() || *bound != requesting_peer) {
        return {};
    }
    return claimed_user;
}

std::vector<storage::FileDescriptor> AccessControlEngine::visible_files(const UserId& requesting_user,
                                                                        const PeerId& requesting_peer,
                                                                        const storage::FileStore& store) const {
    const bool admin = !requesting_user.empty() && store.is_admin(requesting_user);
    std::vector<storage::FileDescriptor> visible;
    for (auto& descriptor : store.list_files()) {
        if (authorize(requesting_user, requesting_peer, descriptor, admin).allowed()) {
            visible.push_back(std::move(descriptor));
        }
    }
    return visible;
}

}  // namespace sharemesh
