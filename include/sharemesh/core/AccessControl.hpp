#pragma once

#include "sharemesh/Types.hpp"
#include "sharemesh/storage/FileStore.hpp"

#include <string>
#include <vector>

namespace sharemesh {

enum class Verdict : std::uint8_t {
    Allow,
    Deny
};

struct Decision {
    Verdict verdict{Verdict::Deny};
    std::string reason;

    bool allowed() const noexcept { return verdict == Verdict::Allow; }
};

// Stateless; safe to call from any thread.
class AccessControlEngine {
public:
    Decision authorize(const UserId& requesting_user,
                       const PeerId& requesting_peer,
                       const storage::FileDescriptor& descriptor,
                       bool is_admin) const;

    // The user id a peer claimed, if the store binds it to that peer; otherwise the
    // empty id, which only reaches public files.
    UserId resolve_user(const UserId& claimed_user,
                        const PeerId& requesting_peer,
                        const storage::FileStore& store) const;

    // Files from the store the user may fetch.
    std::vector<storage::FileDescriptor> visible_files(const UserId& requesting_user,
                                                       const PeerId& requesting_peer,
                                                       const storage::FileStore& store) const;
};

}  // namespace sharemesh
