#include "sharemesh/core/AccessControl.hpp"
#include "sharemesh/storage/FileStore.hpp"

#include <cassert>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace sharemesh;

namespace {

class MemoryStore : public storage::FileStore {
public:
    void add(storage::FileDescriptor descriptor) {
        files_[descriptor.file_id] = std::move(descriptor);
    }

    void add_admin(const UserId& user) {
        admins_.insert(user);
    }

    void bind(const UserId& user, const PeerId& peer_id) {
        bindings_[user] = peer_id;
    }

    std::optional<storage::FileDescriptor> find_file(const FileId& file_id) const override {
        const auto it = files_.find(file_id);
        if (it == files_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<std::filesystem::path> local_path(const FileId&) const override {
        return std::nullopt;
    }

    std::vector<storage::FileDescriptor> list_files() const override {
        std::vector<storage::FileDescriptor> out;
        for (const auto& [_, descriptor] : files_) {
            out.push_back(descriptor);
        }
        return out;
    }

    bool is_admin(const UserId& user_id) const override {
        return admins_.contains(user_id);
    }

    std::optional<PeerId> peer_for_user(const UserId& user_id) const override {
        const auto it = bindings_.find(user_id);
        if (it == bindings_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    std::map<FileId, storage::FileDescriptor> files_;
    std::set<UserId> admins_;
    std::map<UserId, PeerId> bindings_;
};

storage::FileDescriptor descriptor(const std::string& id,
                                   const UserId& owner,
                                   Visibility visibility,
                                   std::set<UserId> permitted = {}) {
    storage::FileDescriptor file{};
    file.file_id = id;
    file.name = id + ".bin";
    file.owner_id = owner;
    file.visibility = visibility;
    file.permitted_users = std::move(permitted);
    return file;
}

PeerId peer(std::uint8_t fill) {
    PeerId id{};
    id.fill(fill);
    return id;
}

}  // namespace

int main() {
    const AccessControlEngine engine;
    const auto remote = peer(0x42);

    const auto public_file = descriptor("pub", "carol", Visibility::Public);
    assert(engine.authorize("bob", remote, public_file, false).allowed());
    assert(engine.authorize("", remote, public_file, false).allowed());
    // An unauthenticated request is refused even for public files.
    assert(!engine.authorize("bob", PeerId{}, public_file, false).allowed());

    const auto private_file = descriptor("x", "carol", Visibility::Private, {"alice"});
    const auto bob = engine.authorize("bob", remote, private_file, false);
    assert(bob.verdict == Verdict::Deny);
    assert(!bob.reason.empty());
    assert(engine.authorize("alice", remote, private_file, false).allowed());
    assert(engine.authorize("carol", remote, private_file, false).allowed());
    assert(engine.authorize("bob", remote, private_file, true).allowed());

    // Permitted users mean nothing while the file is public, and everything once it is private.
    auto toggled = private_file;
    toggled.visibility = Visibility::Public;
    toggled.permitted_users.clear();
    assert(engine.authorize("bob", remote, toggled, false).allowed());
    toggled.visibility = Visibility::Private;
    assert(!engine.authorize("alice", remote, toggled, false).allowed());

    // Owner check never matches an empty user id.
    const auto unowned = descriptor("u", "", Visibility::Private);
    assert(!engine.authorize("", remote, unowned, false).allowed());

    // Deterministic: repeated calls give identical decisions.
    for (int round = 0; round < 100; ++round) {
        const auto again = engine.authorize("bob", remote, private_file, false);
        assert(again.verdict == bob.verdict);
        assert(again.reason == bob.reason);
    }

    MemoryStore store;
    store.add(public_file);
    store.add(private_file);
    store.add(descriptor("y", "bob", Visibility::Private));
    store.add_admin("root");

    const auto for_bob = engine.visible_files("bob", remote, store);
    assert(for_bob.size() == 2);
    for (const auto& file : for_bob) {
        assert(file.file_id == "pub" || file.file_id == "y");
    }
    assert(engine.visible_files("alice", remote, store).size() == 2);
    assert(engine.visible_files("root", remote, store).size() == 3);
    assert(engine.visible_files("root", PeerId{}, store).empty());

    // A claimed user id counts only from the peer it is bound to.
    const auto alice_peer = peer(0x0a);
    const auto impostor = peer(0x0b);
    store.bind("alice", alice_peer);
    assert(engine.resolve_user("alice", alice_peer, store) == "alice");
    assert(engine.resolve_user("alice", impostor, store).empty());
    assert(engine.resolve_user("root", impostor, store).empty());
    assert(engine.resolve_user("", alice_peer, store).empty());
    assert(engine.resolve_user("alice", PeerId{}, store).empty());

    const auto as_impostor = engine.resolve_user("alice", impostor, store);
    const auto refused = engine.authorize(as_impostor, impostor, private_file, false);
    assert(!refused.allowed());
    assert(!refused.reason.empty());
    assert(engine.authorize(as_impostor, impostor, public_file, false).allowed());
    assert(engine.visible_files(as_impostor, impostor, store).size() == 1);
    assert(engine.visible_files(engine.resolve_user("alice", alice_peer, store), alice_peer, store).size() == 2);

    // An empty user id is never a permitted one.
    const auto odd = descriptor("z", "carol", Visibility::Private, {""});
    assert(!engine.authorize("", remote, odd, false).allowed());
    return 0;
}
