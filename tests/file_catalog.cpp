#include "sharemesh/core/AccessControl.hpp"
#include "sharemesh/storage/FileCatalog.hpp"
#include "test_access.hpp"

#include <cassert>
#include <filesystem>
#include <stdexcept>

using namespace sharemesh;
using namespace sharemesh::storage;

namespace {

template <typename Exception, typename Body>
bool throws(Body&& body) {
    try {
        body();
    } catch (const Exception&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    test::silence_logs();
    const auto dir = test::scratch_directory("catalog");

    Config config{};
    config.chunk_size = kMinChunkSize;
    config.max_file_size = 64 * 1024;
    FileCatalog catalog(config);

    const auto report = test::write_file(dir / "report.bin", test::patterned_bytes(10 * kMinChunkSize + 17));
    const auto notes = test::write_file(dir / "notes.txt", test::patterned_bytes(100, 3));
    const auto empty = test::write_file(dir / "empty.dat", {});
    const auto huge = test::write_file(dir / "huge.bin", test::patterned_bytes(64 * 1024 + 1));

    const auto shared = catalog.share_file(report, "carol", Visibility::Private, {"alice"});
    assert(shared.name == "report.bin");
    assert(shared.owner_id == "carol");
    assert(shared.manifest.chunk_count() == 11);
    assert(shared.manifest.file_size == 10 * kMinChunkSize + 17);
    assert(shared.file_id == FileCatalog::make_file_id("carol", shared.manifest.content_hash, "report.bin"));
    // Same content shared by another owner is a different file.
    assert(shared.file_id != FileCatalog::make_file_id("dave", shared.manifest.content_hash, "report.bin"));

    const auto public_notes = catalog.share_file(notes, "carol");
    const auto nothing = catalog.share_file(empty, "bob");
    assert(nothing.manifest.chunk_count() == 0);
    assert(nothing.manifest.file_size == 0);

    assert(throws<std::invalid_argument>([&] { (void)catalog.share_file(huge, "carol"); }));
    assert(throws<std::invalid_argument>([&] { (void)catalog.share_file(dir / "missing.bin", "carol"); }));
    assert(throws<std::invalid_argument>([&] { (void)catalog.share_file(dir, "carol"); }));

    const auto files = catalog.list_files();
    assert(files.size() == 3);
    assert(files[0].name == "empty.dat");
    assert(files[1].name == "notes.txt");
    assert(files[2].name == "report.bin");

    assert(catalog.local_path(shared.file_id) == std::filesystem::absolute(report));
    assert(!catalog.local_path("unknown").has_value());

    PeerId remote{};
    remote.fill(0x10);
    const AccessControlEngine access;
    assert(access.visible_files("bob", remote, catalog).size() == 2);
    assert(access.visible_files("alice", remote, catalog).size() == 3);

    catalog.set_admin("root", true);
    assert(catalog.is_admin("root"));
    assert(access.visible_files("root", remote, catalog).size() == 3);
    catalog.set_admin("root", false);
    assert(!catalog.is_admin("root"));

    // Toggling back to private replaces the permitted set.
    assert(catalog.set_visibility(shared.file_id, Visibility::Public));
    assert(access.visible_files("bob", remote, catalog).size() == 3);
    assert(catalog.set_visibility(shared.file_id, Visibility::Private, {"bob"}));
    assert(access.visible_files("bob", remote, catalog).size() == 3);
    assert(access.visible_files("alice", remote, catalog).size() == 2);
    assert(!catalog.set_visibility("unknown", Visibility::Public));

    // Bindings pin a user id to one identity; rebinding moves it.
    assert(!catalog.peer_for_user("bob").has_value());
    catalog.bind_user("bob", remote);
    assert(catalog.peer_for_user("bob") == remote);
    assert(access.resolve_user("bob", remote, catalog) == "bob");
    PeerId other{};
    other.fill(0x20);
    catalog.bind_user("bob", other);
    assert(access.resolve_user("bob", remote, catalog).empty());
    assert(catalog.unbind_user("bob"));
    assert(!catalog.unbind_user("bob"));
    assert(!catalog.peer_for_user("bob").has_value());

    assert(catalog.unshare(public_notes.file_id));
    assert(!catalog.unshare(public_notes.file_id));
    assert(!catalog.find_file(public_notes.file_id).has_value());
    assert(catalog.list_files().size() == 2);

    std::filesystem::remove_all(dir);
    return 0;
}
