#pragma once

#include "sharemesh/Config.hpp"
#include "sharemesh/Types.hpp"
#include "sharemesh/core/PeerRegistry.hpp"
#include "sharemesh/core/TransferEngine.hpp"
#include "sharemesh/network/Discovery.hpp"
#include "sharemesh/network/Identity.hpp"
#include "sharemesh/network/SessionManager.hpp"
#include "sharemesh/storage/DownloadTracker.hpp"
#include "sharemesh/storage/FileCatalog.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <thread>
#include <vector>

namespace sharemesh {

namespace test {
class NodeTestAccess;
}

// One participant: identity, peer directory, sessions, file catalog and transfer engine wired together.
class Node {
public:
    explicit Node(Config config = {});
    // Runs discovery over the given transport instead of UDP multicast, even when disabled in config.
    Node(Config config, std::unique_ptr<network::DiscoveryTransport> discovery_transport);
    ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    // Throws std::runtime_error when the listener or the discovery transport cannot be opened.
    void start();
    void stop();

    // Session sweep and driver reaping; the maintenance thread calls it once per second.
    void tick();

    storage::FileDescriptor share_file(const std::filesystem::path& path,
                                       Visibility visibility = Visibility::Public,
                                       std::set<UserId> permitted_users = {});

    std::vector<Peer> peers();
    std::optional<network::PeerEndpoint> endpoint_for(const PeerId& peer_id);

    // Throws Error (Network) when the peer is not in the registry.
    JobId fetch(const FileId& file_id,
                const PeerId& peer_id,
                std::optional<std::filesystem::path> destination = std::nullopt);
    JobId fetch(const FileId& file_id,
                const network::PeerEndpoint& endpoint,
                std::optional<std::filesystem::path> destination = std::nullopt);

    std::vector<protocol::FileListEntry> list_remote_files(const PeerId& peer_id,
                                                           std::chrono::milliseconds timeout);

    const PeerId& id() const noexcept { return identity_.peer_id(); }
    const network::Identity& identity() const noexcept { return identity_; }
    const Config& config() const noexcept { return config_; }
    std::uint16_t transport_port() const noexcept { return sessions_.listening_port(); }
    network::PeerEndpoint local_endpoint() const;

    PeerRegistry& registry() noexcept { return registry_; }
    storage::FileCatalog& catalog() noexcept { return catalog_; }
    storage::DownloadTracker& tracker() noexcept { return tracker_; }
    network::SessionManager& sessions() noexcept { return sessions_; }
    TransferEngine& transfers() noexcept { return engine_; }

private:
    friend class test::NodeTestAccess;

    static network::Identity load_identity(const Config& config);
    void maintenance_loop();

    Config config_;
    network::Identity identity_;
    PeerRegistry registry_;
    storage::FileCatalog catalog_;
    storage::DownloadTracker tracker_;
    network::SessionManager sessions_;
    TransferEngine engine_;
    std::unique_ptr<network::DiscoveryService> discovery_;

    std::atomic<bool> running_{false};
    std::mutex maintenance_mutex_;
    std::condition_variable maintenance_cv_;
    std::thread maintenance_thread_;
};

}  // namespace sharemesh
