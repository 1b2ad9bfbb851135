#include "sharemesh/core/Node.hpp"

#include "sharemesh/daemon/StructuredLogger.hpp"

#include <stdexcept>
#include <utility>

namespace sharemesh {

namespace {

constexpr std::chrono::seconds kMaintenanceInterval{1};

daemon::StructuredLogger& logger() {
    return daemon::StructuredLogger::instance();
}

std::optional<std::filesystem::path> journal_path(const Config& config) {
    if (config.download_log_path.empty()) {
        return std::nullopt;
    }
    return std::filesystem::path(config.download_log_path);
}

Config prepared(Config config) {
    config = sanitize(std::move(config));
    logger().set_enabled(config.logging_enabled);
    if (const auto level = daemon::StructuredLogger::parse_level(config.log_level)) {
        logger().set_threshold(*level);
    }
    return config;
}

}  // namespace

Node::Node(Config config)
    : Node(std::move(config), nullptr) {}

Node::Node(Config config, std::unique_ptr<network::DiscoveryTransport> discovery_transport)
    : config_(prepared(std::move(config))),
      identity_(load_identity(config_)),
      registry_(config_.peer_ttl, config_.auth_failure_cooldown),
      catalog_(config_),
      tracker_(journal_path(config_)),
      sessions_(identity_, config_),
      engine_(config_, identity_.peer_id(), sessions_, catalog_, tracker_) {
    for (const auto& [user, peer_hex] : config_.user_peers) {
        const auto peer_id = peer_id_from_string(peer_hex);
        if (!peer_id.has_value()) {
            throw std::invalid_argument("user '" + user + "' is bound to an invalid peer id");
        }
        catalog_.bind_user(user, *peer_id);
    }
    if (!discovery_transport && config_.discovery_enabled) {
        discovery_transport =
            std::make_unique<network::MulticastTransport>(config_.multicast_group, config_.discovery_port);
    }
    if (discovery_transport) {
        discovery_ = std::make_unique<network::DiscoveryService>(identity_, config_, registry_,
                                                                 std::move(discovery_transport));
    }

    sessions_.set_message_handler([this](const network::SessionManager::SessionHandle& session,
                                         const protocol::Message& message) {
        engine_.handle_message(session, message);
    });
    sessions_.set_closed_handler([this](const network::SessionManager::SessionHandle& session) {
        engine_.handle_session_closed(session);
    });
    sessions_.set_auth_failure_handler([this](const PeerId& peer_id, const ErrorInfo& error) {
        registry_.note_auth_failure(peer_id);
        logger().warning("node.auth_failure", {{"peer", peer_id_to_string(peer_id)}, {"reason", error.message}});
    });
}

Node::~Node() {
    stop();
}

network::Identity Node::load_identity(const Config& config) {
    if (config.identity_seed.has_value()) {
        return network::Identity::from_seed(*config.identity_seed);
    }
    if (!config.identity_key_path.empty()) {
        return network::Identity::load_or_create(config.identity_key_path);
    }
    return network::Identity::generate();
}

void Node::start() {
    if (running_.exchange(true)) {
        return;
    }
    try {
        sessions_.start();
        if (discovery_) {
            discovery_->start(sessions_.listening_port());
        }
    } catch (...) {
        sessions_.stop();
        running_ = false;
        throw;
    }
    maintenance_thread_ = std::thread(&Node::maintenance_loop, this);

    logger().info("node.started",
                  {{"peer", peer_id_to_string(identity_.peer_id())},
                   {"user", config_.user_id},
                   {"port", std::to_string(sessions_.listening_port())},
                   {"discovery", discovery_ ? "on" : "off"}});
}

void Node::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::scoped_lock lock(maintenance_mutex_);
        maintenance_cv_.notify_all();
    }
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }
    if (discovery_) {
        discovery_->stop();
    }
    engine_.shutdown();
    sessions_.stop();
    logger().info("node.stopped", {{"peer", peer_id_to_string(identity_.peer_id())}});
}

void Node::tick() {
    sessions_.sweep();
    engine_.reap();
    if (!discovery_) {
        registry_.expire_sweep();
    }
}

void Node::maintenance_loop() {
    std::unique_lock lock(maintenance_mutex_);
    while (running_) {
        maintenance_cv_.wait_for(lock, kMaintenanceInterval, [this] { return !running_.load(); });
        if (!running_) {
            break;
        }
        lock.unlock();
        tick();
        lock.lock();
    }
}

storage::FileDescriptor Node::share_file(const std::filesystem::path& path,
                                         Visibility visibility,
                                         std::set<UserId> permitted_users) {
    return catalog_.share_file(path, config_.user_id, visibility, std::move(permitted_users));
}

std::vector<Peer> Node::peers() {
    return registry_.list_active();
}

std::optional<network::PeerEndpoint> Node::endpoint_for(const PeerId& peer_id) {
    const auto peer = registry_.find(peer_id);
    if (!peer.has_value() || peer->state != PeerState::Active) {
        return std::nullopt;
    }
    network::PeerEndpoint endpoint;
    endpoint.peer_id = peer->info.peer_id;
    endpoint.host = peer->info.host;
    endpoint.port = peer->info.port;
    return endpoint;
}

network::PeerEndpoint Node::local_endpoint() const {
    network::PeerEndpoint endpoint;
    endpoint.peer_id = identity_.peer_id();
    endpoint.host = config_.advertise_host.value_or(
        config_.listen_host == "0.0.0.0" ? std::string("127.0.0.1") : config_.listen_host);
    endpoint.port = sessions_.listening_port();
    return endpoint;
}

JobId Node::fetch(const FileId& file_id, const PeerId& peer_id, std::optional<std::filesystem::path> destination) {
    const auto endpoint = endpoint_for(peer_id);
    if (!endpoint.has_value()) {
        throw Error(ErrorKind::Network, "peer " + peer_id_to_string(peer_id) + " is not in the registry", peer_id);
    }
    return fetch(file_id, *endpoint, std::move(destination));
}

JobId Node::fetch(const FileId& file_id,
                  const network::PeerEndpoint& endpoint,
                  std::optional<std::filesystem::path> destination) {
    DownloadRequest request;
    request.file_id = file_id;
    request.source = endpoint;
    request.destination = std::move(destination);
    return engine_.request_download(std::move(request));
}

std::vector<protocol::FileListEntry> Node::list_remote_files(const PeerId& peer_id,
                                                             std::chrono::milliseconds timeout) {
    const auto endpoint = endpoint_for(peer_id);
    if (!endpoint.has_value()) {
        throw Error(ErrorKind::Network, "peer " + peer_id_to_string(peer_id) + " is not in the registry", peer_id);
    }
    return engine_.list_remote_files(*endpoint, timeout);
}

}  // namespace sharemesh
