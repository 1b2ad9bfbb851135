#include "sharemesh/network/Discovery.hpp"

#include "sharemesh/daemon/StructuredLogger.hpp"
#include "sharemesh/network/Handshake.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace sharemesh::network {

namespace {

constexpr std::chrono::milliseconds kReceivePoll{200};
constexpr std::size_t kMaxDatagram = 2048;
constexpr std::chrono::seconds kReplyInterval{1};

daemon::StructuredLogger& logger() {
    return daemon::StructuredLogger::instance();
}

std::string errno_text() {
    return std::strerror(errno);
}

}  // namespace

MulticastTransport::MulticastTransport(std::string group, std::uint16_t port)
    : group_(std::move(group)),
      port_(port) {}

MulticastTransport::~MulticastTransport() {
    close();
}

void MulticastTransport::open() {
    if (socket_.load() >= 0) {
        return;
    }

    in_addr group_addr{};
    if (::inet_pton(AF_INET, group_.c_str(), &group_addr) != 1) {
        throw std::runtime_error("invalid multicast group " + group_);
    }

    const int fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd < 0) {
        throw std::runtime_error("discovery socket: " + errno_text());
    }

    const int enable = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));
#ifdef SO_REUSEPORT
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &enable, sizeof(enable));
#endif

    sockaddr_in bind_addr{};
    bind_addr.sin_family = AF_INET;
    bind_addr.sin_addr.s_addr = htonl(INADDR_ANY);
    bind_addr.sin_port = htons(port_);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&bind_addr), sizeof(bind_addr)) != 0) {
        const auto reason = errno_text();
        ::close(fd);
        throw std::runtime_error("discovery bind on port " + std::to_string(port_) + ": " + reason);
    }

    ip_mreq membership{};
    membership.imr_multiaddr = group_addr;
    membership.imr_interface.s_addr = htonl(INADDR_ANY);
    if (::setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &membership, sizeof(membership)) != 0) {
        const auto reason = errno_text();
        ::close(fd);
        throw std::runtime_error("joining multicast group " + group_ + ": " + reason);
    }

    const unsigned char loop = 1;
    const unsigned char hops = 1;
    ::setsockopt(fd, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop));
    ::setsockopt(fd, IPPROTO_IP, IP_MULTICAST_TTL, &hops, sizeof(hops));

    socket_.store(fd);
}

void MulticastTransport::close() noexcept {
    const int fd = socket_.exchange(-1);
    if (fd >= 0) {
        ::close(fd);
    }
}

bool MulticastTransport::broadcast(std::span<const std::uint8_t> datagram) {
    const int fd = socket_.load();
    if (fd < 0) {
        return false;
    }
    sockaddr_in target{};
    target.sin_family = AF_INET;
    target.sin_port = htons(port_);
    if (::inet_pton(AF_INET, group_.c_str(), &target.sin_addr) != 1) {
        return false;
    }
    const auto sent = ::sendto(fd, datagram.data(), datagram.size(), 0, reinterpret_cast<sockaddr*>(&target),
                               sizeof(target));
    return sent == static_cast<ssize_t>(datagram.size());
}

std::optional<Datagram> MulticastTransport::receive(std::chrono::milliseconds wait) {
    const int fd = socket_.load();
    if (fd < 0) {
        return std::nullopt;
    }
    pollfd descriptor{};
    descriptor.fd = fd;
    descriptor.events = POLLIN;
    if (::poll(&descriptor, 1, static_cast<int>(wait.count())) <= 0 || (descriptor.revents & POLLIN) == 0) {
        return std::nullopt;
    }

    std::array<std::uint8_t, kMaxDatagram> buffer{};
    sockaddr_in source{};
    socklen_t source_len = sizeof(source);
    const auto received = ::recvfrom(fd, buffer.data(), buffer.size(), 0, reinterpret_cast<sockaddr*>(&source),
                                     &source_len);
    if (received <= 0) {
        return std::nullopt;
    }

    Datagram datagram;
    datagram.payload.assign(buffer.begin(), buffer.begin() + received);
    char host[INET_ADDRSTRLEN]{};
    if (::inet_ntop(AF_INET, &source.sin_addr, host, sizeof(host)) != nullptr) {
        datagram.source_host = host;
    }
    return datagram;
}

DiscoveryService::DiscoveryService(const Identity& identity,
                                   const Config& config,
                                   PeerRegistry& registry,
                                   std::unique_ptr<DiscoveryTransport> transport)
    : identity_(identity),
      config_(sanitize(config)),
      registry_(registry),
      transport_(std::move(transport)) {}

DiscoveryService::~DiscoveryService() {
    stop();
}

void DiscoveryService::start(std::uint16_t transport_port) {
    if (running_) {
        return;
    }
    transport_port_ = transport_port;
    transport_->open();
    running_ = true;
    announce();
    solicit();
    worker_ = std::thread(&DiscoveryService::run, this);
    logger().info("discovery.started",
                  {{"peer", peer_id_to_string(identity_.peer_id())},
                   {"transport_port", std::to_string(transport_port)}});
}

void DiscoveryService::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    send(protocol::make_message(make_announce(0)));
    transport_->close();
    logger().info("discovery.stopped", {{"peer", peer_id_to_string(identity_.peer_id())}});
}

protocol::AnnouncePayload DiscoveryService::make_announce(std::uint32_t ttl_seconds) const {
    protocol::AnnouncePayload payload{};
    payload.identity_key = identity_.public_key();
    payload.transport_port = transport_port_.load();
    payload.user_id = config_.user_id;
    payload.timestamp_ms = to_unix_millis(std::chrono::system_clock::now());
    payload.ttl_seconds = ttl_seconds;
    payload.signature = identity_.sign(protocol::announce_signing_bytes(payload));
    return payload;
}

bool DiscoveryService::send(const protocol::Message& message) {
    const auto datagram = protocol::encode(message);
    if (!transport_->broadcast(datagram)) {
        logger().warning("discovery.send_failed", {{"type", std::string(protocol::to_string(message.type))}});
        return false;
    }
    return true;
}

bool DiscoveryService::announce() {
    const auto ttl = static_cast<std::uint32_t>(config_.peer_ttl.count());
    return send(protocol::make_message(make_announce(ttl)));
}

bool DiscoveryService::solicit() {
    protocol::DiscoverPayload payload{};
    payload.sender = identity_.peer_id();
    return send(protocol::make_message(payload));
}

bool DiscoveryService::handle_datagram(const Datagram& datagram,
                                       Clock::time_point now,
                                       std::chrono::system_clock::time_point wall_now) {
    const auto message = protocol::decode(datagram.payload);
    if (!message.has_value() || message->version != config_.protocol_version) {
        return false;
    }

    if (const auto* discover = std::get_if<protocol::DiscoverPayload>(&message->payload)) {
        if (discover->sender == identity_.peer_id()) {
            return false;
        }
        reply_pending_ = true;
        return true;
    }

    const auto* announce = std::get_if<protocol::AnnouncePayload>(&message->payload);
    if (announce == nullptr) {
        return false;
    }

    const auto peer_id = Identity::derive_peer_id(announce->identity_key);
    if (peer_id == identity_.peer_id()) {
        return false;
    }
    if (!Identity::verify(announce->identity_key, protocol::announce_signing_bytes(*announce), announce->signature)) {
        logger().warning("discovery.announce_rejected",
                         {{"peer", peer_id_to_string(peer_id)}, {"source", datagram.source_host}, {"reason", "signature"}});
        return false;
    }
    const auto sent_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(announce->timestamp_ms));
    const auto skew = wall_now > sent_at ? wall_now - sent_at : sent_at - wall_now;
    if (skew > config_.handshake_freshness) {
        logger().warning("discovery.announce_rejected",
                         {{"peer", peer_id_to_string(peer_id)}, {"source", datagram.source_host}, {"reason", "stale"}});
        return false;
    }

    if (announce->ttl_seconds == 0) {
        registry_.remove(peer_id);
        return true;
    }

    PeerInfo info;
    info.peer_id = peer_id;
    info.host = datagram.source_host;
    info.port = announce->transport_port;
    info.identity_key = announce->identity_key;
    info.user_id = announce->user_id;
    registry_.announce(info, now);
    return true;
}

void DiscoveryService::run() {
    auto next_announce = Clock::now() + config_.announce_interval;
    auto next_sweep = Clock::now() + config_.sweep_interval;
    auto last_reply = Clock::time_point{};

    while (running_) {
        if (auto datagram = transport_->receive(kReceivePoll)) {
            handle_datagram(*datagram);
        }

        const auto now = Clock::now();
        if (reply_pending_ && now - last_reply >= kReplyInterval) {
            reply_pending_ = false;
            last_reply = now;
            announce();
        }
        if (now >= next_announce) {
            announce();
            next_announce = now + config_.announce_interval;
        }
        if (now >= next_sweep) {
            const auto dropped = registry_.expire_sweep(now);
            if (dropped > 0) {
                logger().info("discovery.sweep", {{"expired", std::to_string(dropped)}});
            }
            next_sweep = now + config_.sweep_interval;
        }
    }
}

}  // namespace sharemesh::network
