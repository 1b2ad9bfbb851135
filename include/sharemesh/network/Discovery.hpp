#pragma once

#include "sharemesh/Config.hpp"
#include "sharemesh/core/PeerRegistry.hpp"
#include "sharemesh/network/Identity.hpp"
#include "sharemesh/protocol/Message.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace sharemesh::network {

struct Datagram {
    std::vector<std::uint8_t> payload;
    std::string source_host;
};

// Carries DISCOVER/ANNOUNCE datagrams. Any mechanism that can deliver them works.
class DiscoveryTransport {
public:
    virtual ~DiscoveryTransport() = default;

    // Throws std::runtime_error when the transport cannot be opened.
    virtual void open() = 0;
    virtual void close() noexcept = 0;
    virtual bool broadcast(std::span<const std::uint8_t> datagram) = 0;
    virtual std::optional<Datagram> receive(std::chrono::milliseconds wait) = 0;
};

// IPv4 UDP multicast on the local network.
class MulticastTransport : public DiscoveryTransport {
public:
    MulticastTransport(std::string group, std::uint16_t port);
    ~MulticastTransport() override;

    void open() override;
    void close() noexcept override;
    bool broadcast(std::span<const std::uint8_t> datagram) override;
    std::optional<Datagram> receive(std::chrono::milliseconds wait) override;

private:
    std::string group_;
    std::uint16_t port_;
    std::atomic<int> socket_{-1};
};

class DiscoveryService {
public:
    using Clock = std::chrono::steady_clock;

    DiscoveryService(const Identity& identity,
                     const Config& config,
                     PeerRegistry& registry,
                     std::unique_ptr<DiscoveryTransport> transport);
    ~DiscoveryService();

    DiscoveryService(const DiscoveryService&) = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;

    // Opens the transport, announces, solicits announces and starts the timer thread.
    void start(std::uint16_t transport_port);
    // Broadcasts an absence announce and stops the timer thread.
    void stop();

    bool announce();
    bool solicit();

    // Verifies and applies one datagram; false when it was ignored.
    bool handle_datagram(const Datagram& datagram,
                         Clock::time_point now = Clock::now(),
                         std::chrono::system_clock::time_point wall_now = std::chrono::system_clock::now());

private:
    protocol::AnnouncePayload make_announce(std::uint32_t ttl_seconds) const;
    bool send(const protocol::Message& message);
    void run();

    const Identity& identity_;
    Config config_;
    PeerRegistry& registry_;
    std::unique_ptr<DiscoveryTransport> transport_;

    std::atomic<std::uint16_t> transport_port_{0};
    std::atomic<bool> running_{false};
    std::atomic<bool> reply_pending_{false};
    std::thread worker_;
};

}  // namespace sharemesh::network
