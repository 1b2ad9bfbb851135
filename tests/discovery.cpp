#include "sharemesh/network/Discovery.hpp"
#include "test_access.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <variant>
#include <vector>

using namespace std::chrono_literals;
using namespace sharemesh;
using namespace sharemesh::network;

namespace {

class MemoryTransport;

// Delivers every broadcast to all other open transports, like a quiet LAN segment.
class MemoryBus {
public:
    void join(MemoryTransport* member) {
        std::scoped_lock lock(mutex_);
        members_.push_back(member);
    }

    void leave(MemoryTransport* member) {
        std::scoped_lock lock(mutex_);
        members_.erase(std::remove(members_.begin(), members_.end(), member), members_.end());
    }

    void deliver(MemoryTransport* sender, std::span<const std::uint8_t> datagram);

private:
    std::mutex mutex_;
    std::vector<MemoryTransport*> members_;
};

class MemoryTransport : public DiscoveryTransport {
public:
    explicit MemoryTransport(MemoryBus* bus) : bus_(bus) {}

    ~MemoryTransport() override {
        close();
    }

    void open() override {
        if (bus_ != nullptr) {
            bus_->join(this);
        }
    }

    void close() noexcept override {
        if (bus_ != nullptr) {
            bus_->leave(this);
        }
    }

    bool broadcast(std::span<const std::uint8_t> datagram) override {
        {
            std::scoped_lock lock(mutex_);
            sent_.emplace_back(datagram.begin(), datagram.end());
        }
        if (bus_ != nullptr) {
            bus_->deliver(this, datagram);
        }
        return true;
    }

    std::optional<Datagram> receive(std::chrono::milliseconds wait) override {
        std::unique_lock lock(mutex_);
        if (!ready_.wait_for(lock, wait, [this] { return !inbox_.empty(); })) {
            return std::nullopt;
        }
        auto datagram = std::move(inbox_.front());
        inbox_.pop_front();
        return datagram;
    }

    void push(Datagram datagram) {
        {
            std::scoped_lock lock(mutex_);
            inbox_.push_back(std::move(datagram));
        }
        ready_.notify_one();
    }

    std::vector<std::vector<std::uint8_t>> sent() const {
        std::scoped_lock lock(mutex_);
        return sent_;
    }

private:
    MemoryBus* bus_;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<Datagram> inbox_;
    std::vector<std::vector<std::uint8_t>> sent_;
};

void MemoryBus::deliver(MemoryTransport* sender, std::span<const std::uint8_t> datagram) {
    std::scoped_lock lock(mutex_);
    for (auto* member : members_) {
        if (member != sender) {
            member->push({{datagram.begin(), datagram.end()}, "127.0.0.1"});
        }
    }
}

Config discovery_config(const std::string& user) {
    Config config{};
    config.user_id = user;
    config.peer_ttl = 30s;
    config.announce_interval = 1s;
    config.logging_enabled = false;
    return config;
}

void check_two_nodes_find_each_other() {
    MemoryBus bus;
    const auto alice = Identity::generate();
    const auto bob = Identity::generate();
    PeerRegistry alice_peers(30s);
    PeerRegistry bob_peers(30s);

    DiscoveryService alice_discovery(alice, discovery_config("alice"), alice_peers,
                                     std::make_unique<MemoryTransport>(&bus));
    auto bob_discovery = std::make_unique<DiscoveryService>(bob, discovery_config("bob"), bob_peers,
                                                            std::make_unique<MemoryTransport>(&bus));
    alice_discovery.start(7001);
    bob_discovery->start(7002);

    assert(test::eventually([&] { return alice_peers.find(bob.peer_id()).has_value(); }));
    assert(test::eventually([&] { return bob_peers.find(alice.peer_id()).has_value(); }));

    const auto seen_bob = alice_peers.find(bob.peer_id());
    assert(seen_bob->info.port == 7002);
    assert(seen_bob->info.user_id == "bob");
    assert(seen_bob->info.host == "127.0.0.1");
    assert(seen_bob->info.identity_key == bob.public_key());
    // A node never lists itself.
    assert(!alice_peers.find(alice.peer_id()).has_value());

    // Leaving announces absence.
    bob_discovery->stop();
    assert(test::eventually([&] { return !alice_peers.find(bob.peer_id()).has_value(); }));
    bob_discovery.reset();
    alice_discovery.stop();
}

void check_datagram_validation() {
    const auto alice = Identity::generate();
    const auto bob = Identity::generate();
    PeerRegistry peers(30s);
    DiscoveryService receiver(alice, discovery_config("alice"), peers, std::make_unique<MemoryTransport>(nullptr));

    auto recorder = std::make_unique<MemoryTransport>(nullptr);
    auto* recorded = recorder.get();
    DiscoveryService sender(bob, discovery_config("bob"), peers, std::move(recorder));
    assert(sender.announce());
    const auto announce = recorded->sent().back();

    const auto now = DiscoveryService::Clock::now();
    const auto wall = std::chrono::system_clock::now();

    // Outside the freshness window.
    assert(!receiver.handle_datagram({announce, "10.0.0.2"}, now, wall + 5min));
    assert(peers.size() == 0);

    assert(receiver.handle_datagram({announce, "10.0.0.2"}, now, wall));
    assert(peers.find(bob.peer_id(), now).has_value());
    assert(peers.find(bob.peer_id(), now)->info.host == "10.0.0.2");

    // Fields changed after signing.
    auto decoded = protocol::decode(announce);
    assert(decoded.has_value());
    auto forged = std::get<protocol::AnnouncePayload>(decoded->payload);
    forged.user_id = "admin";
    assert(!receiver.handle_datagram({protocol::encode(protocol::make_message(forged)), "10.0.0.9"}, now, wall));
    assert(peers.find(bob.peer_id(), now)->info.user_id == "bob");

    // Own announces and garbage are ignored.
    auto own_recorder = std::make_unique<MemoryTransport>(nullptr);
    auto* own_recorded = own_recorder.get();
    DiscoveryService self(alice, discovery_config("alice"), peers, std::move(own_recorder));
    assert(self.announce());
    assert(!receiver.handle_datagram({own_recorded->sent().back(), "10.0.0.1"}, now, wall));
    assert(!receiver.handle_datagram({{0x00, 0x01, 0x02}, "10.0.0.1"}, now, wall));

    // A DISCOVER solicits an announce but adds nobody.
    assert(sender.solicit());
    assert(receiver.handle_datagram({recorded->sent().back(), "10.0.0.2"}, now, wall));
    assert(peers.size() == 1);
}

}  // namespace

int main() {
    test::silence_logs();
    check_two_nodes_find_each_other();
    check_datagram_validation();
    return 0;
}
