#include "sharemesh/core/PeerRegistry.hpp"
#include "test_access.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using namespace sharemesh;

namespace {

PeerInfo make_peer(std::uint8_t fill, std::uint16_t port = 5001) {
    PeerInfo info{};
    info.peer_id.fill(fill);
    info.identity_key.fill(static_cast<std::uint8_t>(fill + 1));
    info.host = "10.0.0." + std::to_string(fill);
    info.port = port;
    info.user_id = "user" + std::to_string(fill);
    return info;
}

void check_announce_and_expiry() {
    PeerRegistry registry(30s);
    const auto t0 = PeerRegistry::Clock::now();
    const auto a = make_peer(0xA1);

    std::vector<PeerEvent> events;
    std::mutex events_mutex;
    registry.set_observer([&](PeerEvent event, const Peer&) {
        std::scoped_lock lock(events_mutex);
        events.push_back(event);
    });

    assert(registry.announce(a, t0));
    auto active = registry.list_active(t0);
    assert(active.size() == 1);
    assert(active.front().info.peer_id == a.peer_id);
    assert(active.front().state == PeerState::Active);

    // Idempotent refresh.
    assert(!registry.announce(a, t0 + 10s));
    assert(registry.list_active(t0 + 35s).size() == 1);

    // TTL elapses with no renewal.
    assert(registry.list_active(t0 + 41s).empty());
    assert(!registry.find(a.peer_id, t0 + 41s).has_value());
    // Lazily expired: still stored until the sweep.
    assert(registry.size() == 1);
    assert(registry.expire_sweep(t0 + 41s) == 1);
    assert(registry.size() == 0);

    assert(registry.announce(a, t0 + 50s));
    assert(registry.find(a.peer_id, t0 + 50s).has_value());
    assert(registry.remove(a.peer_id));
    assert(!registry.remove(a.peer_id));
    assert(registry.list_active(t0 + 50s).empty());

    std::scoped_lock lock(events_mutex);
    const std::vector<PeerEvent> expected{PeerEvent::Added, PeerEvent::Refreshed, PeerEvent::Expired,
                                          PeerEvent::Added, PeerEvent::Removed};
    assert(events == expected);
}

void check_ordering_and_deprioritization() {
    PeerRegistry registry(30s, 60s);
    const auto t0 = PeerRegistry::Clock::now();
    const auto a = make_peer(1);
    const auto b = make_peer(2);
    const auto c = make_peer(3);
    registry.announce(a, t0);
    registry.announce(b, t0 + 1s);
    registry.announce(c, t0 + 2s);

    auto active = registry.list_active(t0 + 3s);
    assert(active.size() == 3);
    assert(active[0].info.peer_id == c.peer_id);
    assert(active[2].info.peer_id == a.peer_id);

    registry.note_auth_failure(c.peer_id, t0 + 3s);
    active = registry.list_active(t0 + 4s);
    assert(active.size() == 3);
    assert(active.back().info.peer_id == c.peer_id);
    assert(active.back().auth_failures == 1);

    // Once the cool-down ends c sorts by recency again.
    registry.announce(a, t0 + 45s);
    registry.announce(b, t0 + 45s);
    registry.announce(c, t0 + 64s);
    active = registry.list_active(t0 + 65s);
    assert(active.front().info.peer_id == c.peer_id);

    // Unset peer ids are never stored.
    assert(!registry.announce(PeerInfo{}, t0));
}

void check_concurrent_access() {
    PeerRegistry registry(30s);
    constexpr int kThreads = 8;
    constexpr int kRounds = 200;
    std::atomic<bool> go{false};
    std::vector<std::thread> workers;

    for (int worker = 0; worker < kThreads; ++worker) {
        workers.emplace_back([&, worker] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            for (int round = 0; round < kRounds; ++round) {
                const auto fill = static_cast<std::uint8_t>(1 + (worker * kRounds + round) % 32);
                registry.announce(make_peer(fill));
                (void)registry.list_active();
                if (round % 50 == 0) {
                    (void)registry.expire_sweep();
                }
                if (round % 70 == 0) {
                    registry.remove(make_peer(fill).peer_id);
                }
            }
        });
    }
    go = true;
    for (auto& worker : workers) {
        worker.join();
    }
    assert(registry.size() <= 32);
    for (const auto& peer : registry.list_active()) {
        assert(peer.state == PeerState::Active);
    }
}

}  // namespace

int main() {
    test::silence_logs();
    check_announce_and_expiry();
    check_ordering_and_deprioritization();
    check_concurrent_access();
    return 0;
}
