#pragma once

#include "sharemesh/Types.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sharemesh {

struct PeerInfo {
    PeerId peer_id{};
    std::string host;
    std::uint16_t port{0};
    std::array<std::uint8_t, 32> identity_key{};
    UserId user_id;
};

enum class PeerState : std::uint8_t {
    Active,
    Expired
};

struct Peer {
    PeerInfo info;
    std::chrono::steady_clock::time_point last_seen{};
    PeerState state{PeerState::Active};
    std::chrono::steady_clock::time_point deprioritized_until{};
    std::uint32_t auth_failures{0};
};

enum class PeerEvent : std::uint8_t {
    Added,
    Refreshed,
    Expired,
    Removed
};

std::string_view to_string(PeerEvent event) noexcept;

// Announce/expire directory of reachable peers. Each peer lives in its own slot with its
// own mutex; the slot index is only write-locked to insert or erase slots.
class PeerRegistry {
public:
    using Clock = std::chrono::steady_clock;
    using Observer = std::function<void(PeerEvent, const Peer&)>;

    explicit PeerRegistry(std::chrono::seconds ttl,
                          std::chrono::seconds auth_failure_cooldown = std::chrono::seconds(60));

    // Inserts or refreshes; last_seen becomes now. Returns true when the peer was not active before.
    bool announce(const PeerInfo& info, Clock::time_point now = Clock::now());

    // Peers seen within the TTL. Deprioritized peers come last.
    std::vector<Peer> list_active(Clock::time_point now = Clock::now());

    std::optional<Peer> find(const PeerId& peer_id, Clock::time_point now = Clock::now());

    // Drops expired entries from storage; returns how many were dropped.
    std::size_t expire_sweep(Clock::time_point now = Clock::now());

    bool remove(const PeerId& peer_id);

    // Advisory: the peer stays listed but sorts after healthy peers until the cooldown ends.
    void note_auth_failure(const PeerId& peer_id, Clock::time_point now = Clock::now());

    // Stored entries, including expired ones not yet swept.
    std::size_t size() const;

    void set_observer(Observer observer);

    std::chrono::seconds ttl() const noexcept { return ttl_; }

private:
    struct Slot {
        std::mutex mutex;
        Peer peer;
        bool removed{false};
    };

    using Event = std::pair<PeerEvent, Peer>;

    std::shared_ptr<Slot> find_slot(const std::string& key) const;
    std::vector<std::shared_ptr<Slot>> snapshot() const;
    bool is_live(const Peer& peer, Clock::time_point now) const;
    // Marks the peer expired when its TTL has lapsed; true on the transition.
    bool refresh_state(Peer& peer, Clock::time_point now) const;
    void notify(const std::vector<Event>& events);

    std::chrono::seconds ttl_;
    std::chrono::seconds auth_failure_cooldown_;

    mutable std::shared_mutex index_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;

    std::mutex observer_mutex_;
    Observer observer_{};
};

}  // namespace sharemesh
