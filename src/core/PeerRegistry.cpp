#include "sharemesh/core/PeerRegistry.hpp"

#include "sharemesh/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <utility>

namespace sharemesh {

namespace {

daemon::StructuredLogger::FieldList peer_fields(const Peer& peer) {
    return {{"peer", peer_id_to_string(peer.info.peer_id)},
            {"endpoint", peer.info.host + ":" + std::to_string(peer.info.port)},
            {"user", peer.info.user_id}};
}

}  // namespace

std::string_view to_string(PeerEvent event) noexcept {
    switch (event) {
        case PeerEvent::Added:
            return "added";
        case PeerEvent::Refreshed:
            return "refreshed";
        case PeerEvent::Expired:
            return "expired";
        case PeerEvent::Removed:
            return "removed";
    }
    return "unknown";
}

PeerRegistry::PeerRegistry(std::chrono::seconds ttl, std::chrono::seconds auth_failure_cooldown)
    : ttl_(std::max(ttl, std::chrono::seconds(1))),
      auth_failure_cooldown_(std::max(auth_failure_cooldown, std::chrono::seconds(0))) {}

std::shared_ptr<PeerRegistry::Slot> PeerRegistry::find_slot(const std::string& key) const {
    std::shared_lock lock(index_mutex_);
    const auto it = slots_.find(key);
    return it == slots_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<PeerRegistry::Slot>> PeerRegistry::snapshot() const {
    std::shared_lock lock(index_mutex_);
    std::vector<std::shared_ptr<Slot>> slots;
    slots.reserve(slots_.size());
    for (const auto& [_, slot] : slots_) {
        slots.push_back(slot);
    }
    return slots;
}

bool PeerRegistry::is_live(const Peer& peer, Clock::time_point now) const {
    return now - peer.last_seen < ttl_;
}

bool PeerRegistry::refresh_state(Peer& peer, Clock::time_point now) const {
    if (peer.state == PeerState::Active && !is_live(peer, now)) {
        peer.state = PeerState::Expired;
        return true;
    }
    return false;
}

bool PeerRegistry::announce(const PeerInfo& info, Clock::time_point now) {
    if (is_unset(info.peer_id)) {
        return false;
    }
    const auto key = peer_id_to_string(info.peer_id);

    while (true) {
        auto slot = find_slot(key);
        if (!slot) {
            std::unique_lock lock(index_mutex_);
            auto& entry = slots_[key];
            if (!entry) {
                entry = std::make_shared<Slot>();
                entry->peer.info = info;
                entry->peer.last_seen = now;
                entry->peer.state = PeerState::Active;
                const Peer added = entry->peer;
                lock.unlock();
                daemon::StructuredLogger::instance().info("registry.peer.added", peer_fields(added));
                notify({{PeerEvent::Added, added}});
                return true;
            }
            slot = entry;
        }

        std::unique_lock slot_lock(slot->mutex);
        if (slot->removed) {
            // Lost a race with expire_sweep or remove; the slot is gone from the index.
            continue;
        }
        auto& peer = slot->peer;
        const bool reactivated = peer.state == PeerState::Expired || !is_live(peer, now);
        peer.info = info;
        peer.last_seen = std::max(peer.last_seen, now);
        peer.state = PeerState::Active;
        const Peer current = peer;
        slot_lock.unlock();

        if (reactivated) {
            daemon::StructuredLogger::instance().info("registry.peer.added", peer_fields(current));
        }
        notify({{reactivated ? PeerEvent::Added : PeerEvent::Refreshed, current}});
        return reactivated;
    }
}

std::vector<Peer> PeerRegistry::list_active(Clock::time_point now) {
    std::vector<Peer> active;
    std::vector<Event> events;
    for (const auto& slot : snapshot()) {
        std::scoped_lock lock(slot->mutex);
        if (slot->removed) {
            continue;
        }
        if (refresh_state(slot->peer, now)) {
            events.emplace_back(PeerEvent::Expired, slot->peer);
        }
        if (slot->peer.state == PeerState::Active) {
            active.push_back(slot->peer);
        }
    }

    std::sort(active.begin(), active.end(), [now](const Peer& lhs, const Peer& rhs) {
        const bool lhs_penalized = lhs.deprioritized_until > now;
        const bool rhs_penalized = rhs.deprioritized_until > now;
        if (lhs_penalized != rhs_penalized) {
            return !lhs_penalized;
        }
        if (lhs.last_seen != rhs.last_seen) {
            return lhs.last_seen > rhs.last_seen;
        }
        return lhs.info.peer_id < rhs.info.peer_id;
    });

    for (const auto& [_, peer] : events) {
        daemon::StructuredLogger::instance().info("registry.peer.expired", peer_fields(peer));
    }
    notify(events);
    return active;
}

std::optional<Peer> PeerRegistry::find(const PeerId& peer_id, Clock::time_point now) {
    const auto slot = find_slot(peer_id_to_string(peer_id));
    if (!slot) {
        return std::nullopt;
    }
    std::unique_lock lock(slot->mutex);
    if (slot->removed) {
        return std::nullopt;
    }
    if (refresh_state(slot->peer, now)) {
        const Peer expired = slot->peer;
        lock.unlock();
        daemon::StructuredLogger::instance().info("registry.peer.expired", peer_fields(expired));
        notify({{PeerEvent::Expired, expired}});
        return std::nullopt;
    }
    if (slot->peer.state != PeerState::Active) {
        return std::nullopt;
    }
    return slot->peer;
}

std::size_t PeerRegistry::expire_sweep(Clock::time_point now) {
    std::vector<Event> events;
    std::size_t dropped = 0;
    {
        std::unique_lock lock(index_mutex_);
        for (auto it = slots_.begin(); it != slots_.end();) {
            auto& slot = *it->second;
            std::scoped_lock slot_lock(slot.mutex);
            if (refresh_state(slot.peer, now)) {
                events.emplace_back(PeerEvent::Expired, slot.peer);
            }
            if (slot.peer.state == PeerState::Expired) {
                slot.removed = true;
                it = slots_.erase(it);
                ++dropped;
            } else {
                ++it;
            }
        }
    }

    for (const auto& [_, peer] : events) {
        daemon::StructuredLogger::instance().info("registry.peer.expired", peer_fields(peer));
    }
    notify(events);
    return dropped;
}

bool PeerRegistry::remove(const PeerId& peer_id) {
    std::shared_ptr<Slot> slot;
    {
        std::unique_lock lock(index_mutex_);
        const auto it = slots_.find(peer_id_to_string(peer_id));
        if (it == slots_.end()) {
            return false;
        }
        slot = it->second;
        slots_.erase(it);
    }

    Peer removed;
    {
        std::scoped_lock lock(slot->mutex);
        slot->removed = true;
        removed = slot->peer;
    }
    daemon::StructuredLogger::instance().info("registry.peer.removed", peer_fields(removed));
    notify({{PeerEvent::Removed, removed}});
    return true;
}

void PeerRegistry::note_auth_failure(const PeerId& peer_id, Clock::time_point now) {
    const auto slot = find_slot(peer_id_to_string(peer_id));
    if (!slot) {
        return;
    }
    std::uint32_t failures = 0;
    {
        std::scoped_lock lock(slot->mutex);
        if (slot->removed) {
            return;
        }
        slot->peer.deprioritized_until = now + auth_failure_cooldown_;
        failures = ++slot->peer.auth_failures;
    }
    daemon::StructuredLogger::instance().warning(
        "registry.peer.deprioritized",
        {{"peer", peer_id_to_string(peer_id)},
         {"auth_failures", std::to_string(failures)},
         {"cooldown_seconds", std::to_string(auth_failure_cooldown_.count())}});
}

std::size_t PeerRegistry::size() const {
    std::shared_lock lock(index_mutex_);
    return slots_.size();
}

void PeerRegistry::set_observer(Observer observer) {
    std::scoped_lock lock(observer_mutex_);
    observer_ = std::move(observer);
}

void PeerRegistry::notify(const std::vector<Event>& events) {
    if (events.empty()) {
        return;
    }
    Observer observer;
    {
        std::scoped_lock lock(observer_mutex_);
        observer = observer_;
    }
    if (!observer) {
        return;
    }
    for (const auto& [event, peer] : events) {
        observer(event, peer);
    }
}

}  // namespace sharemesh
