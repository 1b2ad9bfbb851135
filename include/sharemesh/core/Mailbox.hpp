#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace sharemesh {

// Multi-producer, single-consumer queue feeding one job driver.
template <typename Event>
class Mailbox {
public:
    bool push(Event event) {
        {
            std::scoped_lock lock(mutex_);
            if (closed_) {
                return false;
            }
            events_.push_back(std::move(event));
        }
        ready_.notify_one();
        return true;
    }

    std::optional<Event> pop(std::chrono::milliseconds wait) {
        std::unique_lock lock(mutex_);
        ready_.wait_for(lock, wait, [this] { return closed_ || !events_.empty(); });
        if (events_.empty()) {
            return std::nullopt;
        }
        Event event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    // Further pushes fail; queued events can still be drained.
    void close() {
        {
            std::scoped_lock lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    bool closed() const {
        std::scoped_lock lock(mutex_);
        return closed_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<Event> events_;
    bool closed_{false};
};

}  // namespace sharemesh
