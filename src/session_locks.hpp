// src/session_locks.hpp
// Registry of per-session mutexes. Entries live only while a caller holds
// the mutex handle; released entries are pruned as the registry grows.

#pragma once

#include <algorithm>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace onboard {

class SessionLockRegistry {
public:
    static constexpr size_t MIN_PRUNE_THRESHOLD = 64;

    // Callers serializing on the same id get the same mutex for as long as
    // any of them holds it.
    std::shared_ptr<std::mutex> acquire(const std::string& session_id) {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = locks_.find(session_id);
            if (it != locks_.end()) {
                if (auto held = it->second.lock()) {
                    return held;
                }
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto& slot = locks_[session_id];
        auto held = slot.lock();
        if (!held) {
            held = std::make_shared<std::mutex>();
            slot = held;
        }
        if (locks_.size() >= prune_threshold_) {
            prune();
        }
        return held;
    }

    // Entries currently tracked, released ones not yet pruned included.
    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return locks_.size();
    }

private:
    // Caller holds the exclusive lock.
    void prune() {
        for (auto it = locks_.begin(); it != locks_.end();) {
            if (it->second.expired()) {
                it = locks_.erase(it);
            } else {
                ++it;
            }
        }
        prune_threshold_ = std::max(MIN_PRUNE_THRESHOLD, locks_.size() * 2);
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::weak_ptr<std::mutex>> locks_;
    size_t prune_threshold_ = MIN_PRUNE_THRESHOLD;
};

} // namespace onboard
