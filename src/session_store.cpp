// src/session_store.cpp
// In-memory session store with version-checked writes.

#include "onboard/error.hpp"
#include "onboard/session.hpp"

#include <mutex>

namespace onboard {

double OnboardingSession::completion_percentage() const noexcept {
    size_t done = 0;
    for (StepId step : ALL_STEPS) {
        if (completed_steps.count(step) > 0) {
            done++;
        }
    }
    return 100.0 * static_cast<double>(done) / static_cast<double>(ALL_STEPS.size());
}

std::optional<OnboardingSession> InMemorySessionStore::load(const std::string& session_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemorySessionStore::save(const OnboardingSession& session) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!sessions_.emplace(session.id, session).second) {
        throw OnboardError::storage("session already exists: " + session.id);
    }
}

bool InMemorySessionStore::compare_and_swap(const OnboardingSession& session,
                                            uint64_t expected_version) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(session.id);
    if (it == sessions_.end() || it->second.version != expected_version) {
        return false;
    }
    it->second = session;
    return true;
}

std::vector<std::string> InMemorySessionStore::list_ids() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        ids.push_back(entry.first);
    }
    return ids;
}

size_t InMemorySessionStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace onboard
