// include/onboard/session.hpp
// Onboarding session record and the store it lives in.

#pragma once

#include "events.hpp"
#include "payload.hpp"
#include "types.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace onboard {

struct OnboardingSession {
    std::string id;
    std::string hotel_id;
    std::string owner_id;
    SessionStatus status = SessionStatus::Active;
    Draft draft;
    std::set<StepId> completed_steps;
    double quality_score = 0.0;     // Cache; recomputable from draft
    TimePoint created_at{};
    TimePoint updated_at{};
    TimePoint expires_at{};
    uint64_t version = 0;           // Bumped on every successful write
    bool abandoned_by_expiry = false;  // Set when the TTL, not abandon(), ended it

    bool is_expired(TimePoint now) const noexcept { return now > expires_at; }
    bool is_active(TimePoint now) const noexcept {
        return status == SessionStatus::Active && !is_expired(now);
    }
    bool is_step_completed(StepId step) const { return completed_steps.count(step) > 0; }

    // Share of all wizard steps completed, 0-100.
    double completion_percentage() const noexcept;
};

// Durable backing store. Implementations must make compare_and_swap atomic
// with respect to concurrent writers of the same session.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual std::optional<OnboardingSession> load(const std::string& session_id) const = 0;

    // Insert a new session. Throws OnboardError (Storage) if the id exists.
    virtual void save(const OnboardingSession& session) = 0;

    // Replace the stored session only if its version still equals
    // `expected_version`. Returns false when another writer got there first.
    virtual bool compare_and_swap(const OnboardingSession& session,
                                  uint64_t expected_version) = 0;

    virtual std::vector<std::string> list_ids() const = 0;
};

class InMemorySessionStore : public SessionStore {
public:
    std::optional<OnboardingSession> load(const std::string& session_id) const override;
    void save(const OnboardingSession& session) override;
    bool compare_and_swap(const OnboardingSession& session, uint64_t expected_version) override;
    std::vector<std::string> list_ids() const override;

    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, OnboardingSession> sessions_;
};

} // namespace onboard
