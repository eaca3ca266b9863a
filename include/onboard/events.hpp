// include/onboard/events.hpp
// Audit trail and completion notices handed to integration callbacks.

#pragma once

#include "types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace onboard {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class AuditAction : uint8_t {
    SessionCreated   = 0,
    StepUpdated      = 1,
    SessionCompleted = 2,
    SessionExpired   = 3,
    SessionAbandoned = 4,
};

const char* to_string(AuditAction action) noexcept;

struct AuditEvent {
    AuditAction action = AuditAction::SessionCreated;
    std::string session_id;
    std::string hotel_id;
    std::string owner_id;
    std::optional<StepId> step;     // Set for StepUpdated only
    double quality_score = 0.0;     // Score after the action
    TimePoint at{};
};

// Delivered once per session, after the COMPLETED state is persisted.
struct CompletionNotice {
    std::string session_id;
    std::string hotel_id;
    std::string owner_id;
    double quality_score = 0.0;
    TimePoint completed_at{};
};

} // namespace onboard
