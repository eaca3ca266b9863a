// include/onboard/engine.hpp
// Onboarding engine: session lifecycle, validated idempotent step updates,
// quality scoring and gated completion.

#pragma once

#include "amenity.hpp"
#include "config.hpp"
#include "error.hpp"
#include "image.hpp"
#include "payload.hpp"
#include "quality.hpp"
#include "session.hpp"
#include "types.hpp"
#include "validation_result.hpp"

#include <memory>
#include <string>
#include <vector>

namespace onboard {

struct SessionSummary {
    std::string session_id;
    SessionStatus status = SessionStatus::Active;
    TimePoint expires_at{};
};

struct StepUpdateResult {
    double quality_score = 0.0;
    QualityScoreBreakdown breakdown;
    std::vector<std::string> warnings;
};

struct StatusReport {
    OnboardingSession session;
    double quality_score = 0.0;
    QualityScoreBreakdown breakdown;
    std::vector<MissingInformation> missing_info;
    std::vector<Recommendation> recommendations;
    double completion_percentage = 0.0;
};

struct CompletionResult {
    std::string session_id;
    std::string hotel_id;
    double quality_score = 0.0;
    // False when the session was already COMPLETED by an earlier call.
    bool newly_completed = false;
};

// Raw upload handed to analyze_uploads().
struct ImageUpload {
    std::string id;
    ImageCategory category = ImageCategory::Exterior;
    std::string url;
    std::vector<uint8_t> bytes;
};

// The onboarding engine.
//
// Created via OnboardingEngine::create(). Thread-safe: calls on different
// sessions run in parallel; calls on one session are serialized.
//
// Example:
//   auto engine = OnboardingEngine::create(EngineConfig::defaults(),
//       std::make_shared<AmenityCatalog>(AmenityCatalog::defaults()));
//   auto summary = engine->create_session("hotel-1", "owner-1");
//   engine->update_step(summary.session_id, StepId::Amenities,
//                       AmenitiesPayload{{"wifi"}, PropertyType::Hotel});
class OnboardingEngine {
public:
    // Throws OnboardError on a null catalog.
    static std::unique_ptr<OnboardingEngine> create(
        EngineConfig config,
        std::shared_ptr<const AmenityCatalog> catalog,
        std::shared_ptr<SessionStore> store = nullptr,
        std::shared_ptr<const ImageDecoder> decoder = nullptr);

    ~OnboardingEngine();

    OnboardingEngine(const OnboardingEngine&) = delete;
    OnboardingEngine& operator=(const OnboardingEngine&) = delete;
    OnboardingEngine(OnboardingEngine&&) noexcept;
    OnboardingEngine& operator=(OnboardingEngine&&) noexcept;

    // --- Lifecycle ---

    // Start a new ACTIVE session with an empty draft.
    SessionSummary create_session(const std::string& hotel_id, const std::string& owner_id);

    // Validate, merge and persist one step. Throws OnboardError: Validation
    // (nothing written), NotFound, InvalidState, Expired.
    StepUpdateResult update_step(const std::string& session_id, StepId step,
                                 const StepPayload& payload);

    // Pure validation for real-time feedback; never touches a session.
    ValidationResult validate_step(StepId step, const StepPayload& payload,
                                   bool validate_dependencies = false,
                                   const Draft* draft = nullptr) const;

    StatusReport get_status(const std::string& session_id);

    // Finalize. Throws OnboardError (Validation) listing missing steps, with
    // the session left untouched.
    CompletionResult complete(const std::string& session_id);

    // Explicit ACTIVE -> ABANDONED.
    void abandon(const std::string& session_id);

    // Mark every expired ACTIVE session ABANDONED. Returns how many changed.
    size_t sweep_expired();

    // --- Images ---

    // Analyze raw uploads in parallel into image records for the images step.
    // Throws OnboardError (Configuration) when no decoder was supplied.
    std::vector<ImageRecord> analyze_uploads(const std::vector<ImageUpload>& uploads) const;

    const EngineConfig& config() const noexcept;

private:
    OnboardingEngine(EngineConfig config, std::shared_ptr<const AmenityCatalog> catalog,
                     std::shared_ptr<SessionStore> store,
                     std::shared_ptr<const ImageDecoder> decoder);
    struct Inner;
    std::unique_ptr<Inner> inner_;
};

} // namespace onboard
