// src/engine.cpp
// Onboarding engine: per-session serialization, versioned writes, expiry
// handling and integration callbacks.

#include "onboard/engine.hpp"
#include "onboard/validation.hpp"
#include "merge.hpp"
#include "session_locks.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <optional>
#include <random>

namespace onboard {

// Generate a v4 UUID in its canonical text form.
static std::string generate_uuid() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    uint8_t bytes[16];
    uint64_t a = dist(gen);
    uint64_t b = dist(gen);
    std::memcpy(bytes, &a, 8);
    std::memcpy(bytes + 8, &b, 8);

    // Set version 4 and variant bits
    bytes[6] = (bytes[6] & 0x0F) | 0x40; // version 4
    bytes[8] = (bytes[8] & 0x3F) | 0x80; // variant 1

    char out[37];
    std::snprintf(out, sizeof(out),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
                  bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14],
                  bytes[15]);
    return out;
}

// Callback invocations queued while a session lock is held and delivered
// after it is released, so callbacks may call back into the engine.
struct PendingEvents {
    std::vector<AuditEvent> audits;
    std::optional<CompletionNotice> completion;
};

struct OnboardingEngine::Inner {
    EngineConfig config;
    std::shared_ptr<const AmenityCatalog> catalog;
    std::shared_ptr<SessionStore> store;
    std::shared_ptr<const ImageDecoder> decoder;
    StepValidator validator;
    QualityScorer scorer;
    ImageAnalyzer analyzer;

    SessionLockRegistry session_locks;

    Inner(EngineConfig cfg, std::shared_ptr<const AmenityCatalog> cat,
          std::shared_ptr<SessionStore> st, std::shared_ptr<const ImageDecoder> dec)
        : config(std::move(cfg)),
          catalog(std::move(cat)),
          store(std::move(st)),
          decoder(std::move(dec)),
          validator(config, catalog),
          scorer(config),
          analyzer(ImageQualityStandards::from_config(config)) {}

    void report_error(const OnboardError& err) const {
        if (config.on_error()) {
            config.on_error()(err);
        }
    }

    OnboardingSession load(const std::string& session_id) const {
        auto session = store->load(session_id);
        if (!session) {
            throw OnboardError::not_found(session_id);
        }
        return std::move(*session);
    }

    // Re-read, apply and compare-and-swap until the write lands. `apply`
    // returns false to skip the write (nothing left to do) and may throw to
    // abort. Returns the session as stored afterwards.
    template <typename Apply>
    OnboardingSession commit(const std::string& session_id, Apply apply) {
        for (uint32_t attempt = 0;; attempt++) {
            OnboardingSession session = load(session_id);
            uint64_t expected = session.version;
            if (!apply(session)) {
                return session;
            }
            session.version = expected + 1;
            if (store->compare_and_swap(session, expected)) {
                return session;
            }
            if (attempt >= config.max_cas_retries()) {
                throw OnboardError::storage("concurrent modification of session " + session_id +
                                            " after " + std::to_string(attempt + 1) + " attempts");
            }
            spdlog::debug("session {} version conflict, retrying", session_id);
        }
    }

    AuditEvent audit(AuditAction action, const OnboardingSession& session,
                     std::optional<StepId> step = std::nullopt) const {
        AuditEvent event;
        event.action = action;
        event.session_id = session.id;
        event.hotel_id = session.hotel_id;
        event.owner_id = session.owner_id;
        event.step = step;
        event.quality_score = session.quality_score;
        event.at = session.updated_at;
        return event;
    }

    // Load a session, persisting ACTIVE -> ABANDONED if its TTL has passed.
    OnboardingSession load_live(const std::string& session_id, PendingEvents& events) {
        OnboardingSession session = load(session_id);
        TimePoint now = config.now();
        if (session.status != SessionStatus::Active || !session.is_expired(now)) {
            return session;
        }

        bool transitioned = false;
        session = commit(session_id, [&](OnboardingSession& s) {
            if (s.status != SessionStatus::Active || !s.is_expired(now)) {
                return false;
            }
            s.status = SessionStatus::Abandoned;
            s.abandoned_by_expiry = true;
            s.updated_at = now;
            transitioned = true;
            return true;
        });
        if (transitioned) {
            spdlog::warn("onboarding session {} expired, marked abandoned", session_id);
            events.audits.push_back(audit(AuditAction::SessionExpired, session));
        }
        return session;
    }

    // Throws unless the session accepts writes.
    void require_active(const OnboardingSession& session) const {
        switch (session.status) {
            case SessionStatus::Active:
                return;
            case SessionStatus::Completed:
                throw OnboardError::invalid_state("session " + session.id + " is already completed");
            case SessionStatus::Abandoned:
                if (session.abandoned_by_expiry) {
                    throw OnboardError::expired(session.id);
                }
                throw OnboardError::invalid_state("session " + session.id + " was abandoned");
        }
    }

    void dispatch(const PendingEvents& events) const {
        if (config.on_audit()) {
            for (const auto& event : events.audits) {
                try {
                    config.on_audit()(event);
                } catch (const std::exception& e) {
                    spdlog::error("audit callback failed for session {}: {}", event.session_id,
                                  e.what());
                    report_error(OnboardError::callback("audit", e.what()));
                }
            }
        }
        if (events.completion && config.on_completed()) {
            try {
                config.on_completed()(*events.completion);
            } catch (const std::exception& e) {
                spdlog::error("completion callback failed for session {}: {}",
                              events.completion->session_id, e.what());
                report_error(OnboardError::callback("completion", e.what()));
            }
        }
    }
};

OnboardingEngine::OnboardingEngine(EngineConfig config,
                                   std::shared_ptr<const AmenityCatalog> catalog,
                                   std::shared_ptr<SessionStore> store,
                                   std::shared_ptr<const ImageDecoder> decoder)
    : inner_(std::make_unique<Inner>(std::move(config), std::move(catalog), std::move(store),
                                     std::move(decoder))) {}

OnboardingEngine::~OnboardingEngine() = default;
OnboardingEngine::OnboardingEngine(OnboardingEngine&&) noexcept = default;
OnboardingEngine& OnboardingEngine::operator=(OnboardingEngine&&) noexcept = default;

std::unique_ptr<OnboardingEngine> OnboardingEngine::create(
    EngineConfig config, std::shared_ptr<const AmenityCatalog> catalog,
    std::shared_ptr<SessionStore> store, std::shared_ptr<const ImageDecoder> decoder) {
    if (!catalog) {
        throw OnboardError::configuration("amenity catalog is required");
    }
    if (!store) {
        store = std::make_shared<InMemorySessionStore>();
    }
    spdlog::debug("onboarding engine created with {} catalog amenities", catalog->size());
    return std::unique_ptr<OnboardingEngine>(new OnboardingEngine(
        std::move(config), std::move(catalog), std::move(store), std::move(decoder)));
}

const EngineConfig& OnboardingEngine::config() const noexcept {
    return inner_->config;
}

// --- Lifecycle ---

SessionSummary OnboardingEngine::create_session(const std::string& hotel_id,
                                                const std::string& owner_id) {
    std::vector<std::string> errors;
    if (hotel_id.empty()) errors.emplace_back("hotelId is required");
    if (owner_id.empty()) errors.emplace_back("ownerId is required");
    if (!errors.empty()) {
        throw OnboardError::validation(std::move(errors));
    }

    TimePoint now = inner_->config.now();
    OnboardingSession session;
    session.id = generate_uuid();
    session.hotel_id = hotel_id;
    session.owner_id = owner_id;
    session.status = SessionStatus::Active;
    session.created_at = now;
    session.updated_at = now;
    session.expires_at = now + inner_->config.session_ttl();
    inner_->store->save(session);

    spdlog::info("onboarding session {} created for hotel {}", session.id, hotel_id);

    PendingEvents events;
    events.audits.push_back(inner_->audit(AuditAction::SessionCreated, session));
    inner_->dispatch(events);

    return SessionSummary{session.id, session.status, session.expires_at};
}

StepUpdateResult OnboardingEngine::update_step(const std::string& session_id, StepId step,
                                               const StepPayload& payload) {
    PendingEvents events;
    StepUpdateResult result;
    try {
        auto mutex = inner_->session_locks.acquire(session_id);
        std::lock_guard<std::mutex> guard(*mutex);

        OnboardingSession current = inner_->load_live(session_id, events);
        inner_->require_active(current);

        ValidationResult validation = inner_->validator.validate(step, payload);
        if (!validation.is_valid) {
            spdlog::warn("step {} rejected for session {}: {} error(s)", to_string(step),
                         session_id, validation.errors.size());
            throw OnboardError::validation(std::move(validation.errors),
                                           std::move(validation.warnings));
        }

        StepPayload normalized = merge::normalize(payload);
        OnboardingSession stored = inner_->commit(session_id, [&](OnboardingSession& s) {
            inner_->require_active(s);
            s.draft[step] = normalized;
            s.completed_steps.insert(step);
            result.breakdown = inner_->scorer.score(s.draft);
            s.quality_score = result.breakdown.overall;
            s.updated_at = inner_->config.now();
            return true;
        });

        result.quality_score = stored.quality_score;
        result.warnings = std::move(validation.warnings);
        events.audits.push_back(inner_->audit(AuditAction::StepUpdated, stored, step));
        spdlog::debug("session {} step {} stored, quality score {}", session_id,
                      to_string(step), stored.quality_score);
    } catch (const OnboardError&) {
        inner_->dispatch(events);
        throw;
    }
    inner_->dispatch(events);
    return result;
}

ValidationResult OnboardingEngine::validate_step(StepId step, const StepPayload& payload,
                                                 bool validate_dependencies,
                                                 const Draft* draft) const {
    return inner_->validator.validate(step, payload, validate_dependencies, draft);
}

StatusReport OnboardingEngine::get_status(const std::string& session_id) {
    PendingEvents events;
    StatusReport report;
    {
        auto mutex = inner_->session_locks.acquire(session_id);
        std::lock_guard<std::mutex> guard(*mutex);
        report.session = inner_->load_live(session_id, events);
    }
    inner_->dispatch(events);

    report.breakdown = inner_->scorer.score(report.session.draft);
    report.quality_score = report.breakdown.overall;
    report.missing_info = inner_->scorer.missing_information(report.session.draft);
    report.recommendations = inner_->scorer.recommendations(report.breakdown);
    report.completion_percentage = report.session.completion_percentage();
    return report;
}

CompletionResult OnboardingEngine::complete(const std::string& session_id) {
    PendingEvents events;
    CompletionResult result;
    try {
        auto mutex = inner_->session_locks.acquire(session_id);
        std::lock_guard<std::mutex> guard(*mutex);

        OnboardingSession current = inner_->load_live(session_id, events);
        if (current.status == SessionStatus::Completed) {
            result = CompletionResult{current.id, current.hotel_id, current.quality_score, false};
        } else {
            inner_->require_active(current);

            std::vector<StepId> missing;
            for (StepId step : ALL_STEPS) {
                if (inner_->config.required_steps().count(step) > 0 &&
                    !current.is_step_completed(step)) {
                    missing.push_back(step);
                }
            }
            if (!missing.empty()) {
                spdlog::warn("completion refused for session {}: {} required step(s) missing",
                             session_id, missing.size());
                throw OnboardError::missing_steps(std::move(missing));
            }

            bool transitioned = false;
            OnboardingSession stored = inner_->commit(session_id, [&](OnboardingSession& s) {
                if (s.status == SessionStatus::Completed) {
                    return false;
                }
                inner_->require_active(s);
                s.status = SessionStatus::Completed;
                s.quality_score = inner_->scorer.score(s.draft).overall;
                s.updated_at = inner_->config.now();
                transitioned = true;
                return true;
            });

            result = CompletionResult{stored.id, stored.hotel_id, stored.quality_score,
                                      transitioned};
            if (transitioned) {
                spdlog::info("onboarding session {} completed for hotel {} with score {}",
                             stored.id, stored.hotel_id, stored.quality_score);
                events.audits.push_back(inner_->audit(AuditAction::SessionCompleted, stored));
                events.completion = CompletionNotice{stored.id, stored.hotel_id, stored.owner_id,
                                                     stored.quality_score, stored.updated_at};
            }
        }
    } catch (const OnboardError&) {
        inner_->dispatch(events);
        throw;
    }
    inner_->dispatch(events);
    return result;
}

void OnboardingEngine::abandon(const std::string& session_id) {
    PendingEvents events;
    try {
        auto mutex = inner_->session_locks.acquire(session_id);
        std::lock_guard<std::mutex> guard(*mutex);

        OnboardingSession current = inner_->load_live(session_id, events);
        inner_->require_active(current);

        OnboardingSession stored = inner_->commit(session_id, [&](OnboardingSession& s) {
            inner_->require_active(s);
            s.status = SessionStatus::Abandoned;
            s.updated_at = inner_->config.now();
            return true;
        });
        spdlog::info("onboarding session {} abandoned", session_id);
        events.audits.push_back(inner_->audit(AuditAction::SessionAbandoned, stored));
    } catch (const OnboardError&) {
        inner_->dispatch(events);
        throw;
    }
    inner_->dispatch(events);
}

size_t OnboardingEngine::sweep_expired() {
    size_t swept = 0;
    for (const auto& session_id : inner_->store->list_ids()) {
        PendingEvents events;
        {
            auto mutex = inner_->session_locks.acquire(session_id);
            std::lock_guard<std::mutex> guard(*mutex);
            try {
                inner_->load_live(session_id, events);
            } catch (const OnboardError& e) {
                // Removed from the store or lost a write race; skip it.
                spdlog::warn("sweep skipped session {}: {}", session_id, e.what());
                inner_->report_error(e);
            }
        }
        swept += events.audits.size();
        inner_->dispatch(events);
    }
    if (swept > 0) {
        spdlog::info("expiry sweep abandoned {} session(s)", swept);
    }
    return swept;
}

// --- Images ---

std::vector<ImageRecord> OnboardingEngine::analyze_uploads(
    const std::vector<ImageUpload>& uploads) const {
    if (!inner_->decoder) {
        throw OnboardError::configuration("no image decoder configured");
    }

    // Decode up front; failures get the degraded result and skip analysis.
    std::vector<DecodedImage> decoded;
    std::vector<size_t> decoded_index(uploads.size(), SIZE_MAX);
    for (size_t i = 0; i < uploads.size(); i++) {
        try {
            decoded.push_back(inner_->decoder->decode(uploads[i].bytes));
            decoded_index[i] = decoded.size() - 1;
        } catch (const std::exception& e) {
            spdlog::warn("upload {} could not be decoded: {}", uploads[i].id, e.what());
        }
    }

    std::vector<QualityCheckResult> analyzed =
        inner_->analyzer.analyze_batch(decoded, inner_->config.analysis_threads());

    std::vector<ImageRecord> records;
    records.reserve(uploads.size());
    size_t high_quality = 0;
    for (size_t i = 0; i < uploads.size(); i++) {
        ImageRecord record;
        record.id = uploads[i].id;
        record.category = uploads[i].category;
        record.url = uploads[i].url;

        QualityCheckResult check;
        if (decoded_index[i] == SIZE_MAX) {
            check = failed_analysis_result();
        } else {
            const DecodedImage& image = decoded[decoded_index[i]];
            record.dimensions.width = image.width.value_or(0);
            record.dimensions.height = image.height.value_or(0);
            check = std::move(analyzed[decoded_index[i]]);
        }
        record.quality_score = check.score;
        record.issues = std::move(check.issues);
        if (inner_->analyzer.is_high_quality(record.quality_score)) {
            high_quality++;
        }
        records.push_back(std::move(record));
    }
    spdlog::debug("analyzed {} uploads, {} high quality", records.size(), high_quality);
    return records;
}

} // namespace onboard
