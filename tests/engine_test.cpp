// tests/engine_test.cpp
// Session lifecycle, concurrency, expiry and callbacks of OnboardingEngine.

#include "onboard/engine.hpp"
#include "test_fixtures.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace onboard {
namespace {

using namespace testing_fixtures;

// Clock that only moves when a test advances it.
class ManualClock {
public:
    EngineConfig::ClockFn fn() const {
        auto offset = offset_;
        return [offset] {
            return TimePoint(std::chrono::seconds(1700000000)) +
                   std::chrono::seconds(offset->load());
        };
    }

    void advance(std::chrono::seconds by) { offset_->fetch_add(by.count()); }

private:
    std::shared_ptr<std::atomic<int64_t>> offset_ = std::make_shared<std::atomic<int64_t>>(0);
};

std::shared_ptr<const AmenityCatalog> default_catalog() {
    return std::make_shared<AmenityCatalog>(AmenityCatalog::defaults());
}

std::unique_ptr<OnboardingEngine> make_test_engine(EngineConfig config = EngineConfig::defaults(),
                                                   std::shared_ptr<SessionStore> store = nullptr) {
    return OnboardingEngine::create(std::move(config), default_catalog(), std::move(store));
}

void submit_full_draft(OnboardingEngine& engine, const std::string& session_id) {
    engine.update_step(session_id, StepId::Amenities, hotel_amenities());
    engine.update_step(session_id, StepId::Images, full_images());
    engine.update_step(session_id, StepId::PropertyInfo, full_property_info());
    engine.update_step(session_id, StepId::Rooms, two_rooms());
}

template <typename Fn>
ErrorKind error_kind_of(Fn&& fn) {
    try {
        fn();
    } catch (const OnboardError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected OnboardError";
    return ErrorKind::Configuration;
}

// Fails the first `failures` writes as if another writer won the race.
class FlakyStore : public SessionStore {
public:
    explicit FlakyStore(int failures) : failures_(failures) {}

    std::optional<OnboardingSession> load(const std::string& id) const override {
        return inner_.load(id);
    }
    void save(const OnboardingSession& session) override { inner_.save(session); }
    bool compare_and_swap(const OnboardingSession& session, uint64_t expected) override {
        if (failures_.fetch_sub(1) > 0) {
            return false;
        }
        return inner_.compare_and_swap(session, expected);
    }
    std::vector<std::string> list_ids() const override { return inner_.list_ids(); }

private:
    std::atomic<int> failures_;
    InMemorySessionStore inner_;
};

class FixedDecoder : public ImageDecoder {
public:
    // Empty input is treated as unreadable.
    DecodedImage decode(const std::vector<uint8_t>& bytes) const override {
        if (bytes.empty()) {
            throw std::runtime_error("empty upload");
        }
        return sharp_image();
    }
};

// ==================== Construction ====================

TEST(EngineTest, CreateRequiresCatalog) {
    EXPECT_EQ(error_kind_of([] { OnboardingEngine::create(EngineConfig::defaults(), nullptr); }),
              ErrorKind::Configuration);
}

TEST(EngineTest, MoveConstruct) {
    auto engine = make_test_engine();
    OnboardingEngine moved(std::move(*engine));
    auto summary = moved.create_session("hotel-1", "owner-1");
    EXPECT_FALSE(summary.session_id.empty());
}

// ==================== Lifecycle ====================

TEST(EngineTest, CreateSession) {
    ManualClock clock;
    auto engine = make_test_engine(EngineConfig::builder().clock(clock.fn()).build());
    auto summary = engine->create_session("hotel-1", "owner-1");

    EXPECT_EQ(summary.session_id.size(), 36u);
    EXPECT_EQ(summary.session_id[14], '4');
    EXPECT_EQ(summary.status, SessionStatus::Active);
    EXPECT_EQ(summary.expires_at, clock.fn()() + std::chrono::hours(24 * 7));

    auto status = engine->get_status(summary.session_id);
    EXPECT_TRUE(status.session.draft.empty());
    EXPECT_EQ(status.session.hotel_id, "hotel-1");
    EXPECT_DOUBLE_EQ(status.quality_score, 0.0);
}

TEST(EngineTest, SessionIdsAreUnique) {
    auto engine = make_test_engine();
    auto a = engine->create_session("hotel-1", "owner-1");
    auto b = engine->create_session("hotel-1", "owner-1");
    EXPECT_NE(a.session_id, b.session_id);
}

TEST(EngineTest, CreateSessionRequiresIds) {
    auto engine = make_test_engine();
    try {
        engine->create_session("", "");
        FAIL() << "expected OnboardError";
    } catch (const OnboardError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Validation);
        EXPECT_EQ(e.errors(),
                  (std::vector<std::string>{"hotelId is required", "ownerId is required"}));
    }
}

TEST(EngineTest, UnknownSession) {
    auto engine = make_test_engine();
    EXPECT_EQ(error_kind_of([&] { engine->get_status("nope"); }), ErrorKind::NotFound);
    EXPECT_EQ(error_kind_of([&] {
        engine->update_step("nope", StepId::Amenities, amenities({"wifi"}));
    }), ErrorKind::NotFound);
    EXPECT_EQ(error_kind_of([&] { engine->complete("nope"); }), ErrorKind::NotFound);
    EXPECT_EQ(error_kind_of([&] { engine->abandon("nope"); }), ErrorKind::NotFound);
}

// ==================== Step updates ====================

TEST(EngineTest, UpdateStepReturnsScoreAndWarnings) {
    auto engine = make_test_engine();
    auto id = engine->create_session("hotel-1", "owner-1").session_id;

    auto result = engine->update_step(id, StepId::Amenities, amenities({"wifi", "meeting-rooms"}));
    EXPECT_DOUBLE_EQ(result.quality_score, result.breakdown.overall);
    EXPECT_DOUBLE_EQ(result.breakdown.content_completeness.factors.amenity_completeness, 25.0);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0],
              "\"Meeting Rooms\" typically includes \"Business Center\". Consider adding it.");

    auto status = engine->get_status(id);
    EXPECT_TRUE(status.session.is_step_completed(StepId::Amenities));
    EXPECT_DOUBLE_EQ(status.completion_percentage, 20.0);
}

TEST(EngineTest, RejectedUpdateLeavesSessionUntouched) {
    auto engine = make_test_engine();
    auto id = engine->create_session("hotel-1", "owner-1").session_id;

    try {
        engine->update_step(id, StepId::Amenities, amenities({"wifi", "ev-charging"}));
        FAIL() << "expected OnboardError";
    } catch (const OnboardError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Validation);
        ASSERT_EQ(e.errors().size(), 1u);
        EXPECT_EQ(e.errors()[0], "\"EV Charging\" requires \"Parking\" to be selected");
    }

    auto status = engine->get_status(id);
    EXPECT_TRUE(status.session.draft.empty());
    EXPECT_TRUE(status.session.completed_steps.empty());
    EXPECT_EQ(status.session.version, 0u);
}

TEST(EngineTest, EmptyRoomsRejectedAndNotCompleted) {
    auto engine = make_test_engine();
    auto id = engine->create_session("hotel-1", "owner-1").session_id;
    try {
        engine->update_step(id, StepId::Rooms, RoomsPayload{});
        FAIL() << "expected OnboardError";
    } catch (const OnboardError& e) {
        EXPECT_EQ(e.errors(), std::vector<std::string>{"At least one room type is required"});
    }
    EXPECT_FALSE(engine->get_status(id).session.is_step_completed(StepId::Rooms));
}

TEST(EngineTest, ShortDescriptionIsWarningOnly) {
    auto engine = make_test_engine();
    auto id = engine->create_session("hotel-1", "owner-1").session_id;
    PropertyInfoPayload info = full_property_info();
    info.description = "Cosy rooms";
    auto result = engine->update_step(id, StepId::PropertyInfo, info);
    EXPECT_EQ(result.warnings,
              std::vector<std::string>{"Property description should be at least 50 characters"});
    EXPECT_TRUE(engine->get_status(id).session.is_step_completed(StepId::PropertyInfo));
}

TEST(EngineTest, MismatchedPayloadRejected) {
    auto engine = make_test_engine();
    auto id = engine->create_session("hotel-1", "owner-1").session_id;
    EXPECT_EQ(error_kind_of([&] { engine->update_step(id, StepId::Rooms, full_images()); }),
              ErrorKind::Validation);
}

TEST(EngineTest, UpdateIsIdempotent) {
    auto engine = make_test_engine();
    auto id = engine->create_session("hotel-1", "owner-1").session_id;

    auto first = engine->update_step(id, StepId::Rooms, two_rooms());
    auto second = engine->update_step(id, StepId::Rooms, two_rooms());
    EXPECT_DOUBLE_EQ(first.quality_score, second.quality_score);

    auto status = engine->get_status(id);
    const auto* rooms = find_step<RoomsPayload>(status.session.draft, StepId::Rooms);
    ASSERT_NE(rooms, nullptr);
    EXPECT_EQ(rooms->rooms.size(), 2u);
    EXPECT_EQ(status.session.completed_steps.size(), 1u);
}

TEST(EngineTest, DuplicateEntriesCollapse) {
    auto engine = make_test_engine();
    auto id = engine->create_session("hotel-1", "owner-1").session_id;

    ImagesPayload images = full_images();
    images.images.push_back(images.images.front());
    engine->update_step(id, StepId::Images, images);

    auto status = engine->get_status(id);
    EXPECT_EQ(find_step<ImagesPayload>(status.session.draft, StepId::Images)->images.size(), 6u);
}

TEST(EngineTest, ResubmissionReplacesStep) {
    auto engine = make_test_engine();
    auto id = engine->create_session("hotel-1", "owner-1").session_id;
    engine->update_step(id, StepId::Amenities, amenities({"wifi", "parking"}));
    engine->update_step(id, StepId::Amenities, amenities({"restaurant"}));

    auto status = engine->get_status(id);
    const auto* selection = find_step<AmenitiesPayload>(status.session.draft, StepId::Amenities);
    EXPECT_EQ(selection->selected, (std::set<std::string>{"restaurant"}));
}

TEST(EngineTest, FullDraftStatus) {
    auto engine = make_test_engine();
    auto id = engine->create_session("hotel-1", "owner-1").session_id;
    submit_full_draft(*engine, id);

    auto status = engine->get_status(id);
    EXPECT_DOUBLE_EQ(status.quality_score, 98.0);
    EXPECT_DOUBLE_EQ(status.session.quality_score, 98.0);
    EXPECT_DOUBLE_EQ(status.completion_percentage, 80.0);
    EXPECT_TRUE(status.recommendations.empty());
    ASSERT_EQ(status.missing_info.size(), 1u);
    EXPECT_EQ(status.missing_info[0].category, "Business Features");
}

TEST(EngineTest, ValidateStepIsPure) {
    auto engine = make_test_engine();
    auto id = engine->create_session("hotel-1", "owner-1").session_id;
    auto result = engine->validate_step(StepId::Rooms, RoomsPayload{});
    EXPECT_FALSE(result.is_valid);
    EXPECT_EQ(engine->get_status(id).session.version, 0u);
}

// ==================== Concurrency ====================

TEST(EngineTest, ConcurrentIdenticalUpdates) {
    auto engine = make_test_engine();
    auto id = engine->create_session("hotel-1", "owner-1").session_id;

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 5; i++) {
        threads.emplace_back([&] {
            try {
                engine->update_step(id, StepId::Amenities, amenities({"wifi"}));
            } catch (const OnboardError&) {
                failures++;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(failures.load(), 0);
    auto status = engine->get_status(id);
    EXPECT_EQ(status.session.version, 5u);
    EXPECT_EQ(find_step<AmenitiesPayload>(status.session.draft, StepId::Amenities)->selected,
              (std::set<std::string>{"wifi"}));
}

TEST(EngineTest, ConcurrentDifferentSteps) {
    auto engine = make_test_engine();
    auto id = engine->create_session("hotel-1", "owner-1").session_id;

    std::vector<std::thread> threads;
    threads.emplace_back([&] { engine->update_step(id, StepId::Amenities, hotel_amenities()); });
    threads.emplace_back([&] { engine->update_step(id, StepId::Images, full_images()); });
    threads.emplace_back([&] {
        engine->update_step(id, StepId::PropertyInfo, full_property_info());
    });
    threads.emplace_back([&] { engine->update_step(id, StepId::Rooms, two_rooms()); });
    for (auto& t : threads) t.join();

    auto status = engine->get_status(id);
    EXPECT_EQ(status.session.completed_steps.size(), 4u);
    EXPECT_EQ(status.session.draft.size(), 4u);
    EXPECT_DOUBLE_EQ(status.session.quality_score, 98.0);
}

TEST(EngineTest, ConcurrentSessionsIndependent) {
    auto engine = make_test_engine();
    std::vector<std::string> ids;
    for (int i = 0; i < 4; i++) {
        ids.push_back(engine->create_session("hotel-" + std::to_string(i), "owner").session_id);
    }

    std::vector<std::thread> threads;
    for (const auto& id : ids) {
        threads.emplace_back([&engine, id] { submit_full_draft(*engine, id); });
    }
    for (auto& t : threads) t.join();

    for (const auto& id : ids) {
        EXPECT_EQ(engine->get_status(id).session.version, 4u);
    }
}

// ==================== Completion ====================

TEST(EngineTest, CompleteReportsMissingSteps) {
    auto engine = make_test_engine();
    auto id = engine->create_session("hotel-1", "owner-1").session_id;
    engine->update_step(id, StepId::Amenities, hotel_amenities());

    try {
        engine->complete(id);
        FAIL() << "expected OnboardError";
    } catch (const OnboardError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Validation);
        std::vector<StepId> expected{StepId::Images, StepId::PropertyInfo, StepId::Rooms};
        EXPECT_EQ(e.missing_steps(), expected);
    }
    EXPECT_EQ(engine->get_status(id).session.status, SessionStatus::Active);
}

TEST(EngineTest, BusinessFeaturesOptionalByDefault) {
    auto engine = make_test_engine();
    auto id = engine->create_session("hotel-1", "owner-1").session_id;
    submit_full_draft(*engine, id);
    EXPECT_TRUE(engine->complete(id).newly_completed);
}

TEST(EngineTest, StrictRequiresBusinessFeatures) {
    auto engine = make_test_engine(EngineConfig::strict());
    auto id = engine->create_session("hotel-1", "owner-1").session_id;
    submit_full_draft(*engine, id);
    try {
        engine->complete(id);
        FAIL() << "expected OnboardError";
    } catch (const OnboardError& e) {
        EXPECT_EQ(e.missing_steps(), std::vector<StepId>{StepId::BusinessFeatures});
    }
}

TEST(EngineTest, CompleteOnce) {
    std::atomic<int> notices{0};
    auto engine = make_test_engine(EngineConfig::builder()
        .on_completed([&notices](const CompletionNotice& notice) {
            EXPECT_EQ(notice.hotel_id, "hotel-1");
            EXPECT_DOUBLE_EQ(notice.quality_score, 98.0);
            notices++;
        })
        .build());
    auto id = engine->create_session("hotel-1", "owner-1").session_id;
    submit_full_draft(*engine, id);

    auto first = engine->complete(id);
    EXPECT_TRUE(first.newly_completed);
    EXPECT_EQ(first.session_id, id);
    EXPECT_EQ(first.hotel_id, "hotel-1");
    EXPECT_DOUBLE_EQ(first.quality_score, 98.0);

    auto second = engine->complete(id);
    EXPECT_FALSE(second.newly_completed);
    EXPECT_DOUBLE_EQ(second.quality_score, 98.0);

    EXPECT_EQ(notices.load(), 1);
    EXPECT_EQ(engine->get_status(id).session.status, SessionStatus::Completed);
}

TEST(EngineTest, ConcurrentCompleteNotifiesOnce) {
    std::atomic<int> notices{0};
    auto engine = make_test_engine(EngineConfig::builder()
        .on_completed([&notices](const CompletionNotice&) { notices++; })
        .build());
    auto id = engine->create_session("hotel-1", "owner-1").session_id;
    submit_full_draft(*engine, id);

    std::atomic<int> newly{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&] {
            if (engine->complete(id).newly_completed) newly++;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(newly.load(), 1);
    EXPECT_EQ(notices.load(), 1);
}

TEST(EngineTest, CompletedSessionRejectsUpdates) {
    auto engine = make_test_engine();
    auto id = engine->create_session("hotel-1", "owner-1").session_id;
    submit_full_draft(*engine, id);
    engine->complete(id);

    EXPECT_EQ(error_kind_of([&] {
        engine->update_step(id, StepId::Amenities, amenities({"wifi"}));
    }), ErrorKind::InvalidState);
    EXPECT_EQ(error_kind_of([&] { engine->abandon(id); }), ErrorKind::InvalidState);
}

TEST(EngineTest, CallbacksMayReenterEngine) {
    OnboardingEngine* self = nullptr;
    SessionStatus seen = SessionStatus::Active;
    auto engine = make_test_engine(EngineConfig::builder()
        .on_completed([&](const CompletionNotice& notice) {
            seen = self->get_status(notice.session_id).session.status;
        })
        .build());
    self = engine.get();

    auto id = engine->create_session("hotel-1", "owner-1").session_id;
    submit_full_draft(*engine, id);
    engine->complete(id);
    EXPECT_EQ(seen, SessionStatus::Completed);
}

// ==================== Expiry and abandonment ====================

TEST(EngineTest, ExpiredSessionRejectsMutation) {
    ManualClock clock;
    std::vector<AuditAction> actions;
    std::mutex actions_mutex;
    auto engine = make_test_engine(EngineConfig::builder()
        .session_ttl(std::chrono::hours(1))
        .clock(clock.fn())
        .on_audit([&](const AuditEvent& event) {
            std::lock_guard<std::mutex> lock(actions_mutex);
            actions.push_back(event.action);
        })
        .build());
    auto id = engine->create_session("hotel-1", "owner-1").session_id;

    clock.advance(std::chrono::hours(2));
    EXPECT_EQ(error_kind_of([&] {
        engine->update_step(id, StepId::Amenities, amenities({"wifi"}));
    }), ErrorKind::Expired);
    EXPECT_EQ(error_kind_of([&] { engine->complete(id); }), ErrorKind::Expired);

    EXPECT_EQ(engine->get_status(id).session.status, SessionStatus::Abandoned);
    std::vector<AuditAction> expected{AuditAction::SessionCreated, AuditAction::SessionExpired};
    EXPECT_EQ(actions, expected);
}

TEST(EngineTest, SessionUsableUntilExpiry) {
    ManualClock clock;
    auto engine = make_test_engine(EngineConfig::builder()
        .session_ttl(std::chrono::hours(1))
        .clock(clock.fn())
        .build());
    auto id = engine->create_session("hotel-1", "owner-1").session_id;

    clock.advance(std::chrono::hours(1));
    EXPECT_NO_THROW(engine->update_step(id, StepId::Amenities, amenities({"wifi"})));
}

TEST(EngineTest, SweepExpired) {
    ManualClock clock;
    auto engine = make_test_engine(EngineConfig::builder()
        .session_ttl(std::chrono::hours(1))
        .clock(clock.fn())
        .build());
    for (int i = 0; i < 3; i++) {
        engine->create_session("hotel-" + std::to_string(i), "owner");
    }
    auto done = engine->create_session("hotel-done", "owner").session_id;
    submit_full_draft(*engine, done);
    engine->complete(done);

    EXPECT_EQ(engine->sweep_expired(), 0u);
    clock.advance(std::chrono::hours(3));
    EXPECT_EQ(engine->sweep_expired(), 3u);
    EXPECT_EQ(engine->sweep_expired(), 0u);
    EXPECT_EQ(engine->get_status(done).session.status, SessionStatus::Completed);
}

TEST(EngineTest, Abandon) {
    auto engine = make_test_engine();
    auto id = engine->create_session("hotel-1", "owner-1").session_id;
    engine->abandon(id);

    EXPECT_EQ(engine->get_status(id).session.status, SessionStatus::Abandoned);
    EXPECT_EQ(error_kind_of([&] {
        engine->update_step(id, StepId::Amenities, amenities({"wifi"}));
    }), ErrorKind::InvalidState);
    EXPECT_EQ(error_kind_of([&] { engine->abandon(id); }), ErrorKind::InvalidState);
    EXPECT_EQ(error_kind_of([&] { engine->complete(id); }), ErrorKind::InvalidState);
}

TEST(EngineTest, AbandonedSessionStaysInvalidAfterTtl) {
    ManualClock clock;
    auto engine = make_test_engine(EngineConfig::builder()
        .session_ttl(std::chrono::hours(1))
        .clock(clock.fn())
        .build());
    auto id = engine->create_session("hotel-1", "owner-1").session_id;
    engine->abandon(id);

    clock.advance(std::chrono::hours(2));
    EXPECT_EQ(error_kind_of([&] {
        engine->update_step(id, StepId::Amenities, amenities({"wifi"}));
    }), ErrorKind::InvalidState);
    EXPECT_EQ(error_kind_of([&] { engine->complete(id); }), ErrorKind::InvalidState);
    EXPECT_FALSE(engine->get_status(id).session.abandoned_by_expiry);
}

TEST(EngineTest, SweptSessionReportsExpired) {
    ManualClock clock;
    auto engine = make_test_engine(EngineConfig::builder()
        .session_ttl(std::chrono::hours(1))
        .clock(clock.fn())
        .build());
    auto id = engine->create_session("hotel-1", "owner-1").session_id;

    clock.advance(std::chrono::hours(2));
    EXPECT_EQ(engine->sweep_expired(), 1u);
    EXPECT_TRUE(engine->get_status(id).session.abandoned_by_expiry);
    EXPECT_EQ(error_kind_of([&] {
        engine->update_step(id, StepId::Amenities, amenities({"wifi"}));
    }), ErrorKind::Expired);
    EXPECT_EQ(error_kind_of([&] { engine->abandon(id); }), ErrorKind::Expired);
}

// ==================== Callbacks ====================

TEST(EngineTest, FailingAuditCallbackIsReported) {
    std::vector<ErrorKind> reported;
    auto engine = make_test_engine(EngineConfig::builder()
        .on_audit([](const AuditEvent&) { throw std::runtime_error("sink down"); })
        .on_error([&reported](const OnboardError& e) { reported.push_back(e.kind()); })
        .build());

    auto summary = engine->create_session("hotel-1", "owner-1");
    EXPECT_FALSE(summary.session_id.empty());
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0], ErrorKind::Callback);

    // The write itself still landed.
    engine->update_step(summary.session_id, StepId::Amenities, amenities({"wifi"}));
    EXPECT_EQ(engine->get_status(summary.session_id).session.version, 1u);
}

TEST(EngineTest, AuditTrailForStepUpdate) {
    std::vector<AuditEvent> events;
    auto engine = make_test_engine(EngineConfig::builder()
        .on_audit([&events](const AuditEvent& e) { events.push_back(e); })
        .build());
    auto id = engine->create_session("hotel-1", "owner-1").session_id;
    engine->update_step(id, StepId::Rooms, two_rooms());

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].action, AuditAction::StepUpdated);
    ASSERT_TRUE(events[1].step.has_value());
    EXPECT_EQ(*events[1].step, StepId::Rooms);
    EXPECT_EQ(events[1].owner_id, "owner-1");
}

// ==================== Storage ====================

TEST(EngineTest, RetriesLostWrites) {
    auto store = std::make_shared<FlakyStore>(2);
    auto engine = make_test_engine(EngineConfig::defaults(), store);
    auto id = engine->create_session("hotel-1", "owner-1").session_id;

    engine->update_step(id, StepId::Amenities, amenities({"wifi"}));
    EXPECT_EQ(engine->get_status(id).session.version, 1u);
}

TEST(EngineTest, GivesUpAfterMaxRetries) {
    auto store = std::make_shared<FlakyStore>(100);
    auto engine = make_test_engine(EngineConfig::builder().max_cas_retries(2).build(), store);
    auto id = engine->create_session("hotel-1", "owner-1").session_id;

    EXPECT_EQ(error_kind_of([&] {
        engine->update_step(id, StepId::Amenities, amenities({"wifi"}));
    }), ErrorKind::Storage);
    EXPECT_TRUE(engine->get_status(id).session.draft.empty());
}

// ==================== Image uploads ====================

TEST(EngineTest, AnalyzeUploads) {
    auto engine = OnboardingEngine::create(EngineConfig::defaults(), default_catalog(), nullptr,
                                           std::make_shared<FixedDecoder>());
    std::vector<ImageUpload> uploads = {
        {"img-1", ImageCategory::Exterior, "https://cdn.example.com/1.jpg", {0xFF, 0xD8}},
        {"img-2", ImageCategory::Lobby, "https://cdn.example.com/2.jpg", {}},
        {"img-3", ImageCategory::Rooms, "https://cdn.example.com/3.jpg", {0xFF, 0xD8}},
    };

    auto records = engine->analyze_uploads(uploads);
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].id, "img-1");
    EXPECT_DOUBLE_EQ(records[0].quality_score, 100.0);
    EXPECT_EQ(records[0].dimensions.width, 1920u);
    EXPECT_EQ(records[0].dimensions.height, 1080u);

    EXPECT_EQ(records[1].category, ImageCategory::Lobby);
    EXPECT_DOUBLE_EQ(records[1].quality_score, 0.0);
    ASSERT_EQ(records[1].issues.size(), 1u);
    EXPECT_EQ(records[1].issues[0].severity, Severity::High);

    EXPECT_DOUBLE_EQ(records[2].quality_score, 100.0);
}

TEST(EngineTest, AnalyzeUploadsRequiresDecoder) {
    auto engine = make_test_engine();
    EXPECT_EQ(error_kind_of([&] { engine->analyze_uploads({}); }), ErrorKind::Configuration);
}

} // namespace
} // namespace onboard
