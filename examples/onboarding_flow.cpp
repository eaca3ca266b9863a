// examples/onboarding_flow.cpp
// Walk one hotel through the wizard: create, fill every step, inspect the
// score and recommendations, then complete.
//
//   cmake -B build -DONBOARD_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/onboard_flow

#include "onboard/onboard.hpp"
#include <iostream>

using namespace onboard;

static void print_status(const StatusReport& status) {
    std::cout << "  score " << status.quality_score
              << " (images " << status.breakdown.image_quality.score
              << ", content " << status.breakdown.content_completeness.score
              << ", policies " << status.breakdown.policy_clarity.score << "), "
              << status.completion_percentage << "% of steps done" << std::endl;
    for (const auto& rec : status.recommendations) {
        std::cout << "    [" << to_string(rec.priority) << "] " << rec.title
                  << " (+" << rec.estimated_impact << "): " << rec.action_required << std::endl;
    }
    for (const auto& missing : status.missing_info) {
        std::cout << "    missing " << missing.category << ":";
        for (const auto& item : missing.items) std::cout << " " << item << ";";
        std::cout << std::endl;
    }
}

int main() {
    try {
        auto engine = OnboardingEngine::create(
            EngineConfig::builder()
                .on_completed([](const CompletionNotice& notice) {
                    std::cout << "  -> hotel " << notice.hotel_id << " published with score "
                              << notice.quality_score << std::endl;
                })
                .on_error([](const OnboardError& e) {
                    std::cerr << "  !! " << e.what() << std::endl;
                })
                .build(),
            std::make_shared<AmenityCatalog>(AmenityCatalog::defaults()));

        auto id = engine->create_session("hotel-42", "owner-7").session_id;
        std::cout << "Session " << id << std::endl;

        // Amenities: the warning about meeting rooms does not block the step.
        auto result = engine->update_step(id, StepId::Amenities,
            AmenitiesPayload{{"wifi", "parking", "meeting-rooms", "restaurant"},
                             PropertyType::BusinessHotel});
        for (const auto& warning : result.warnings) {
            std::cout << "  warning: " << warning << std::endl;
        }

        // A rejected step leaves the session as it was.
        try {
            engine->update_step(id, StepId::Rooms, RoomsPayload{});
        } catch (const OnboardError& e) {
            std::cout << "  rejected: " << e.what() << std::endl;
        }

        ImagesPayload images;
        const ImageCategory categories[] = {ImageCategory::Exterior, ImageCategory::Lobby,
                                            ImageCategory::Rooms, ImageCategory::Business};
        int n = 0;
        for (ImageCategory category : categories) {
            ImageRecord record;
            record.id = "img-" + std::to_string(++n);
            record.category = category;
            record.url = "https://cdn.example.com/hotel-42/" + record.id + ".jpg";
            record.quality_score = 88.0;
            record.dimensions = Dimensions{2400, 1600};
            images.images.push_back(record);
        }
        engine->update_step(id, StepId::Images, images);

        PropertyInfoPayload info;
        info.description =
            "A business hotel in the financial district with special rates for long stays, "
            "nearby metro access and modern meeting facilities for teams of every size.";
        Policies policies;
        policies.check_in = CheckInPolicy{"14:00", "Self check-in kiosk in the lobby", {"Photo ID"}};
        policies.check_out = CheckOutPolicy{"12:00", "Leave keycards at the kiosk", true};
        policies.cancellation = CancellationPolicy{"moderate", 48, 50.0, "Half refund within 48h"};
        info.policies = policies;
        engine->update_step(id, StepId::PropertyInfo, info);

        RoomRecord room;
        room.id = "standard";
        room.name = "Standard King";
        room.price = 145.0;
        room.max_occupancy = 2;
        room.image_ids = {"img-3"};
        engine->update_step(id, StepId::Rooms, RoomsPayload{{room}});

        print_status(engine->get_status(id));

        auto completion = engine->complete(id);
        std::cout << "Completed: " << std::boolalpha << completion.newly_completed << std::endl;
    } catch (const OnboardError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
