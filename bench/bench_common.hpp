// bench/bench_common.hpp
// Shared benchmark scenarios and synthetic inputs.

#pragma once

#include "onboard/image.hpp"
#include "onboard/payload.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace onboard_bench {

struct ImageScenario {
    const char* name;
    uint32_t width;
    uint32_t height;

    size_t pixels() const { return static_cast<size_t>(width) * height; }
};

constexpr ImageScenario IMAGE_SCENARIOS[] = {
    {"thumbnail", 320, 180},
    {"hd", 1280, 720},
    {"full_hd", 1920, 1080},
    {"uhd", 3840, 2160},
};

constexpr size_t IMAGE_SCENARIO_COUNT = sizeof(IMAGE_SCENARIOS) / sizeof(IMAGE_SCENARIOS[0]);

// Deterministic noise-like luma so the Laplacian has real work to do.
inline onboard::DecodedImage generate_image(uint32_t width, uint32_t height) {
    onboard::DecodedImage image;
    image.width = width;
    image.height = height;
    image.channel_means = {120.0, 118.0, 115.0};
    image.channel_stdevs = {48.0, 45.0, 50.0};
    image.grayscale.resize(static_cast<size_t>(width) * height);
    uint32_t state = 2463534242u;
    for (auto& px : image.grayscale) {
        state ^= state << 13;
        state ^= state >> 17;
        state ^= state << 5;
        px = static_cast<uint8_t>(state & 0xFF);
    }
    return image;
}

// A draft with every step filled, scaled by the number of images and rooms.
inline onboard::Draft generate_draft(size_t images, size_t rooms) {
    using namespace onboard;
    static const ImageCategory CATEGORIES[] = {
        ImageCategory::Exterior, ImageCategory::Lobby, ImageCategory::Rooms, ImageCategory::Dining,
    };

    Draft draft;
    draft[StepId::Amenities] =
        AmenitiesPayload{{"wifi", "parking", "restaurant", "air-conditioning"}, PropertyType::Hotel};

    ImagesPayload image_payload;
    for (size_t i = 0; i < images; i++) {
        ImageRecord record;
        record.id = "img-" + std::to_string(i);
        record.category = CATEGORIES[i % 4];
        record.quality_score = static_cast<double>(60 + (i * 7) % 40);
        record.dimensions = Dimensions{1920, 1080};
        image_payload.images.push_back(std::move(record));
    }
    draft[StepId::Images] = std::move(image_payload);

    PropertyInfoPayload info;
    std::string description = "A unique stay with nearby sights and modern facilities.";
    for (int i = 0; i < 80; i++) description += " comfortable";
    info.description = description;
    Policies policies;
    policies.check_in = CheckInPolicy{"15:00", "Reception", {}};
    policies.cancellation = CancellationPolicy{"moderate", 48, 50.0, "Half refund"};
    info.policies = policies;
    draft[StepId::PropertyInfo] = std::move(info);

    RoomsPayload room_payload;
    for (size_t i = 0; i < rooms; i++) {
        RoomRecord room;
        room.id = "room-" + std::to_string(i);
        room.name = "Room " + std::to_string(i);
        room.price = 100.0 + static_cast<double>(i);
        room.max_occupancy = 2;
        room.image_ids = {"img-0"};
        room_payload.rooms.push_back(std::move(room));
    }
    draft[StepId::Rooms] = std::move(room_payload);
    return draft;
}

} // namespace onboard_bench
