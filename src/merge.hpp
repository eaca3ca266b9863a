// src/merge.hpp
// Identity-keyed normalization of step payloads before they replace the
// stored step. Resubmitting the same payload yields the same stored value.

#pragma once

#include "onboard/payload.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace onboard {
namespace merge {

// Keep the first entry per identity key, preserving submission order.
template <typename T, typename KeyFn>
std::vector<T> dedupe_by_key(const std::vector<T>& items, KeyFn key_of) {
    std::vector<T> out;
    out.reserve(items.size());
    std::unordered_set<std::string> seen;
    for (const auto& item : items) {
        if (seen.insert(key_of(item)).second) {
            out.push_back(item);
        }
    }
    return out;
}

// Images are keyed by id; rooms by id, or by name when no id was assigned,
// and a room's image ids and amenities are kept once each.
// Amenity selections are already sets. Scalar steps pass through unchanged.
inline StepPayload normalize(const StepPayload& payload) {
    if (const auto* images = std::get_if<ImagesPayload>(&payload)) {
        ImagesPayload out;
        out.images = dedupe_by_key(images->images,
                                   [](const ImageRecord& image) { return image.id; });
        return out;
    }
    if (const auto* rooms = std::get_if<RoomsPayload>(&payload)) {
        RoomsPayload out;
        out.rooms = dedupe_by_key(rooms->rooms, [](const RoomRecord& room) {
            return room.id.empty() ? "name:" + room.name : "id:" + room.id;
        });
        auto self = [](const std::string& value) { return value; };
        for (auto& room : out.rooms) {
            room.image_ids = dedupe_by_key(room.image_ids, self);
            room.amenities = dedupe_by_key(room.amenities, self);
        }
        return out;
    }
    if (const auto* business = std::get_if<BusinessFeaturesPayload>(&payload)) {
        BusinessFeaturesPayload out = *business;
        out.meeting_rooms = dedupe_by_key(business->meeting_rooms, [](const MeetingRoom& room) {
            return room.id.empty() ? "name:" + room.name : "id:" + room.id;
        });
        out.work_spaces = dedupe_by_key(business->work_spaces, [](const WorkSpace& space) {
            return space.id.empty() ? "name:" + space.name : "id:" + space.id;
        });
        return out;
    }
    return payload;
}

} // namespace merge
} // namespace onboard
