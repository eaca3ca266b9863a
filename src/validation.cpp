// src/validation.cpp
// Per-step validators.

#include "onboard/validation.hpp"

#include <algorithm>
#include <cctype>

namespace onboard {

static const char* const MEETING_ROOM_LAYOUTS[] = {
    "theater", "classroom", "boardroom", "u_shape", "banquet",
};

static const char* const WORKSPACE_TYPES[] = {
    "quiet_zone", "co_working", "business_lounge",
};

static const ImageCategory ESSENTIAL_IMAGE_CATEGORIES[] = {
    ImageCategory::Exterior, ImageCategory::Lobby, ImageCategory::Rooms,
};

template <size_t N>
static bool is_one_of(const std::string& value, const char* const (&allowed)[N]) {
    return std::any_of(std::begin(allowed), std::end(allowed),
                       [&](const char* candidate) { return value == candidate; });
}

static size_t trimmed_length(const std::string& text) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(text.begin(), text.end(), not_space);
    auto last = std::find_if(text.rbegin(), text.rend(), not_space).base();
    return first < last ? static_cast<size_t>(last - first) : 0;
}

StepValidator::StepValidator(const EngineConfig& config,
                             std::shared_ptr<const AmenityCatalog> catalog)
    : high_quality_threshold_(config.high_quality_threshold()),
      min_description_length_(config.min_description_length()),
      catalog_(std::move(catalog)) {
    if (!catalog_) {
        throw OnboardError::configuration("amenity catalog is required");
    }
}

ValidationResult StepValidator::validate(StepId step, const StepPayload& payload,
                                         bool validate_dependencies,
                                         const Draft* draft) const {
    if (step_of(payload) != step) {
        ValidationResult result;
        result.add_error(std::string("payload for step '") + to_string(step_of(payload)) +
                         "' submitted as '" + to_string(step) + "'");
        return result;
    }

    switch (step) {
        case StepId::Amenities:
            return validate_amenities(std::get<AmenitiesPayload>(payload));
        case StepId::Images:
            return validate_images(std::get<ImagesPayload>(payload));
        case StepId::PropertyInfo:
            return validate_property_info(std::get<PropertyInfoPayload>(payload));
        case StepId::Rooms: {
            const auto& rooms = std::get<RoomsPayload>(payload);
            ValidationResult result = validate_rooms(rooms);
            if (validate_dependencies && draft != nullptr) {
                check_room_dependencies(rooms, *draft, result);
            }
            return result;
        }
        case StepId::BusinessFeatures:
            return validate_business_features(std::get<BusinessFeaturesPayload>(payload));
    }

    ValidationResult result;
    result.add_error("unknown step");
    return result;
}

ValidationResult StepValidator::validate_amenities(const AmenitiesPayload& payload) const {
    ValidationResult result;
    if (payload.selected.empty()) {
        result.add_error("At least one amenity must be selected");
        return result;
    }
    result.merge(validate_amenity_selection(payload.selected, payload.property_type, *catalog_));
    return result;
}

ValidationResult StepValidator::validate_images(const ImagesPayload& payload) const {
    ValidationResult result;
    if (payload.images.empty()) {
        result.add_error("At least one image is required");
        return result;
    }

    for (size_t i = 0; i < payload.images.size(); i++) {
        const auto& image = payload.images[i];
        std::string label = image.id.empty() ? "image #" + std::to_string(i + 1)
                                             : "image '" + image.id + "'";
        if (image.id.empty()) {
            result.add_error(label + " is missing an id");
        }
        if (image.quality_score < 0.0 || image.quality_score > 100.0) {
            result.add_error(label + " has a quality score outside 0-100");
            continue;
        }

        // Scores and issues come from upload-time analysis.
        bool has_high_issue = std::any_of(
            image.issues.begin(), image.issues.end(),
            [](const QualityIssue& issue) { return issue.severity == Severity::High; });
        if (has_high_issue) {
            result.add_warning(label + " has high-severity quality issues");
        } else if (image.quality_score < high_quality_threshold_) {
            result.add_warning(label + " scored below the high-quality threshold");
        }
    }

    for (ImageCategory category : ESSENTIAL_IMAGE_CATEGORIES) {
        bool present = std::any_of(payload.images.begin(), payload.images.end(),
                                   [&](const ImageRecord& image) {
                                       return image.category == category;
                                   });
        if (!present) {
            result.add_warning(std::string("Consider adding ") + to_string(category) +
                               " images for better presentation");
        }
    }
    return result;
}

ValidationResult StepValidator::validate_property_info(const PropertyInfoPayload& payload) const {
    ValidationResult result;

    if (!payload.description) {
        result.add_error("Property description is required");
    } else if (trimmed_length(*payload.description) < min_description_length_) {
        result.add_warning("Property description should be at least " +
                           std::to_string(min_description_length_) + " characters");
    }

    if (!payload.policies) {
        result.add_error("Hotel policies are required");
    }

    if (!payload.location) {
        result.add_warning("Adding location details helps guests find your property");
    }
    return result;
}

ValidationResult StepValidator::validate_rooms(const RoomsPayload& payload) const {
    ValidationResult result;
    if (payload.rooms.empty()) {
        result.add_error("At least one room type is required");
        return result;
    }

    for (size_t i = 0; i < payload.rooms.size(); i++) {
        const auto& room = payload.rooms[i];
        std::string label = room.name.empty() ? "room #" + std::to_string(i + 1)
                                              : "room '" + room.name + "'";
        if (room.name.empty()) {
            result.add_error("All rooms must have a name");
        }
        if (room.max_occupancy < 1) {
            result.add_error(label + " must allow at least one guest");
        }
        if (room.price && *room.price < 0.0) {
            result.add_error(label + " has a negative price");
        }
        if (room.image_ids.empty()) {
            result.add_warning("Consider adding images for " +
                               (room.name.empty() ? std::string("room") : room.name));
        }
    }
    return result;
}

void StepValidator::check_room_dependencies(const RoomsPayload& payload, const Draft& draft,
                                            ValidationResult& result) const {
    const auto* amenities = find_step<AmenitiesPayload>(draft, StepId::Amenities);
    const auto* images = find_step<ImagesPayload>(draft, StepId::Images);

    for (const auto& room : payload.rooms) {
        const std::string& name = room.name.empty() ? room.id : room.name;
        if (amenities != nullptr) {
            for (const auto& id : room.amenities) {
                if (amenities->selected.count(id) == 0) {
                    result.add_warning("Room '" + name + "' lists amenity '" +
                                       catalog_->display_name(id) +
                                       "' that is not selected for the property");
                }
            }
        }
        if (images != nullptr) {
            for (const auto& image_id : room.image_ids) {
                bool known = std::any_of(images->images.begin(), images->images.end(),
                                         [&](const ImageRecord& image) {
                                             return image.id == image_id;
                                         });
                if (!known) {
                    result.add_warning("Room '" + name + "' references unknown image '" +
                                       image_id + "'");
                }
            }
        }
    }
}

ValidationResult StepValidator::validate_business_features(
    const BusinessFeaturesPayload& payload) const {
    ValidationResult result;

    for (const auto& room : payload.meeting_rooms) {
        if (room.name.empty() || room.capacity == 0) {
            result.add_error("Meeting rooms must have name and capacity");
        }
        if (!room.layout.empty() && !is_one_of(room.layout, MEETING_ROOM_LAYOUTS)) {
            result.add_error("Invalid meeting room layout: " + room.layout);
        }
        if (room.hourly_rate && *room.hourly_rate < 0.0) {
            result.add_error("Meeting room hourly rate must be non-negative");
        }
    }

    for (const auto& space : payload.work_spaces) {
        if (space.name.empty() || space.capacity == 0) {
            result.add_error("Workspaces must have name and capacity");
        }
        if (!space.type.empty() && !is_one_of(space.type, WORKSPACE_TYPES)) {
            result.add_error("Invalid workspace type: " + space.type);
        }
        if (space.power_outlets < 0) {
            result.add_error("Workspace power outlet count must be non-negative");
        }
    }

    if (payload.connectivity) {
        const auto& connectivity = *payload.connectivity;
        if (!connectivity.wifi_speed) {
            result.add_warning("Consider providing WiFi speed information for business travelers");
        } else if (connectivity.wifi_speed->download_mbps < 0.0 ||
                   connectivity.wifi_speed->upload_mbps < 0.0 ||
                   connectivity.wifi_speed->latency_ms < 0.0) {
            result.add_error("WiFi speeds must be non-negative");
        }
        if (connectivity.uptime_percent &&
            (*connectivity.uptime_percent < 0.0 || *connectivity.uptime_percent > 100.0)) {
            result.add_error("Uptime must be between 0 and 100");
        }
        if (connectivity.public_computers < 0) {
            result.add_error("Public computers count must be non-negative");
        }
    }
    return result;
}

} // namespace onboard
