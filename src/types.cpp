// src/types.cpp
// Enum wire names and parsers.

#include "onboard/events.hpp"
#include "onboard/payload.hpp"
#include "onboard/types.hpp"

namespace onboard {

const char* to_string(StepId step) noexcept {
    switch (step) {
        case StepId::Amenities:        return "amenities";
        case StepId::Images:           return "images";
        case StepId::PropertyInfo:     return "property-info";
        case StepId::Rooms:            return "rooms";
        case StepId::BusinessFeatures: return "business-features";
    }
    return "unknown";
}

const char* to_string(SessionStatus status) noexcept {
    switch (status) {
        case SessionStatus::Active:    return "ACTIVE";
        case SessionStatus::Completed: return "COMPLETED";
        case SessionStatus::Abandoned: return "ABANDONED";
    }
    return "UNKNOWN";
}

const char* to_string(PropertyType type) noexcept {
    switch (type) {
        case PropertyType::Hotel:         return "HOTEL";
        case PropertyType::Resort:        return "RESORT";
        case PropertyType::GuestHouse:    return "GUEST_HOUSE";
        case PropertyType::Homestay:      return "HOMESTAY";
        case PropertyType::Apartment:     return "APARTMENT";
        case PropertyType::BoutiqueHotel: return "BOUTIQUE_HOTEL";
        case PropertyType::BusinessHotel: return "BUSINESS_HOTEL";
        case PropertyType::LuxuryHotel:   return "LUXURY_HOTEL";
    }
    return "UNKNOWN";
}

const char* to_string(AmenityCategory category) noexcept {
    switch (category) {
        case AmenityCategory::PropertyWide:   return "PROPERTY_WIDE";
        case AmenityCategory::RoomSpecific:   return "ROOM_SPECIFIC";
        case AmenityCategory::Business:       return "BUSINESS";
        case AmenityCategory::Wellness:       return "WELLNESS";
        case AmenityCategory::Dining:         return "DINING";
        case AmenityCategory::Sustainability: return "SUSTAINABILITY";
        case AmenityCategory::Recreational:   return "RECREATIONAL";
        case AmenityCategory::Connectivity:   return "CONNECTIVITY";
    }
    return "UNKNOWN";
}

const char* to_string(ImageCategory category) noexcept {
    switch (category) {
        case ImageCategory::Exterior:     return "EXTERIOR";
        case ImageCategory::Lobby:        return "LOBBY";
        case ImageCategory::Rooms:        return "ROOMS";
        case ImageCategory::Amenities:    return "AMENITIES";
        case ImageCategory::Dining:       return "DINING";
        case ImageCategory::Recreational: return "RECREATIONAL";
        case ImageCategory::Business:     return "BUSINESS";
        case ImageCategory::VirtualTours: return "VIRTUAL_TOURS";
    }
    return "UNKNOWN";
}

const char* to_string(IssueType type) noexcept {
    switch (type) {
        case IssueType::Resolution:  return "resolution";
        case IssueType::Blur:        return "blur";
        case IssueType::Brightness:  return "brightness";
        case IssueType::Contrast:    return "contrast";
        case IssueType::AspectRatio: return "aspect_ratio";
    }
    return "unknown";
}

const char* to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Low:    return "low";
        case Severity::Medium: return "medium";
        case Severity::High:   return "high";
    }
    return "unknown";
}

const char* to_string(RuleType type) noexcept {
    switch (type) {
        case RuleType::Requires: return "requires";
        case RuleType::Excludes: return "excludes";
        case RuleType::Implies:  return "implies";
    }
    return "unknown";
}

const char* to_string(RecommendationType type) noexcept {
    switch (type) {
        case RecommendationType::Image:   return "image";
        case RecommendationType::Content: return "content";
        case RecommendationType::Policy:  return "policy";
        case RecommendationType::Amenity: return "amenity";
    }
    return "unknown";
}

const char* to_string(Priority priority) noexcept {
    switch (priority) {
        case Priority::Low:    return "low";
        case Priority::Medium: return "medium";
        case Priority::High:   return "high";
    }
    return "unknown";
}

const char* to_string(AuditAction action) noexcept {
    switch (action) {
        case AuditAction::SessionCreated:   return "SESSION_CREATED";
        case AuditAction::StepUpdated:      return "STEP_UPDATED";
        case AuditAction::SessionCompleted: return "SESSION_COMPLETED";
        case AuditAction::SessionExpired:   return "SESSION_EXPIRED";
        case AuditAction::SessionAbandoned: return "SESSION_ABANDONED";
    }
    return "UNKNOWN";
}

std::optional<StepId> parse_step_id(std::string_view name) noexcept {
    for (StepId step : ALL_STEPS) {
        if (name == to_string(step)) return step;
    }
    return std::nullopt;
}

std::optional<PropertyType> parse_property_type(std::string_view name) noexcept {
    for (uint8_t i = 0; i <= static_cast<uint8_t>(PropertyType::LuxuryHotel); i++) {
        auto type = static_cast<PropertyType>(i);
        if (name == to_string(type)) return type;
    }
    return std::nullopt;
}

std::optional<AmenityCategory> parse_amenity_category(std::string_view name) noexcept {
    for (AmenityCategory category : ALL_AMENITY_CATEGORIES) {
        if (name == to_string(category)) return category;
    }
    return std::nullopt;
}

std::optional<ImageCategory> parse_image_category(std::string_view name) noexcept {
    for (uint8_t i = 0; i <= static_cast<uint8_t>(ImageCategory::VirtualTours); i++) {
        auto category = static_cast<ImageCategory>(i);
        if (name == to_string(category)) return category;
    }
    return std::nullopt;
}

std::optional<RuleType> parse_rule_type(std::string_view name) noexcept {
    if (name == "requires") return RuleType::Requires;
    if (name == "excludes") return RuleType::Excludes;
    if (name == "implies") return RuleType::Implies;
    return std::nullopt;
}

StepId step_of(const StepPayload& payload) noexcept {
    // Variant alternatives are declared in StepId order.
    return static_cast<StepId>(payload.index());
}

} // namespace onboard
