// include/onboard/types.hpp
// Core enums shared by every module, with their wire names.

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace onboard {

// Wizard steps, in wizard order.
enum class StepId : uint8_t {
    Amenities        = 0,
    Images           = 1,
    PropertyInfo     = 2,
    Rooms            = 3,
    BusinessFeatures = 4,
};

constexpr std::array<StepId, 5> ALL_STEPS = {
    StepId::Amenities, StepId::Images, StepId::PropertyInfo,
    StepId::Rooms, StepId::BusinessFeatures,
};

// Session lifecycle. COMPLETED and ABANDONED are terminal.
enum class SessionStatus : uint8_t {
    Active    = 0,
    Completed = 1,
    Abandoned = 2,
};

enum class PropertyType : uint8_t {
    Hotel         = 0,
    Resort        = 1,
    GuestHouse    = 2,
    Homestay      = 3,
    Apartment     = 4,
    BoutiqueHotel = 5,
    BusinessHotel = 6,
    LuxuryHotel   = 7,
};

enum class AmenityCategory : uint8_t {
    PropertyWide   = 0,
    RoomSpecific   = 1,
    Business       = 2,
    Wellness       = 3,
    Dining         = 4,
    Sustainability = 5,
    Recreational   = 6,
    Connectivity   = 7,
};

constexpr std::array<AmenityCategory, 8> ALL_AMENITY_CATEGORIES = {
    AmenityCategory::PropertyWide, AmenityCategory::RoomSpecific,
    AmenityCategory::Business, AmenityCategory::Wellness,
    AmenityCategory::Dining, AmenityCategory::Sustainability,
    AmenityCategory::Recreational, AmenityCategory::Connectivity,
};

enum class ImageCategory : uint8_t {
    Exterior     = 0,
    Lobby        = 1,
    Rooms        = 2,
    Amenities    = 3,
    Dining       = 4,
    Recreational = 5,
    Business     = 6,
    VirtualTours = 7,
};

enum class IssueType : uint8_t {
    Resolution  = 0,
    Blur        = 1,
    Brightness  = 2,
    Contrast    = 3,
    AspectRatio = 4,
};

// Ordered: a greater value is more severe.
enum class Severity : uint8_t {
    Low    = 0,
    Medium = 1,
    High   = 2,
};

enum class RuleType : uint8_t {
    Requires = 0,
    Excludes = 1,
    Implies  = 2,
};

enum class RecommendationType : uint8_t {
    Image   = 0,
    Content = 1,
    Policy  = 2,
    Amenity = 3,
};

// Ordered: a greater value is more urgent.
enum class Priority : uint8_t {
    Low    = 0,
    Medium = 1,
    High   = 2,
};

const char* to_string(StepId step) noexcept;
const char* to_string(SessionStatus status) noexcept;
const char* to_string(PropertyType type) noexcept;
const char* to_string(AmenityCategory category) noexcept;
const char* to_string(ImageCategory category) noexcept;
const char* to_string(IssueType type) noexcept;
const char* to_string(Severity severity) noexcept;
const char* to_string(RuleType type) noexcept;
const char* to_string(RecommendationType type) noexcept;
const char* to_string(Priority priority) noexcept;

std::optional<StepId> parse_step_id(std::string_view name) noexcept;
std::optional<PropertyType> parse_property_type(std::string_view name) noexcept;
std::optional<AmenityCategory> parse_amenity_category(std::string_view name) noexcept;
std::optional<ImageCategory> parse_image_category(std::string_view name) noexcept;
std::optional<RuleType> parse_rule_type(std::string_view name) noexcept;

} // namespace onboard
