// include/onboard/payload.hpp
// Step payload schemas. Each wizard step has its own explicit record; the
// StepPayload variant is decoded once at the API boundary.

#pragma once

#include "image.hpp"
#include "types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace onboard {

// --- amenities ---

struct AmenitiesPayload {
    std::set<std::string> selected;
    PropertyType property_type = PropertyType::Hotel;
};

// --- images ---

// Created by the analyzer at upload time; only tags and category change later.
struct ImageRecord {
    std::string id;
    ImageCategory category = ImageCategory::Exterior;
    std::string url;
    double quality_score = 0.0;
    Dimensions dimensions;
    std::vector<QualityIssue> issues;
    std::vector<std::string> tags;
};

struct ImagesPayload {
    std::vector<ImageRecord> images;
};

// --- property-info ---

struct CheckInPolicy {
    std::string standard_time;  // HH:MM
    std::string process;
    std::vector<std::string> requirements;
};

struct CheckOutPolicy {
    std::string standard_time;  // HH:MM
    std::string process;
    bool late_checkout_available = false;
};

struct CancellationPolicy {
    std::string type;           // flexible, moderate, strict, super_strict
    uint32_t free_until_hours = 0;
    double penalty_percentage = 0.0;
    std::string details;
};

struct BookingPolicy {
    uint32_t advance_booking_days = 0;
    bool instant_booking = false;
    std::string payment_terms;
};

struct PetPolicy {
    bool allowed = false;
    std::optional<double> fee;
};

struct SmokingPolicy {
    bool allowed = false;
    std::vector<std::string> designated_areas;
};

// Each policy is optional; absent means "not set", not "disallowed".
struct Policies {
    std::optional<CheckInPolicy> check_in;
    std::optional<CheckOutPolicy> check_out;
    std::optional<CancellationPolicy> cancellation;
    std::optional<BookingPolicy> booking;
    std::optional<PetPolicy> pet;
    std::optional<SmokingPolicy> smoking;
};

struct Attraction {
    std::string name;
    std::string type;
    double distance_km = 0.0;
};

struct LocationDetails {
    std::vector<Attraction> nearby_attractions;
    std::optional<std::string> transportation;
    std::optional<std::string> accessibility;
    std::optional<std::string> neighborhood;
};

struct PropertyInfoPayload {
    std::optional<std::string> description;
    std::optional<Policies> policies;
    std::optional<LocationDetails> location;
};

// --- rooms ---

struct RoomRecord {
    std::string id;
    std::string name;
    std::optional<double> price;
    uint32_t max_occupancy = 0;
    std::vector<std::string> image_ids;
    std::vector<std::string> amenities;
};

struct RoomsPayload {
    std::vector<RoomRecord> rooms;
};

// --- business-features ---

struct MeetingRoom {
    std::string id;
    std::string name;
    uint32_t capacity = 0;
    std::string layout;         // theater, classroom, boardroom, u_shape, banquet
    std::optional<double> hourly_rate;
};

struct WifiSpeed {
    double download_mbps = 0.0;
    double upload_mbps = 0.0;
    double latency_ms = 0.0;
};

struct Connectivity {
    std::optional<WifiSpeed> wifi_speed;
    std::optional<double> uptime_percent;
    bool business_grade = false;
    bool wired_internet = false;
    int32_t public_computers = 0;
};

struct WorkSpace {
    std::string id;
    std::string name;
    std::string type;           // quiet_zone, co_working, business_lounge
    uint32_t capacity = 0;
    int32_t power_outlets = 0;
};

struct BusinessFeaturesPayload {
    std::vector<MeetingRoom> meeting_rooms;
    std::optional<Connectivity> connectivity;
    std::vector<WorkSpace> work_spaces;
};

// Alternative index matches StepId.
using StepPayload = std::variant<AmenitiesPayload, ImagesPayload, PropertyInfoPayload,
                                 RoomsPayload, BusinessFeaturesPayload>;

// Accumulated per-session data, one payload per submitted step.
using Draft = std::map<StepId, StepPayload>;

// The step a payload alternative belongs to.
StepId step_of(const StepPayload& payload) noexcept;

// Typed access into a draft; nullptr when the step was never submitted.
template <typename T>
const T* find_step(const Draft& draft, StepId step) {
    auto it = draft.find(step);
    if (it == draft.end()) return nullptr;
    return std::get_if<T>(&it->second);
}

} // namespace onboard
