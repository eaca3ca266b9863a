// src/quality.cpp
// Quality scoring, recommendations and missing-information report.

#include "onboard/quality.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace onboard {

static constexpr double PROFESSIONAL_MIN_SCORE = 85.0;
static constexpr size_t MIN_DESCRIPTION_WORDS = 50;

static const ImageCategory COVERAGE_CATEGORIES[] = {
    ImageCategory::Exterior, ImageCategory::Lobby, ImageCategory::Rooms,
};

static double clamp_score(double value) {
    return std::min(100.0, std::max(0.0, value));
}

static double mean4(double a, double b, double c, double d) {
    return (a + b + c + d) / 4.0;
}

static std::string lowercase(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

static size_t word_count(const std::string& text) {
    std::istringstream in(text);
    size_t count = 0;
    std::string word;
    while (in >> word) {
        count++;
    }
    return count;
}

size_t expected_amenity_count(PropertyType property_type) noexcept {
    switch (property_type) {
        case PropertyType::Hotel:         return 8;
        case PropertyType::Resort:        return 12;
        case PropertyType::LuxuryHotel:   return 12;
        case PropertyType::BusinessHotel: return 10;
        case PropertyType::BoutiqueHotel: return 8;
        case PropertyType::GuestHouse:    return 4;
        case PropertyType::Homestay:      return 3;
        case PropertyType::Apartment:     return 4;
    }
    return 8;
}

QualityScorer::QualityScorer(const EngineConfig& config)
    : high_quality_threshold_(config.high_quality_threshold()),
      min_width_(config.min_width()),
      min_height_(config.min_height()),
      min_image_count_(config.min_image_count()),
      good_factor_threshold_(config.good_factor_threshold()) {}

// --- Images ---

static double image_count_points(size_t total) {
    return std::min(static_cast<double>(total) * 5.0, 30.0);
}

static double professional_points(size_t professional) {
    return std::min(static_cast<double>(professional) * 2.0, 10.0);
}

ComponentScore<ImageQualityFactors> QualityScorer::score_images(const ImagesPayload* images) const {
    ComponentScore<ImageQualityFactors> out;
    out.weight = IMAGE_QUALITY_WEIGHT;
    if (images == nullptr || images->images.empty()) {
        return out;
    }

    auto& f = out.factors;
    f.total_images = images->images.size();
    for (const auto& image : images->images) {
        if (image.quality_score >= high_quality_threshold_) {
            f.high_quality_images++;
        }
        if (image.quality_score >= PROFESSIONAL_MIN_SCORE &&
            image.dimensions.width >= min_width_ && image.dimensions.height >= min_height_) {
            f.professional_photos++;
        }
    }
    for (ImageCategory category : COVERAGE_CATEGORIES) {
        bool covered = std::any_of(images->images.begin(), images->images.end(),
                                   [&](const ImageRecord& image) {
                                       return image.category == category;
                                   });
        if (covered) {
            f.category_coverage++;
        }
    }

    double share = static_cast<double>(f.high_quality_images) / static_cast<double>(f.total_images);
    double score = image_count_points(f.total_images) +
                   40.0 * share +
                   20.0 * static_cast<double>(f.category_coverage) / 3.0 +
                   professional_points(f.professional_photos);
    out.score = std::round(clamp_score(score));
    return out;
}

// --- Content ---

static double description_quality(const std::optional<std::string>& description) {
    if (!description || description->empty()) {
        return 0.0;
    }

    double score = 15.0;
    size_t words = word_count(*description);
    if (words >= 100) {
        score += 40.0;
    } else if (words >= 50) {
        score += 25.0;
    } else if (words >= 20) {
        score += 10.0;
    }

    std::string text = lowercase(*description);
    auto mentions = [&text](const char* a, const char* b) {
        return text.find(a) != std::string::npos || text.find(b) != std::string::npos;
    };
    if (mentions("unique", "special")) score += 15.0;
    if (mentions("location", "nearby")) score += 15.0;
    if (mentions("amenities", "facilities")) score += 15.0;

    return std::min(score, 100.0);
}

static double location_details(const std::optional<LocationDetails>& location) {
    if (!location) {
        return 0.0;
    }
    double score = 0.0;
    if (!location->nearby_attractions.empty()) score += 25.0;
    if (location->transportation && !location->transportation->empty()) score += 25.0;
    if (location->accessibility && !location->accessibility->empty()) score += 25.0;
    if (location->neighborhood && !location->neighborhood->empty()) score += 25.0;
    return score;
}

static bool is_complete_room(const RoomRecord& room) {
    return !room.name.empty() && room.price.has_value() && room.max_occupancy >= 1 &&
           !room.image_ids.empty();
}

static double room_information(const RoomsPayload* rooms) {
    if (rooms == nullptr || rooms->rooms.empty()) {
        return 0.0;
    }

    size_t count = rooms->rooms.size();
    double band = 40.0;
    if (count >= 10) {
        band = 100.0;
    } else if (count >= 5) {
        band = 80.0;
    } else if (count >= 2) {
        band = 60.0;
    }

    size_t complete = std::count_if(rooms->rooms.begin(), rooms->rooms.end(), is_complete_room);
    double complete_share = 100.0 * static_cast<double>(complete) / static_cast<double>(count);
    return 0.5 * band + 0.5 * complete_share;
}

ComponentScore<ContentCompletenessFactors> QualityScorer::score_content(const Draft& draft) const {
    ComponentScore<ContentCompletenessFactors> out;
    out.weight = CONTENT_COMPLETENESS_WEIGHT;
    auto& f = out.factors;

    if (const auto* info = find_step<PropertyInfoPayload>(draft, StepId::PropertyInfo)) {
        f.description_quality = description_quality(info->description);
        f.location_details = location_details(info->location);
    }

    if (const auto* amenities = find_step<AmenitiesPayload>(draft, StepId::Amenities)) {
        double expected = static_cast<double>(expected_amenity_count(amenities->property_type));
        f.amenity_completeness =
            std::min(100.0, 100.0 * static_cast<double>(amenities->selected.size()) / expected);
    }

    f.room_information = room_information(find_step<RoomsPayload>(draft, StepId::Rooms));

    out.score = std::round(clamp_score(mean4(f.description_quality, f.amenity_completeness,
                                             f.location_details, f.room_information)));
    return out;
}

// --- Policies ---

ComponentScore<PolicyClarityFactors> QualityScorer::score_policies(const Policies* policies) const {
    ComponentScore<PolicyClarityFactors> out;
    out.weight = POLICY_CLARITY_WEIGHT;
    if (policies == nullptr) {
        return out;
    }
    auto& f = out.factors;

    if (policies->cancellation) {
        f.cancellation_policy = policies->cancellation->details.empty() ? 50.0 : 100.0;
    }
    if (policies->check_in) {
        f.check_in_out += policies->check_in->process.empty() ? 25.0 : 50.0;
    }
    if (policies->check_out) {
        f.check_in_out += policies->check_out->process.empty() ? 25.0 : 50.0;
    }
    if (policies->booking) {
        f.booking_terms = policies->booking->payment_terms.empty() ? 50.0 : 100.0;
    }
    int explicit_policies = (policies->pet ? 1 : 0) + (policies->smoking ? 1 : 0);
    f.additional_policies = 50.0 * explicit_policies;

    out.score = std::round(clamp_score(mean4(f.cancellation_policy, f.check_in_out,
                                             f.booking_terms, f.additional_policies)));
    return out;
}

QualityScoreBreakdown QualityScorer::score(const Draft& draft) const {
    QualityScoreBreakdown breakdown;
    breakdown.image_quality = score_images(find_step<ImagesPayload>(draft, StepId::Images));
    breakdown.content_completeness = score_content(draft);

    const Policies* policies = nullptr;
    if (const auto* info = find_step<PropertyInfoPayload>(draft, StepId::PropertyInfo)) {
        if (info->policies) {
            policies = &*info->policies;
        }
    }
    breakdown.policy_clarity = score_policies(policies);

    double overall = IMAGE_QUALITY_WEIGHT * breakdown.image_quality.score +
                     CONTENT_COMPLETENESS_WEIGHT * breakdown.content_completeness.score +
                     POLICY_CLARITY_WEIGHT * breakdown.policy_clarity.score;
    breakdown.overall = std::round(clamp_score(overall));
    return breakdown;
}

// --- Recommendations ---

namespace {

struct FactorEntry {
    RecommendationType type;
    double value;           // 0-100
    double overall_weight;  // Component weight times factor share
    const char* title;
    const char* description;
    std::string action;
};

} // namespace

std::vector<Recommendation> QualityScorer::recommendations(
    const QualityScoreBreakdown& breakdown) const {
    const auto& img = breakdown.image_quality.factors;
    const auto& content = breakdown.content_completeness.factors;
    const auto& policy = breakdown.policy_clarity.factors;

    double total = static_cast<double>(img.total_images);
    double hq_share = total > 0 ? 100.0 * static_cast<double>(img.high_quality_images) / total : 0.0;

    const double iw = IMAGE_QUALITY_WEIGHT;
    const double cw = CONTENT_COMPLETENESS_WEIGHT / 4.0;
    const double pw = POLICY_CLARITY_WEIGHT / 4.0;

    const FactorEntry entries[] = {
        {RecommendationType::Image, image_count_points(img.total_images) / 30.0 * 100.0, iw * 0.30,
         "Add More Photos", "Listings with more photos receive more bookings",
         "Upload at least " + std::to_string(min_image_count_) + " photos of the property"},
        {RecommendationType::Image, hq_share, iw * 0.40,
         "Improve Image Quality", "Your property images need improvement to attract more bookings",
         "Replace low-scoring photos with high-resolution, well-lit images"},
        {RecommendationType::Image, static_cast<double>(img.category_coverage) / 3.0 * 100.0, iw * 0.20,
         "Cover Key Areas", "Guests expect to see the exterior, lobby and rooms",
         "Add photos of the exterior, lobby and guest rooms"},
        {RecommendationType::Image, professional_points(img.professional_photos) / 10.0 * 100.0, iw * 0.10,
         "Professional Photography", "Professional photos can increase bookings by up to 40%",
         "Consider hiring a professional photographer for key areas"},
        {RecommendationType::Content, content.description_quality, cw,
         "Enrich Property Description", "Detailed descriptions build booking confidence",
         "Describe what makes the property special, its location and its facilities"},
        {RecommendationType::Amenity, content.amenity_completeness, cw,
         "List More Amenities", "Guests filter searches by amenities",
         "Select every amenity the property offers"},
        {RecommendationType::Content, content.location_details, cw,
         "Add Location Details", "Location information helps guests find and choose your property",
         "Add nearby attractions, transportation, accessibility and neighborhood details"},
        {RecommendationType::Content, content.room_information, cw,
         "Complete Room Information", "Incomplete room types reduce booking confidence",
         "Give every room type a name, price, occupancy and at least one photo"},
        {RecommendationType::Policy, policy.cancellation_policy, pw,
         "Clarify Cancellation Policy", "Clear cancellation terms reduce booking disputes",
         "Define the cancellation policy and describe its terms"},
        {RecommendationType::Policy, policy.check_in_out, pw,
         "Describe Check-in and Check-out", "Guests want to know how arrival and departure work",
         "Add check-in and check-out times and process descriptions"},
        {RecommendationType::Policy, policy.booking_terms, pw,
         "Specify Booking Terms", "Clear policies reduce booking disputes and improve guest satisfaction",
         "Define booking and payment terms"},
        {RecommendationType::Policy, policy.additional_policies, pw,
         "Set House Rules", "Explicit pet and smoking rules avoid surprises at check-in",
         "State whether pets and smoking are allowed"},
    };

    std::vector<Recommendation> out;
    for (const auto& entry : entries) {
        double shortfall = good_factor_threshold_ - entry.value;
        if (shortfall <= 0.0) {
            continue;
        }
        Recommendation rec;
        rec.type = entry.type;
        rec.priority = shortfall >= 20.0 ? Priority::High
                     : shortfall >= 10.0 ? Priority::Medium
                                         : Priority::Low;
        rec.estimated_impact = std::round(entry.overall_weight * shortfall * 10.0) / 10.0;
        rec.title = entry.title;
        rec.description = entry.description;
        rec.action_required = entry.action;
        out.push_back(std::move(rec));
    }

    std::stable_sort(out.begin(), out.end(), [](const Recommendation& a, const Recommendation& b) {
        if (a.priority != b.priority) return a.priority > b.priority;
        return a.estimated_impact > b.estimated_impact;
    });
    return out;
}

// --- Missing information ---

static Priority count_priority(size_t missing) {
    if (missing > 2) return Priority::High;
    if (missing > 0) return Priority::Medium;
    return Priority::Low;
}

std::vector<MissingInformation> QualityScorer::missing_information(const Draft& draft) const {
    std::vector<MissingInformation> out;
    auto emit = [&out](const char* category, std::vector<std::string> items, Priority priority) {
        if (!items.empty()) {
            out.push_back(MissingInformation{category, std::move(items), priority});
        }
    };

    // Images
    {
        std::vector<std::string> items;
        const auto* images = find_step<ImagesPayload>(draft, StepId::Images);
        for (ImageCategory category : COVERAGE_CATEGORIES) {
            bool present = images != nullptr &&
                std::any_of(images->images.begin(), images->images.end(),
                            [&](const ImageRecord& image) { return image.category == category; });
            if (!present) {
                items.push_back(lowercase(to_string(category)) + " photos");
            }
        }
        if (images == nullptr || images->images.size() < min_image_count_) {
            items.push_back("minimum " + std::to_string(min_image_count_) + " property photos");
        }
        emit("Images", std::move(items), Priority::High);
    }

    const auto* info = find_step<PropertyInfoPayload>(draft, StepId::PropertyInfo);

    // Content
    {
        std::vector<std::string> items;
        if (info == nullptr || !info->description ||
            word_count(*info->description) < MIN_DESCRIPTION_WORDS) {
            items.push_back("detailed property description");
        }
        const auto* amenities = find_step<AmenitiesPayload>(draft, StepId::Amenities);
        if (amenities == nullptr || amenities->selected.empty()) {
            items.push_back("property amenities");
        }
        if (info == nullptr || !info->location) {
            items.push_back("location details and nearby attractions");
        }
        Priority priority = count_priority(items.size());
        emit("Content", std::move(items), priority);
    }

    // Rooms
    {
        const auto* rooms = find_step<RoomsPayload>(draft, StepId::Rooms);
        if (rooms == nullptr || rooms->rooms.empty()) {
            emit("Rooms", {"room types with pricing and occupancy"}, Priority::High);
        }
    }

    // Policies
    {
        if (info == nullptr || !info->policies) {
            emit("Policies", {"all booking policies"}, Priority::High);
        } else {
            const Policies& p = *info->policies;
            std::vector<std::string> items;
            if (!p.check_in) items.push_back("check-in policy");
            if (!p.check_out) items.push_back("check-out policy");
            if (!p.cancellation) items.push_back("cancellation policy");
            if (!p.booking) items.push_back("booking terms");
            Priority priority = count_priority(items.size());
            emit("Policies", std::move(items), priority);
        }
    }

    // Business features
    {
        const auto* business =
            find_step<BusinessFeaturesPayload>(draft, StepId::BusinessFeatures);
        if (business == nullptr) {
            emit("Business Features", {"business amenities and services"}, Priority::Low);
        } else {
            std::vector<std::string> items;
            if (!business->connectivity || !business->connectivity->wifi_speed) {
                items.push_back("WiFi speed information");
            }
            if (business->work_spaces.empty()) {
                items.push_back("workspace details");
            }
            emit("Business Features", std::move(items), Priority::Medium);
        }
    }

    return out;
}

} // namespace onboard
