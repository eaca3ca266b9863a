// include/onboard/quality.hpp
// Weighted listing quality score (image 40%, content 40%, policy 20%),
// ranked recommendations and the missing-information report.

#pragma once

#include "config.hpp"
#include "payload.hpp"
#include "types.hpp"

#include <string>
#include <vector>

namespace onboard {

struct ImageQualityFactors {
    size_t total_images = 0;
    size_t high_quality_images = 0;
    size_t category_coverage = 0;   // Of EXTERIOR, LOBBY, ROOMS
    size_t professional_photos = 0;
};

struct ContentCompletenessFactors {
    double description_quality = 0.0;
    double amenity_completeness = 0.0;
    double location_details = 0.0;
    double room_information = 0.0;
};

struct PolicyClarityFactors {
    double cancellation_policy = 0.0;
    double check_in_out = 0.0;
    double booking_terms = 0.0;
    double additional_policies = 0.0;
};

template <typename Factors>
struct ComponentScore {
    double score = 0.0;
    double weight = 0.0;
    Factors factors;
};

struct QualityScoreBreakdown {
    ComponentScore<ImageQualityFactors> image_quality;
    ComponentScore<ContentCompletenessFactors> content_completeness;
    ComponentScore<PolicyClarityFactors> policy_clarity;
    double overall = 0.0;
};

struct Recommendation {
    RecommendationType type = RecommendationType::Content;
    Priority priority = Priority::Low;
    double estimated_impact = 0.0;   // Overall-score points
    std::string title;
    std::string description;
    std::string action_required;
};

struct MissingInformation {
    std::string category;
    std::vector<std::string> items;
    Priority priority = Priority::Low;
};

constexpr double IMAGE_QUALITY_WEIGHT = 0.4;
constexpr double CONTENT_COMPLETENESS_WEIGHT = 0.4;
constexpr double POLICY_CLARITY_WEIGHT = 0.2;

// Deterministic: same draft, same numbers. No clock, no randomness.
class QualityScorer {
public:
    explicit QualityScorer(const EngineConfig& config);

    QualityScoreBreakdown score(const Draft& draft) const;

    // One entry per sub-factor below the "good" threshold, sorted by
    // (priority, estimated impact) descending.
    std::vector<Recommendation> recommendations(const QualityScoreBreakdown& breakdown) const;

    // Absent required fields grouped by category, independent of scoring.
    std::vector<MissingInformation> missing_information(const Draft& draft) const;

private:
    ComponentScore<ImageQualityFactors> score_images(const ImagesPayload* images) const;
    ComponentScore<ContentCompletenessFactors> score_content(const Draft& draft) const;
    ComponentScore<PolicyClarityFactors> score_policies(const Policies* policies) const;

    double high_quality_threshold_;
    uint32_t min_width_;
    uint32_t min_height_;
    size_t min_image_count_;
    double good_factor_threshold_;
};

// Amenity count a complete listing of this property type is expected to have.
size_t expected_amenity_count(PropertyType property_type) noexcept;

} // namespace onboard
