// include/onboard/validation.hpp
// Per-step structural and semantic validation. Pure: no side effects, no
// mutation of the payload, catalog or draft.

#pragma once

#include "amenity.hpp"
#include "config.hpp"
#include "payload.hpp"
#include "validation_result.hpp"

#include <memory>

namespace onboard {

class StepValidator {
public:
    StepValidator(const EngineConfig& config, std::shared_ptr<const AmenityCatalog> catalog);

    // Validate `payload` as the data of `step`. When `validate_dependencies`
    // is set and `draft` is given, cross-step references are checked too
    // (warnings only).
    ValidationResult validate(StepId step, const StepPayload& payload,
                              bool validate_dependencies = false,
                              const Draft* draft = nullptr) const;

private:
    ValidationResult validate_amenities(const AmenitiesPayload& payload) const;
    ValidationResult validate_images(const ImagesPayload& payload) const;
    ValidationResult validate_property_info(const PropertyInfoPayload& payload) const;
    ValidationResult validate_rooms(const RoomsPayload& payload) const;
    ValidationResult validate_business_features(const BusinessFeaturesPayload& payload) const;
    void check_room_dependencies(const RoomsPayload& payload, const Draft& draft,
                                 ValidationResult& result) const;

    double high_quality_threshold_;
    size_t min_description_length_;
    std::shared_ptr<const AmenityCatalog> catalog_;
};

} // namespace onboard
