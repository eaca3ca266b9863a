// include/onboard/amenity.hpp
// Amenity catalog and business-rule validation (requires / excludes / implies).

#pragma once

#include "types.hpp"
#include "validation_result.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace onboard {

struct BusinessRule {
    RuleType type = RuleType::Requires;
    std::string amenity_id;
    std::optional<std::string> condition;
};

struct AmenityDefinition {
    std::string id;
    std::string name;
    std::string description;
    AmenityCategory category = AmenityCategory::PropertyWide;
    bool eco_friendly = false;
    // Empty means applicable to every property type.
    std::set<PropertyType> applicable_property_types;
    std::vector<BusinessRule> business_rules;
};

// Immutable once built; share as std::shared_ptr<const AmenityCatalog>.
class AmenityCatalog {
public:
    AmenityCatalog() = default;

    // Throws OnboardError on duplicate or empty ids.
    explicit AmenityCatalog(std::vector<AmenityDefinition> amenities);

    // The seed catalog every deployment starts from.
    static AmenityCatalog defaults();

    const AmenityDefinition* find(const std::string& id) const;
    bool contains(const std::string& id) const { return find(id) != nullptr; }

    // Display name, falling back to the id for unknown amenities.
    const std::string& display_name(const std::string& id) const;

    const std::vector<AmenityDefinition>& all() const noexcept { return amenities_; }
    size_t size() const noexcept { return amenities_.size(); }

    // Amenity ids grouped by category, in catalog order.
    std::map<AmenityCategory, std::vector<std::string>> by_category() const;

private:
    std::vector<AmenityDefinition> amenities_;
    std::unordered_map<std::string, size_t> index_;
};

// Source of catalog data (database table, YAML file, ...).
class AmenityCatalogReader {
public:
    virtual ~AmenityCatalogReader() = default;
    virtual std::vector<AmenityDefinition> list_amenities() const = 0;
};

// Validate a selection against the catalog for one property type.
ValidationResult validate_amenity_selection(const std::set<std::string>& selected,
                                            PropertyType property_type,
                                            const AmenityCatalog& catalog);

// Categories a listing of this property type is expected to cover.
std::vector<AmenityCategory> required_categories(PropertyType property_type);

// Upper bound of amenities per category for this property type.
std::map<AmenityCategory, size_t> max_amenities_per_category(PropertyType property_type);

// --- Room-level inheritance ---

enum class OverrideAction { Add, Remove };

struct AmenityOverride {
    std::string amenity_id;
    OverrideAction action = OverrideAction::Add;
};

struct RoomAmenities {
    std::vector<std::string> inherited;
    std::vector<std::string> specific;
    std::vector<std::string> final;
};

// Property-wide, connectivity and sustainability amenities flow down to rooms;
// overrides add or remove, then room-specific amenities are appended.
RoomAmenities inherit_room_amenities(const AmenityCatalog& catalog,
                                     const std::set<std::string>& property_selection,
                                     const std::vector<std::string>& room_specific,
                                     const std::vector<AmenityOverride>& overrides);

} // namespace onboard
