// src/amenity.cpp
// Amenity catalog, rule validation and room-level inheritance.

#include "onboard/amenity.hpp"
#include "onboard/error.hpp"

#include <algorithm>
#include <cmath>

namespace onboard {

// --- AmenityCatalog ---

AmenityCatalog::AmenityCatalog(std::vector<AmenityDefinition> amenities)
    : amenities_(std::move(amenities)) {
    index_.reserve(amenities_.size());
    for (size_t i = 0; i < amenities_.size(); i++) {
        const auto& id = amenities_[i].id;
        if (id.empty()) {
            throw OnboardError::configuration("amenity id must not be empty");
        }
        if (!index_.emplace(id, i).second) {
            throw OnboardError::configuration("duplicate amenity id: " + id);
        }
    }
}

const AmenityDefinition* AmenityCatalog::find(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &amenities_[it->second];
}

const std::string& AmenityCatalog::display_name(const std::string& id) const {
    const AmenityDefinition* def = find(id);
    if (def == nullptr || def->name.empty()) {
        return id;
    }
    return def->name;
}

std::map<AmenityCategory, std::vector<std::string>> AmenityCatalog::by_category() const {
    std::map<AmenityCategory, std::vector<std::string>> grouped;
    for (AmenityCategory category : ALL_AMENITY_CATEGORIES) {
        grouped[category];
    }
    for (const auto& def : amenities_) {
        grouped[def.category].push_back(def.id);
    }
    return grouped;
}

static AmenityDefinition seed(std::string id, std::string name, std::string description,
                              AmenityCategory category, bool eco_friendly,
                              std::set<PropertyType> types,
                              std::vector<BusinessRule> rules = {}) {
    AmenityDefinition def;
    def.id = std::move(id);
    def.name = std::move(name);
    def.description = std::move(description);
    def.category = category;
    def.eco_friendly = eco_friendly;
    def.applicable_property_types = std::move(types);
    def.business_rules = std::move(rules);
    return def;
}

AmenityCatalog AmenityCatalog::defaults() {
    using PT = PropertyType;
    using AC = AmenityCategory;

    std::vector<AmenityDefinition> amenities;
    amenities.push_back(seed("wifi", "Free WiFi",
        "Complimentary wireless internet access throughout the property",
        AC::PropertyWide, false, {}));
    amenities.push_back(seed("front-desk", "24/7 Front Desk",
        "Round-the-clock reception and guest services",
        AC::PropertyWide, false, {PT::Hotel, PT::BusinessHotel, PT::LuxuryHotel}));
    amenities.push_back(seed("parking", "Parking",
        "On-site parking facilities for guests",
        AC::PropertyWide, false, {}));
    amenities.push_back(seed("smoke-free", "Smoke-Free Property",
        "Smoking is not permitted anywhere on the premises",
        AC::PropertyWide, false, {},
        {{RuleType::Excludes, "smoking-area", std::nullopt}}));
    amenities.push_back(seed("smoking-area", "Designated Smoking Area",
        "Outdoor area reserved for smoking guests",
        AC::PropertyWide, false, {},
        {{RuleType::Excludes, "smoke-free", std::nullopt}}));
    amenities.push_back(seed("air-conditioning", "Air Conditioning",
        "Climate control system in guest rooms",
        AC::RoomSpecific, false, {}));
    amenities.push_back(seed("mini-bar", "Mini Bar",
        "In-room refrigerated mini bar with beverages and snacks",
        AC::RoomSpecific, false, {PT::Hotel, PT::LuxuryHotel, PT::BusinessHotel}));
    amenities.push_back(seed("business-center", "Business Center",
        "Dedicated business facilities with computers and printing services",
        AC::Business, false, {PT::BusinessHotel, PT::Hotel, PT::LuxuryHotel}));
    amenities.push_back(seed("meeting-rooms", "Meeting Rooms",
        "Professional meeting and conference facilities",
        AC::Business, false, {PT::BusinessHotel, PT::Hotel, PT::LuxuryHotel},
        {{RuleType::Implies, "business-center", std::string("Large properties typically have both")}}));
    amenities.push_back(seed("high-speed-internet", "High-Speed Internet",
        "Dedicated fibre connection suitable for video conferencing",
        AC::Connectivity, false, {},
        {{RuleType::Requires, "wifi", std::nullopt}}));
    amenities.push_back(seed("swimming-pool", "Swimming Pool",
        "Outdoor or indoor swimming pool facility",
        AC::Wellness, false, {PT::Resort, PT::LuxuryHotel, PT::Hotel}));
    amenities.push_back(seed("spa", "Spa Services",
        "Professional spa and wellness treatments",
        AC::Wellness, false, {PT::Resort, PT::LuxuryHotel}));
    amenities.push_back(seed("restaurant", "On-Site Restaurant",
        "Restaurant serving breakfast, lunch and dinner",
        AC::Dining, false, {}));
    amenities.push_back(seed("kids-club", "Kids Club",
        "Supervised activities for children",
        AC::Recreational, false, {PT::Resort, PT::LuxuryHotel}));
    amenities.push_back(seed("solar-power", "Solar Power",
        "Renewable energy from solar panels",
        AC::Sustainability, true, {}));
    amenities.push_back(seed("recycling", "Recycling Program",
        "Comprehensive waste recycling and reduction program",
        AC::Sustainability, true, {}));
    amenities.push_back(seed("ev-charging", "EV Charging",
        "Electric vehicle charging points in the car park",
        AC::Sustainability, true, {},
        {{RuleType::Requires, "parking", std::nullopt}}));

    return AmenityCatalog(std::move(amenities));
}

// --- Category guidance ---

std::vector<AmenityCategory> required_categories(PropertyType property_type) {
    std::vector<AmenityCategory> required{AmenityCategory::PropertyWide};
    switch (property_type) {
        case PropertyType::BusinessHotel:
            required.push_back(AmenityCategory::Business);
            required.push_back(AmenityCategory::Connectivity);
            break;
        case PropertyType::Resort:
            required.push_back(AmenityCategory::Recreational);
            required.push_back(AmenityCategory::Wellness);
            break;
        case PropertyType::LuxuryHotel:
            required.push_back(AmenityCategory::Wellness);
            required.push_back(AmenityCategory::Dining);
            break;
        default:
            break;
    }
    return required;
}

std::map<AmenityCategory, size_t> max_amenities_per_category(PropertyType property_type) {
    std::map<AmenityCategory, size_t> limits{
        {AmenityCategory::PropertyWide, 15},
        {AmenityCategory::RoomSpecific, 10},
        {AmenityCategory::Business, 8},
        {AmenityCategory::Wellness, 6},
        {AmenityCategory::Dining, 5},
        {AmenityCategory::Sustainability, 8},
        {AmenityCategory::Recreational, 10},
        {AmenityCategory::Connectivity, 5},
    };

    auto scale = [&limits](double factor) {
        for (auto& [category, limit] : limits) {
            limit = static_cast<size_t>(std::floor(static_cast<double>(limit) * factor));
        }
    };

    switch (property_type) {
        case PropertyType::LuxuryHotel:
        case PropertyType::Resort:
            scale(1.5);
            break;
        case PropertyType::BusinessHotel:
            limits[AmenityCategory::Business] *= 2;
            limits[AmenityCategory::Connectivity] *= 2;
            break;
        case PropertyType::GuestHouse:
        case PropertyType::Homestay:
            scale(0.7);
            break;
        default:
            break;
    }
    return limits;
}

// --- Validation ---

static std::string quoted(const std::string& text) {
    return "\"" + text + "\"";
}

// Folds every selected amenity's rules against the selection. Excludes
// conflicts are reported from each side that declares them.
static void apply_business_rules(const std::set<std::string>& selected,
                                 const AmenityCatalog& catalog,
                                 ValidationResult& result) {
    for (const auto& id : selected) {
        const AmenityDefinition* def = catalog.find(id);
        if (def == nullptr) {
            continue;
        }
        for (const auto& rule : def->business_rules) {
            bool other_selected = selected.count(rule.amenity_id) > 0;
            const std::string& name = catalog.display_name(def->id);
            const std::string& other = catalog.display_name(rule.amenity_id);
            switch (rule.type) {
                case RuleType::Requires:
                    if (!other_selected) {
                        result.add_error(quoted(name) + " requires " + quoted(other) +
                                         " to be selected");
                    }
                    break;
                case RuleType::Excludes:
                    if (other_selected) {
                        result.add_error(quoted(name) + " cannot be selected together with " +
                                         quoted(other));
                    }
                    break;
                case RuleType::Implies:
                    if (!other_selected) {
                        result.add_warning(quoted(name) + " typically includes " + quoted(other) +
                                           ". Consider adding it.");
                    }
                    break;
            }
        }
    }
}

static void apply_category_guidance(const std::set<std::string>& selected,
                                    PropertyType property_type,
                                    const AmenityCatalog& catalog,
                                    ValidationResult& result) {
    std::map<AmenityCategory, size_t> counts;
    for (const auto& id : selected) {
        if (const AmenityDefinition* def = catalog.find(id)) {
            counts[def->category]++;
        }
    }

    for (AmenityCategory category : required_categories(property_type)) {
        if (counts[category] == 0) {
            result.add_warning(std::string("No ") + to_string(category) +
                               " amenities selected; " + to_string(property_type) +
                               " listings usually offer at least one");
        }
    }

    for (const auto& [category, limit] : max_amenities_per_category(property_type)) {
        auto it = counts.find(category);
        if (it != counts.end() && it->second > limit) {
            result.add_warning(std::string("Too many ") + to_string(category) +
                               " amenities selected (" + std::to_string(it->second) +
                               ", maximum " + std::to_string(limit) + ")");
        }
    }
}

ValidationResult validate_amenity_selection(const std::set<std::string>& selected,
                                            PropertyType property_type,
                                            const AmenityCatalog& catalog) {
    ValidationResult result;
    if (selected.empty()) {
        result.add_warning("No amenities selected");
        return result;
    }

    std::string missing;
    for (const auto& id : selected) {
        if (!catalog.contains(id)) {
            if (!missing.empty()) missing += ", ";
            missing += id;
        }
    }
    if (!missing.empty()) {
        result.add_error("Invalid amenity IDs: " + missing);
    }

    for (const auto& id : selected) {
        const AmenityDefinition* def = catalog.find(id);
        if (def == nullptr || def->applicable_property_types.empty()) {
            continue;
        }
        if (def->applicable_property_types.count(property_type) == 0) {
            result.add_error("Amenity " + quoted(catalog.display_name(id)) +
                             " is not applicable to " + to_string(property_type) +
                             " properties");
        }
    }

    apply_business_rules(selected, catalog, result);
    apply_category_guidance(selected, property_type, catalog, result);
    return result;
}

// --- Inheritance ---

RoomAmenities inherit_room_amenities(const AmenityCatalog& catalog,
                                     const std::set<std::string>& property_selection,
                                     const std::vector<std::string>& room_specific,
                                     const std::vector<AmenityOverride>& overrides) {
    static const AmenityCategory INHERITABLE[] = {
        AmenityCategory::PropertyWide,
        AmenityCategory::Connectivity,
        AmenityCategory::Sustainability,
    };

    RoomAmenities out;
    auto grouped = catalog.by_category();
    for (AmenityCategory category : INHERITABLE) {
        for (const auto& id : grouped[category]) {
            if (property_selection.count(id) > 0) {
                out.inherited.push_back(id);
            }
        }
    }

    auto contains = [](const std::vector<std::string>& ids, const std::string& id) {
        return std::find(ids.begin(), ids.end(), id) != ids.end();
    };

    out.final = out.inherited;
    for (const auto& ov : overrides) {
        if (ov.action == OverrideAction::Add) {
            if (!contains(out.final, ov.amenity_id)) {
                out.final.push_back(ov.amenity_id);
            }
        } else {
            out.final.erase(std::remove(out.final.begin(), out.final.end(), ov.amenity_id),
                            out.final.end());
        }
    }

    out.specific = room_specific;
    for (const auto& id : room_specific) {
        if (!contains(out.final, id)) {
            out.final.push_back(id);
        }
    }
    return out;
}

} // namespace onboard
