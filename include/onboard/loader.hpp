// include/onboard/loader.hpp
// YAML loading for the amenity catalog and engine configuration.

#pragma once

#include "amenity.hpp"
#include "config.hpp"

#include <string>
#include <vector>

namespace onboard {

// Parse a catalog document:
//
//   amenities:
//     - id: meeting-rooms
//       name: Meeting Rooms
//       category: BUSINESS
//       property_types: [HOTEL, BUSINESS_HOTEL]
//       rules:
//         - { type: implies, amenity: business-center }
//
// Throws OnboardError (Configuration) on malformed input.
std::vector<AmenityDefinition> parse_amenity_catalog(const std::string& yaml_text);
AmenityCatalog load_amenity_catalog(const std::string& path);

// Reads the catalog file on every call, so edits are picked up.
class YamlAmenityCatalogReader : public AmenityCatalogReader {
public:
    explicit YamlAmenityCatalogReader(std::string path);
    std::vector<AmenityDefinition> list_amenities() const override;

private:
    std::string path_;
};

// Apply the keys of an `engine:` YAML document onto a builder. Unknown keys
// are rejected. Hooks and clock stay as set on the builder.
EngineConfigBuilder& apply_engine_config(EngineConfigBuilder& builder,
                                         const std::string& yaml_text);
EngineConfig load_engine_config(const std::string& path);

} // namespace onboard
