// src/loader.cpp
// YAML loaders for the amenity catalog and engine configuration.

#include "onboard/loader.hpp"
#include "onboard/error.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <set>

namespace onboard {

static YAML::Node parse_document(const std::string& yaml_text, const char* what) {
    try {
        return YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw OnboardError::configuration(std::string("invalid ") + what + " YAML: " + e.what());
    }
}

static YAML::Node load_document(const std::string& path, const char* what) {
    try {
        return YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw OnboardError::configuration(std::string("cannot read ") + what + " file: " + path);
    } catch (const YAML::Exception& e) {
        throw OnboardError::configuration(std::string("invalid ") + what + " YAML in " + path +
                                          ": " + e.what());
    }
}

template <typename T>
static T scalar(const YAML::Node& node, const std::string& key) {
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        throw OnboardError::configuration("invalid value for '" + key + "'");
    }
}

// Node walks check shapes before subscripting; anything yaml-cpp still
// rejects surfaces as a configuration error.
template <typename Fn>
static auto guarded_walk(const char* what, Fn walk) -> decltype(walk()) {
    try {
        return walk();
    } catch (const YAML::Exception& e) {
        throw OnboardError::configuration(std::string("malformed ") + what + ": " + e.what());
    }
}

// --- Amenity catalog ---

static AmenityDefinition parse_amenity(const YAML::Node& node, size_t position) {
    std::string where = "amenities[" + std::to_string(position) + "]";
    if (!node.IsMap()) {
        throw OnboardError::configuration(where + " must be a mapping");
    }
    if (!node["id"] || !node["category"]) {
        throw OnboardError::configuration(where + " requires 'id' and 'category'");
    }

    AmenityDefinition def;
    def.id = scalar<std::string>(node["id"], where + ".id");
    def.name = node["name"] ? scalar<std::string>(node["name"], where + ".name") : def.id;
    if (node["description"]) {
        def.description = scalar<std::string>(node["description"], where + ".description");
    }
    if (node["eco_friendly"]) {
        def.eco_friendly = scalar<bool>(node["eco_friendly"], where + ".eco_friendly");
    }

    auto category_name = scalar<std::string>(node["category"], where + ".category");
    auto category = parse_amenity_category(category_name);
    if (!category) {
        throw OnboardError::configuration(where + ": unknown category " + category_name);
    }
    def.category = *category;

    if (const YAML::Node types = node["property_types"]) {
        if (!types.IsSequence()) {
            throw OnboardError::configuration(where + ".property_types must be a list");
        }
        for (const auto& entry : types) {
            auto type_name = scalar<std::string>(entry, where + ".property_types");
            auto type = parse_property_type(type_name);
            if (!type) {
                throw OnboardError::configuration(where + ": unknown property type " + type_name);
            }
            def.applicable_property_types.insert(*type);
        }
    }

    if (const YAML::Node rules = node["rules"]) {
        if (!rules.IsSequence()) {
            throw OnboardError::configuration(where + ".rules must be a list");
        }
        for (const auto& entry : rules) {
            if (!entry.IsMap()) {
                throw OnboardError::configuration(where + ": each rule must be a mapping");
            }
            if (!entry["type"] || !entry["amenity"]) {
                throw OnboardError::configuration(where + ": rules need 'type' and 'amenity'");
            }
            auto type_name = scalar<std::string>(entry["type"], where + ".rules.type");
            auto type = parse_rule_type(type_name);
            if (!type) {
                throw OnboardError::configuration(where + ": unknown rule type " + type_name);
            }
            BusinessRule rule;
            rule.type = *type;
            rule.amenity_id = scalar<std::string>(entry["amenity"], where + ".rules.amenity");
            if (entry["condition"]) {
                rule.condition = scalar<std::string>(entry["condition"], where + ".rules.condition");
            }
            def.business_rules.push_back(std::move(rule));
        }
    }
    return def;
}

static std::vector<AmenityDefinition> parse_catalog_root(const YAML::Node& root) {
    return guarded_walk("catalog", [&] {
        if (!root.IsMap()) {
            throw OnboardError::configuration("catalog requires an 'amenities' list");
        }
        const YAML::Node list = root["amenities"];
        if (!list || !list.IsSequence()) {
            throw OnboardError::configuration("catalog requires an 'amenities' list");
        }
        std::vector<AmenityDefinition> amenities;
        amenities.reserve(list.size());
        for (size_t i = 0; i < list.size(); i++) {
            amenities.push_back(parse_amenity(list[i], i));
        }
        return amenities;
    });
}

std::vector<AmenityDefinition> parse_amenity_catalog(const std::string& yaml_text) {
    return parse_catalog_root(parse_document(yaml_text, "catalog"));
}

AmenityCatalog load_amenity_catalog(const std::string& path) {
    AmenityCatalog catalog(parse_catalog_root(load_document(path, "catalog")));
    spdlog::info("loaded {} amenities from {}", catalog.size(), path);
    return catalog;
}

YamlAmenityCatalogReader::YamlAmenityCatalogReader(std::string path) : path_(std::move(path)) {}

std::vector<AmenityDefinition> YamlAmenityCatalogReader::list_amenities() const {
    return parse_catalog_root(load_document(path_, "catalog"));
}

// --- Engine configuration ---

static const std::set<std::string> ENGINE_KEYS = {
    "session_ttl_seconds", "required_steps", "max_cas_retries",
    "min_width", "min_height", "acceptable_aspect_ratios", "aspect_ratio_tolerance",
    "min_brightness", "max_brightness", "min_contrast", "blur_threshold",
    "high_quality_threshold", "analysis_threads",
    "min_description_length", "min_image_count", "good_factor_threshold",
};

static void apply_engine_keys(EngineConfigBuilder& builder, const YAML::Node& root) {
    if (!root.IsMap()) {
        throw OnboardError::configuration("config requires an 'engine' mapping");
    }
    const YAML::Node engine = root["engine"];
    if (!engine || !engine.IsMap()) {
        throw OnboardError::configuration("config requires an 'engine' mapping");
    }
    for (const auto& entry : engine) {
        if (!entry.first.IsScalar()) {
            throw OnboardError::configuration("engine keys must be plain names");
        }
        auto key = scalar<std::string>(entry.first, "engine key");
        if (ENGINE_KEYS.count(key) == 0) {
            throw OnboardError::configuration("unknown engine key '" + key + "'");
        }
    }

    // Paired settings fall back to the default for whichever side is omitted.
    const EngineConfig defaults = EngineConfig::defaults();

    if (engine["session_ttl_seconds"]) {
        auto ttl = scalar<int64_t>(engine["session_ttl_seconds"], "session_ttl_seconds");
        builder.session_ttl(std::chrono::seconds(ttl));
    }
    if (const YAML::Node steps = engine["required_steps"]) {
        if (!steps.IsSequence()) {
            throw OnboardError::configuration("required_steps must be a list");
        }
        std::set<StepId> required;
        for (const auto& entry : steps) {
            auto name = scalar<std::string>(entry, "required_steps");
            auto step = parse_step_id(name);
            if (!step) {
                throw OnboardError::configuration("unknown step '" + name + "'");
            }
            required.insert(*step);
        }
        builder.required_steps(std::move(required));
    }
    if (engine["max_cas_retries"]) {
        builder.max_cas_retries(scalar<uint32_t>(engine["max_cas_retries"], "max_cas_retries"));
    }
    if (engine["min_width"] || engine["min_height"]) {
        builder.min_resolution(
            engine["min_width"] ? scalar<uint32_t>(engine["min_width"], "min_width")
                                : defaults.min_width(),
            engine["min_height"] ? scalar<uint32_t>(engine["min_height"], "min_height")
                                 : defaults.min_height());
    }
    if (engine["acceptable_aspect_ratios"]) {
        builder.acceptable_aspect_ratios(scalar<std::vector<double>>(
            engine["acceptable_aspect_ratios"], "acceptable_aspect_ratios"));
    }
    if (engine["aspect_ratio_tolerance"]) {
        builder.aspect_ratio_tolerance(
            scalar<double>(engine["aspect_ratio_tolerance"], "aspect_ratio_tolerance"));
    }
    if (engine["min_brightness"] || engine["max_brightness"]) {
        builder.brightness_range(
            engine["min_brightness"] ? scalar<double>(engine["min_brightness"], "min_brightness")
                                     : defaults.min_brightness(),
            engine["max_brightness"] ? scalar<double>(engine["max_brightness"], "max_brightness")
                                     : defaults.max_brightness());
    }
    if (engine["min_contrast"]) {
        builder.min_contrast(scalar<double>(engine["min_contrast"], "min_contrast"));
    }
    if (engine["blur_threshold"]) {
        builder.blur_threshold(scalar<double>(engine["blur_threshold"], "blur_threshold"));
    }
    if (engine["high_quality_threshold"]) {
        builder.high_quality_threshold(
            scalar<double>(engine["high_quality_threshold"], "high_quality_threshold"));
    }
    if (engine["analysis_threads"]) {
        builder.analysis_threads(scalar<size_t>(engine["analysis_threads"], "analysis_threads"));
    }
    if (engine["min_description_length"]) {
        builder.min_description_length(
            scalar<size_t>(engine["min_description_length"], "min_description_length"));
    }
    if (engine["min_image_count"]) {
        builder.min_image_count(scalar<size_t>(engine["min_image_count"], "min_image_count"));
    }
    if (engine["good_factor_threshold"]) {
        builder.good_factor_threshold(
            scalar<double>(engine["good_factor_threshold"], "good_factor_threshold"));
    }
}

static void apply_engine_node(EngineConfigBuilder& builder, const YAML::Node& root) {
    guarded_walk("engine config", [&] { apply_engine_keys(builder, root); });
}

EngineConfigBuilder& apply_engine_config(EngineConfigBuilder& builder,
                                         const std::string& yaml_text) {
    apply_engine_node(builder, parse_document(yaml_text, "engine config"));
    return builder;
}

EngineConfig load_engine_config(const std::string& path) {
    EngineConfigBuilder builder = EngineConfig::builder();
    apply_engine_node(builder, load_document(path, "engine config"));
    EngineConfig config = builder.build();
    spdlog::info("loaded engine config from {}", path);
    return config;
}

} // namespace onboard
