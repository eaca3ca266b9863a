// examples/config.cpp
// Build an engine from YAML files: the amenity catalog and engine settings.
//
//   cmake -B build -DONBOARD_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/onboard_config examples/amenities.yaml examples/engine.yaml

#include "onboard/onboard.hpp"
#include <iostream>

int main(int argc, char** argv) {
    const char* catalog_path = argc > 1 ? argv[1] : "examples/amenities.yaml";
    const char* engine_path = argc > 2 ? argv[2] : "examples/engine.yaml";

    try {
        auto catalog = std::make_shared<onboard::AmenityCatalog>(
            onboard::load_amenity_catalog(catalog_path));
        auto engine = onboard::OnboardingEngine::create(
            onboard::load_engine_config(engine_path), catalog);

        const auto& config = engine->config();
        std::cout << "Catalog: " << catalog->size() << " amenities" << std::endl;
        std::cout << "Session TTL: " << config.session_ttl().count() << "s" << std::endl;
        std::cout << "Minimum resolution: " << config.min_width() << "x" << config.min_height()
                  << std::endl;
        std::cout << "Required steps:";
        for (auto step : config.required_steps()) {
            std::cout << " " << onboard::to_string(step);
        }
        std::cout << std::endl;

        for (const auto& [category, ids] : catalog->by_category()) {
            if (ids.empty()) continue;
            std::cout << "  " << onboard::to_string(category) << ":";
            for (const auto& id : ids) std::cout << " " << catalog->display_name(id) << ";";
            std::cout << std::endl;
        }
    } catch (const onboard::OnboardError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
