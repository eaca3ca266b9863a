// include/onboard/config.hpp
// Flat engine configuration with builder pattern. Injected at construction,
// never read from the environment.

#pragma once

#include "error.hpp"
#include "events.hpp"
#include "types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <set>
#include <vector>

namespace onboard {

class EngineConfigBuilder;

class EngineConfig {
public:
    using ErrorCallback = std::function<void(const OnboardError&)>;
    using AuditCallback = std::function<void(const AuditEvent&)>;
    using CompletionCallback = std::function<void(const CompletionNotice&)>;
    using ClockFn = std::function<TimePoint()>;

    static EngineConfigBuilder builder();

    // Presets.
    static EngineConfig defaults();
    static EngineConfig strict();

    // --- Session lifecycle ---
    std::chrono::seconds session_ttl() const noexcept { return session_ttl_; }
    const std::set<StepId>& required_steps() const noexcept { return required_steps_; }
    uint32_t max_cas_retries() const noexcept { return max_cas_retries_; }

    // --- Image quality standards ---
    uint32_t min_width() const noexcept { return min_width_; }
    uint32_t min_height() const noexcept { return min_height_; }
    const std::vector<double>& acceptable_aspect_ratios() const noexcept { return aspect_ratios_; }
    double aspect_ratio_tolerance() const noexcept { return aspect_ratio_tolerance_; }
    double min_brightness() const noexcept { return min_brightness_; }
    double max_brightness() const noexcept { return max_brightness_; }
    double min_contrast() const noexcept { return min_contrast_; }
    // Compared against mean(laplacian^2) over interior pixels.
    double blur_threshold() const noexcept { return blur_threshold_; }
    double high_quality_threshold() const noexcept { return high_quality_threshold_; }
    size_t analysis_threads() const noexcept { return analysis_threads_; }

    // --- Content and scoring ---
    size_t min_description_length() const noexcept { return min_description_length_; }
    size_t min_image_count() const noexcept { return min_image_count_; }
    double good_factor_threshold() const noexcept { return good_factor_threshold_; }

    // --- Hooks ---
    TimePoint now() const { return clock_ ? clock_() : Clock::now(); }
    const ErrorCallback& on_error() const noexcept { return on_error_; }
    const AuditCallback& on_audit() const noexcept { return on_audit_; }
    const CompletionCallback& on_completed() const noexcept { return on_completed_; }

private:
    friend class EngineConfigBuilder;

    std::chrono::seconds session_ttl_{7 * 24 * 60 * 60};
    std::set<StepId> required_steps_{
        StepId::Amenities, StepId::Images, StepId::PropertyInfo, StepId::Rooms};
    uint32_t max_cas_retries_ = 3;

    uint32_t min_width_ = 1920;
    uint32_t min_height_ = 1080;
    std::vector<double> aspect_ratios_{16.0 / 9.0, 4.0 / 3.0, 3.0 / 2.0, 1.0};
    double aspect_ratio_tolerance_ = 0.1;
    double min_brightness_ = 50.0;
    double max_brightness_ = 200.0;
    double min_contrast_ = 30.0;
    double blur_threshold_ = 100.0;
    double high_quality_threshold_ = 80.0;
    size_t analysis_threads_ = 4;

    size_t min_description_length_ = 50;
    size_t min_image_count_ = 5;
    double good_factor_threshold_ = 70.0;

    ClockFn clock_;
    ErrorCallback on_error_;
    AuditCallback on_audit_;
    CompletionCallback on_completed_;
};

// Fluent builder for EngineConfig.
class EngineConfigBuilder {
public:
    EngineConfigBuilder() = default;

    EngineConfigBuilder& session_ttl(std::chrono::seconds ttl);
    EngineConfigBuilder& required_steps(std::set<StepId> steps);
    EngineConfigBuilder& max_cas_retries(uint32_t retries);
    EngineConfigBuilder& min_resolution(uint32_t width, uint32_t height);
    EngineConfigBuilder& acceptable_aspect_ratios(std::vector<double> ratios);
    EngineConfigBuilder& aspect_ratio_tolerance(double tolerance);
    EngineConfigBuilder& brightness_range(double min, double max);
    EngineConfigBuilder& min_contrast(double min);
    EngineConfigBuilder& blur_threshold(double threshold);
    EngineConfigBuilder& high_quality_threshold(double threshold);
    EngineConfigBuilder& analysis_threads(size_t threads);
    EngineConfigBuilder& min_description_length(size_t length);
    EngineConfigBuilder& min_image_count(size_t count);
    EngineConfigBuilder& good_factor_threshold(double threshold);
    EngineConfigBuilder& clock(EngineConfig::ClockFn clock);
    EngineConfigBuilder& on_error(EngineConfig::ErrorCallback callback);
    EngineConfigBuilder& on_audit(EngineConfig::AuditCallback callback);
    EngineConfigBuilder& on_completed(EngineConfig::CompletionCallback callback);

    // Build the config. Throws OnboardError on out-of-range values.
    EngineConfig build() const;

private:
    EngineConfig config_;
};

} // namespace onboard
