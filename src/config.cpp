// src/config.cpp
// Configuration builder and presets.

#include "onboard/config.hpp"
#include "onboard/image.hpp"

#include <string>

namespace onboard {

// --- EngineConfig presets ---

EngineConfigBuilder EngineConfig::builder() {
    return EngineConfigBuilder();
}

EngineConfig EngineConfig::defaults() {
    return EngineConfig::builder().build();
}

EngineConfig EngineConfig::strict() {
    return EngineConfig::builder()
        .session_ttl(std::chrono::hours(48))
        .required_steps({StepId::Amenities, StepId::Images, StepId::PropertyInfo,
                         StepId::Rooms, StepId::BusinessFeatures})
        .blur_threshold(250.0)
        .min_description_length(150)
        .min_image_count(10)
        .good_factor_threshold(80.0)
        .build();
}

ImageQualityStandards ImageQualityStandards::from_config(const EngineConfig& config) {
    ImageQualityStandards standards;
    standards.min_width = config.min_width();
    standards.min_height = config.min_height();
    standards.acceptable_aspect_ratios = config.acceptable_aspect_ratios();
    standards.aspect_ratio_tolerance = config.aspect_ratio_tolerance();
    standards.min_brightness = config.min_brightness();
    standards.max_brightness = config.max_brightness();
    standards.min_contrast = config.min_contrast();
    standards.blur_threshold = config.blur_threshold();
    standards.high_quality_threshold = config.high_quality_threshold();
    return standards;
}

// --- EngineConfigBuilder ---

EngineConfigBuilder& EngineConfigBuilder::session_ttl(std::chrono::seconds ttl) {
    config_.session_ttl_ = ttl;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::required_steps(std::set<StepId> steps) {
    config_.required_steps_ = std::move(steps);
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::max_cas_retries(uint32_t retries) {
    config_.max_cas_retries_ = retries;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::min_resolution(uint32_t width, uint32_t height) {
    config_.min_width_ = width;
    config_.min_height_ = height;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::acceptable_aspect_ratios(std::vector<double> ratios) {
    config_.aspect_ratios_ = std::move(ratios);
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::aspect_ratio_tolerance(double tolerance) {
    config_.aspect_ratio_tolerance_ = tolerance;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::brightness_range(double min, double max) {
    config_.min_brightness_ = min;
    config_.max_brightness_ = max;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::min_contrast(double min) {
    config_.min_contrast_ = min;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::blur_threshold(double threshold) {
    config_.blur_threshold_ = threshold;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::high_quality_threshold(double threshold) {
    config_.high_quality_threshold_ = threshold;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::analysis_threads(size_t threads) {
    config_.analysis_threads_ = threads;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::min_description_length(size_t length) {
    config_.min_description_length_ = length;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::min_image_count(size_t count) {
    config_.min_image_count_ = count;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::good_factor_threshold(double threshold) {
    config_.good_factor_threshold_ = threshold;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::clock(EngineConfig::ClockFn clock) {
    config_.clock_ = std::move(clock);
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::on_error(EngineConfig::ErrorCallback callback) {
    config_.on_error_ = std::move(callback);
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::on_audit(EngineConfig::AuditCallback callback) {
    config_.on_audit_ = std::move(callback);
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::on_completed(EngineConfig::CompletionCallback callback) {
    config_.on_completed_ = std::move(callback);
    return *this;
}

static bool in_score_range(double value) {
    return value >= 0.0 && value <= 100.0;
}

EngineConfig EngineConfigBuilder::build() const {
    const EngineConfig& c = config_;

    if (c.session_ttl_.count() <= 0) {
        throw OnboardError::configuration("sessionTtl must be positive");
    }
    if (c.min_width_ == 0 || c.min_height_ == 0) {
        throw OnboardError::configuration("minResolution must be non-zero");
    }
    if (c.aspect_ratios_.empty()) {
        throw OnboardError::configuration("acceptableAspectRatios must not be empty");
    }
    for (double ratio : c.aspect_ratios_) {
        if (!(ratio > 0.0)) {
            throw OnboardError::configuration(
                "aspect ratio must be positive, got " + std::to_string(ratio));
        }
    }
    if (c.aspect_ratio_tolerance_ < 0.0) {
        throw OnboardError::configuration("aspectRatioTolerance must not be negative");
    }
    if (c.min_brightness_ < 0.0 || c.max_brightness_ > 255.0 ||
        c.min_brightness_ >= c.max_brightness_) {
        throw OnboardError::configuration("brightnessRange must satisfy 0 <= min < max <= 255");
    }
    if (c.min_contrast_ < 0.0) {
        throw OnboardError::configuration("minContrast must not be negative");
    }
    if (c.blur_threshold_ < 0.0) {
        throw OnboardError::configuration("blurThreshold must not be negative");
    }
    if (!in_score_range(c.high_quality_threshold_)) {
        throw OnboardError::configuration("highQualityThreshold must be within 0-100");
    }
    if (!in_score_range(c.good_factor_threshold_)) {
        throw OnboardError::configuration("goodFactorThreshold must be within 0-100");
    }
    if (c.analysis_threads_ == 0) {
        throw OnboardError::configuration("analysisThreads must be at least 1");
    }
    if (c.min_image_count_ == 0) {
        throw OnboardError::configuration("minImageCount must be at least 1");
    }

    return c;
}

} // namespace onboard
