// src/image_analyzer.cpp
// Image quality checks and parallel batch analysis.

#include "onboard/error.hpp"
#include "onboard/image.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <exception>
#include <future>
#include <numeric>

namespace onboard {

static constexpr double RESOLUTION_MISSING_PENALTY = 30.0;
static constexpr double RESOLUTION_LOW_PENALTY = 20.0;
static constexpr double ASPECT_RATIO_PENALTY = 10.0;
static constexpr double BRIGHTNESS_PENALTY = 15.0;
static constexpr double CONTRAST_PENALTY = 15.0;
static constexpr double BLUR_PENALTY = 25.0;

static const char* const AFFIRMATIVE_RECOMMENDATION = "Image meets all quality standards";

QualityCheckResult failed_analysis_result() {
    QualityCheckResult result;
    result.passed = false;
    result.score = 0.0;
    result.issues.push_back(QualityIssue{IssueType::Resolution, Severity::High,
                                         "Failed to analyze image quality",
                                         "Upload a valid image file"});
    result.recommendations.push_back(result.issues.back().suggested_fix);
    return result;
}

static double mean_of(const std::vector<double>& values) {
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

static std::string format_ratio(double ratio) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", ratio);
    return buf;
}

ImageAnalyzer::ImageAnalyzer(ImageQualityStandards standards)
    : standards_(std::move(standards)) {}

double ImageAnalyzer::blur_score(const uint8_t* gray, uint32_t width, uint32_t height) noexcept {
    if (gray == nullptr || width < 3 || height < 3) {
        return 0.0;
    }

    double sum = 0.0;
    const size_t stride = width;
    for (uint32_t y = 1; y + 1 < height; y++) {
        const uint8_t* above = gray + (y - 1) * stride;
        const uint8_t* row = gray + y * stride;
        const uint8_t* below = gray + (y + 1) * stride;
        for (uint32_t x = 1; x + 1 < width; x++) {
            int neighbours = above[x - 1] + above[x] + above[x + 1] +
                             row[x - 1] + row[x + 1] +
                             below[x - 1] + below[x] + below[x + 1];
            double lap = 8.0 * row[x] - neighbours;
            sum += lap * lap;
        }
    }

    double interior = static_cast<double>(width - 2) * static_cast<double>(height - 2);
    return sum / interior;
}

QualityCheckResult ImageAnalyzer::run_checks(const DecodedImage& image) const {
    if (image.channel_means.empty() ||
        image.channel_means.size() != image.channel_stdevs.size()) {
        throw OnboardError::analysis("channel statistics missing or mismatched");
    }

    bool has_dimensions = image.width && image.height && *image.width > 0 && *image.height > 0;
    if (has_dimensions &&
        image.grayscale.size() != static_cast<size_t>(*image.width) * *image.height) {
        throw OnboardError::analysis("grayscale buffer does not match dimensions");
    }

    QualityCheckResult result;
    double score = 100.0;

    // Resolution
    if (!has_dimensions) {
        result.issues.push_back(QualityIssue{IssueType::Resolution, Severity::High,
                                             "Unable to determine image dimensions",
                                             "Upload a valid image file"});
        score -= RESOLUTION_MISSING_PENALTY;
    } else if (*image.width < standards_.min_width || *image.height < standards_.min_height) {
        result.issues.push_back(QualityIssue{
            IssueType::Resolution, Severity::Medium,
            "Image resolution " + std::to_string(*image.width) + "x" +
                std::to_string(*image.height) + " is below minimum " +
                std::to_string(standards_.min_width) + "x" + std::to_string(standards_.min_height),
            "Upload a higher resolution image"});
        score -= RESOLUTION_LOW_PENALTY;
    }

    // Aspect ratio
    if (has_dimensions) {
        double ratio = static_cast<double>(*image.width) / static_cast<double>(*image.height);
        bool acceptable = std::any_of(
            standards_.acceptable_aspect_ratios.begin(), standards_.acceptable_aspect_ratios.end(),
            [&](double target) {
                return std::fabs(ratio - target) <= standards_.aspect_ratio_tolerance;
            });
        if (!acceptable) {
            result.issues.push_back(QualityIssue{
                IssueType::AspectRatio, Severity::Low,
                "Aspect ratio " + format_ratio(ratio) + " may not display optimally",
                "Consider cropping to standard aspect ratios like 16:9 or 4:3"});
            score -= ASPECT_RATIO_PENALTY;
        }
    }

    // Brightness
    double brightness = mean_of(image.channel_means);
    if (brightness < standards_.min_brightness) {
        result.issues.push_back(QualityIssue{
            IssueType::Brightness, Severity::Medium, "Image appears too dark",
            "Increase brightness or improve lighting when taking the photo"});
        score -= BRIGHTNESS_PENALTY;
    } else if (brightness > standards_.max_brightness) {
        result.issues.push_back(QualityIssue{IssueType::Brightness, Severity::Medium,
                                             "Image appears overexposed",
                                             "Reduce brightness or avoid harsh lighting"});
        score -= BRIGHTNESS_PENALTY;
    }

    // Contrast
    double contrast = mean_of(image.channel_stdevs);
    if (contrast < standards_.min_contrast) {
        result.issues.push_back(QualityIssue{
            IssueType::Contrast, Severity::Medium, "Image has low contrast",
            "Increase contrast or ensure better lighting conditions"});
        score -= CONTRAST_PENALTY;
    }

    // Blur
    double sharpness = has_dimensions
        ? blur_score(image.grayscale.data(), *image.width, *image.height)
        : 0.0;
    if (sharpness < standards_.blur_threshold) {
        result.issues.push_back(QualityIssue{
            IssueType::Blur, Severity::High, "Image appears blurry or out of focus",
            "Ensure camera is focused and stable when taking the photo"});
        score -= BLUR_PENALTY;
    }

    result.score = std::max(0.0, score);
    result.passed = std::none_of(result.issues.begin(), result.issues.end(),
                                 [](const QualityIssue& issue) {
                                     return issue.severity == Severity::High;
                                 });

    if (result.issues.empty()) {
        result.recommendations.emplace_back(AFFIRMATIVE_RECOMMENDATION);
    } else {
        for (const auto& issue : result.issues) {
            result.recommendations.push_back(issue.suggested_fix);
        }
    }
    return result;
}

QualityCheckResult ImageAnalyzer::analyze(const DecodedImage& image) const noexcept {
    try {
        return run_checks(image);
    } catch (const std::exception& e) {
        spdlog::warn("image analysis failed: {}", e.what());
    }
    try {
        return failed_analysis_result();
    } catch (const std::bad_alloc&) {
        return QualityCheckResult{};
    }
}

QualityCheckResult ImageAnalyzer::analyze_bytes(const ImageDecoder& decoder,
                                                const std::vector<uint8_t>& bytes) const noexcept {
    DecodedImage decoded;
    try {
        decoded = decoder.decode(bytes);
    } catch (const std::exception& e) {
        spdlog::warn("image decode failed ({} bytes): {}", bytes.size(), e.what());
        try {
            return failed_analysis_result();
        } catch (const std::bad_alloc&) {
            return QualityCheckResult{};
        }
    }
    return analyze(decoded);
}

std::vector<QualityCheckResult> ImageAnalyzer::analyze_batch(
    const std::vector<DecodedImage>& images, size_t max_parallel) const {
    std::vector<QualityCheckResult> results(images.size());
    if (images.empty()) {
        return results;
    }

    size_t workers = std::min(std::max<size_t>(max_parallel, 1), images.size());
    if (workers == 1) {
        for (size_t i = 0; i < images.size(); i++) {
            results[i] = analyze(images[i]);
        }
        return results;
    }

    // Worker w handles indices w, w + workers, ... and writes only its own
    // slots, so no result slot is shared between tasks.
    std::vector<std::future<void>> pending;
    pending.reserve(workers);
    for (size_t w = 0; w < workers; w++) {
        pending.push_back(std::async(std::launch::async, [this, &images, &results, w, workers] {
            for (size_t i = w; i < images.size(); i += workers) {
                results[i] = analyze(images[i]);
            }
        }));
    }
    for (auto& task : pending) {
        task.get();
    }

    spdlog::debug("analyzed {} images on {} tasks", images.size(), workers);
    return results;
}

} // namespace onboard
