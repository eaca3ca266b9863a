// include/onboard/image.hpp
// Per-image quality analysis: resolution, aspect ratio, exposure, contrast
// and Laplacian blur detection over decoded pixel statistics.

#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace onboard {

class EngineConfig;

struct Dimensions {
    uint32_t width = 0;
    uint32_t height = 0;
};

// Output of an image decoder. Width and height are absent when the container
// did not report them. `grayscale` holds width*height luma samples, row-major.
struct DecodedImage {
    std::optional<uint32_t> width;
    std::optional<uint32_t> height;
    std::vector<double> channel_means;   // 0-255 per channel
    std::vector<double> channel_stdevs;  // 0-255 per channel
    std::vector<uint8_t> grayscale;
};

struct QualityIssue {
    IssueType type = IssueType::Resolution;
    Severity severity = Severity::Low;
    std::string description;
    std::string suggested_fix;
};

struct QualityCheckResult {
    bool passed = false;
    double score = 0.0;
    std::vector<QualityIssue> issues;
    std::vector<std::string> recommendations;
};

// Thresholds the analyzer checks against.
struct ImageQualityStandards {
    uint32_t min_width = 1920;
    uint32_t min_height = 1080;
    std::vector<double> acceptable_aspect_ratios{16.0 / 9.0, 4.0 / 3.0, 3.0 / 2.0, 1.0};
    double aspect_ratio_tolerance = 0.1;
    double min_brightness = 50.0;
    double max_brightness = 200.0;
    double min_contrast = 30.0;
    double blur_threshold = 100.0;
    double high_quality_threshold = 80.0;

    static ImageQualityStandards from_config(const EngineConfig& config);
};

// Decodes raw upload bytes. Implementations throw on unreadable input; the
// analyzer turns that into a failed result.
class ImageDecoder {
public:
    virtual ~ImageDecoder() = default;
    virtual DecodedImage decode(const std::vector<uint8_t>& bytes) const = 0;
};

class ImageAnalyzer {
public:
    explicit ImageAnalyzer(ImageQualityStandards standards = ImageQualityStandards{});

    // Score one image. Never throws: statistics that cannot be computed yield
    // {passed:false, score:0, issues:[resolution/high]}.
    QualityCheckResult analyze(const DecodedImage& image) const noexcept;

    // Decode then analyze. Decoder failures degrade the same way.
    QualityCheckResult analyze_bytes(const ImageDecoder& decoder,
                                     const std::vector<uint8_t>& bytes) const noexcept;

    // Analyze independent images on up to `max_parallel` tasks. Results keep
    // input order; a failing item never affects its siblings.
    std::vector<QualityCheckResult> analyze_batch(const std::vector<DecodedImage>& images,
                                                  size_t max_parallel) const;

    // Scores at or above the high-quality threshold count as high quality.
    bool is_high_quality(double score) const noexcept {
        return score >= standards_.high_quality_threshold;
    }

    const ImageQualityStandards& standards() const noexcept { return standards_; }

    // mean(laplacian^2) over interior pixels; 0 when there is no interior.
    static double blur_score(const uint8_t* gray, uint32_t width, uint32_t height) noexcept;

private:
    QualityCheckResult run_checks(const DecodedImage& image) const;

    ImageQualityStandards standards_;
};

// The degraded result reported for an image that could not be analyzed.
QualityCheckResult failed_analysis_result();

} // namespace onboard
