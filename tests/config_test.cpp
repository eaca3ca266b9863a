// tests/config_test.cpp
// Unit tests for EngineConfig and builder.

#include <gtest/gtest.h>
#include "onboard/config.hpp"
#include "onboard/image.hpp"

using namespace onboard;

TEST(ConfigTest, Defaults) {
    auto config = EngineConfig::defaults();
    EXPECT_EQ(config.session_ttl(), std::chrono::hours(24 * 7));
    EXPECT_EQ(config.min_width(), 1920u);
    EXPECT_EQ(config.min_height(), 1080u);
    EXPECT_DOUBLE_EQ(config.blur_threshold(), 100.0);
    EXPECT_DOUBLE_EQ(config.high_quality_threshold(), 80.0);
    EXPECT_EQ(config.min_description_length(), 50u);
    EXPECT_EQ(config.max_cas_retries(), 3u);
    EXPECT_EQ(config.acceptable_aspect_ratios().size(), 4u);
}

TEST(ConfigTest, DefaultRequiredStepsExcludeBusinessFeatures) {
    auto config = EngineConfig::defaults();
    std::set<StepId> expected{StepId::Amenities, StepId::Images, StepId::PropertyInfo,
                              StepId::Rooms};
    EXPECT_EQ(config.required_steps(), expected);
}

TEST(ConfigTest, StrictPreset) {
    auto config = EngineConfig::strict();
    EXPECT_EQ(config.required_steps().size(), 5u);
    EXPECT_GT(config.blur_threshold(), EngineConfig::defaults().blur_threshold());
    EXPECT_EQ(config.min_description_length(), 150u);
}

TEST(ConfigTest, BuilderCustomValues) {
    auto config = EngineConfig::builder()
        .session_ttl(std::chrono::hours(1))
        .min_resolution(1280, 720)
        .brightness_range(40.0, 220.0)
        .min_contrast(20.0)
        .blur_threshold(50.0)
        .analysis_threads(2)
        .max_cas_retries(5)
        .build();

    EXPECT_EQ(config.session_ttl(), std::chrono::hours(1));
    EXPECT_EQ(config.min_width(), 1280u);
    EXPECT_EQ(config.min_height(), 720u);
    EXPECT_DOUBLE_EQ(config.min_brightness(), 40.0);
    EXPECT_DOUBLE_EQ(config.max_brightness(), 220.0);
    EXPECT_DOUBLE_EQ(config.min_contrast(), 20.0);
    EXPECT_DOUBLE_EQ(config.blur_threshold(), 50.0);
    EXPECT_EQ(config.analysis_threads(), 2u);
    EXPECT_EQ(config.max_cas_retries(), 5u);
}

TEST(ConfigTest, InvalidTtl) {
    EXPECT_THROW(EngineConfig::builder().session_ttl(std::chrono::seconds(0)).build(),
                 OnboardError);
}

TEST(ConfigTest, InvalidBrightnessRange) {
    EXPECT_THROW(EngineConfig::builder().brightness_range(200.0, 50.0).build(), OnboardError);
    EXPECT_THROW(EngineConfig::builder().brightness_range(0.0, 300.0).build(), OnboardError);
}

TEST(ConfigTest, InvalidAspectRatios) {
    EXPECT_THROW(EngineConfig::builder().acceptable_aspect_ratios({}).build(), OnboardError);
    EXPECT_THROW(EngineConfig::builder().acceptable_aspect_ratios({1.0, -2.0}).build(),
                 OnboardError);
}

TEST(ConfigTest, InvalidThresholds) {
    EXPECT_THROW(EngineConfig::builder().high_quality_threshold(120.0).build(), OnboardError);
    EXPECT_THROW(EngineConfig::builder().good_factor_threshold(-1.0).build(), OnboardError);
    EXPECT_THROW(EngineConfig::builder().analysis_threads(0).build(), OnboardError);
    EXPECT_THROW(EngineConfig::builder().min_resolution(0, 1080).build(), OnboardError);
}

TEST(ConfigTest, ConfigurationErrorKind) {
    try {
        EngineConfig::builder().blur_threshold(-5.0).build();
        FAIL() << "expected OnboardError";
    } catch (const OnboardError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Configuration);
        EXPECT_NE(e.message().find("blurThreshold"), std::string::npos);
    }
}

TEST(ConfigTest, InjectedClock) {
    TimePoint fixed = TimePoint(std::chrono::seconds(1700000000));
    auto config = EngineConfig::builder().clock([fixed] { return fixed; }).build();
    EXPECT_EQ(config.now(), fixed);
}

TEST(ConfigTest, OnErrorCallback) {
    bool called = false;
    auto config = EngineConfig::builder()
        .on_error([&called](const OnboardError&) { called = true; })
        .build();

    EXPECT_TRUE(config.on_error() != nullptr);
    config.on_error()(OnboardError::storage("test"));
    EXPECT_TRUE(called);
}

TEST(ConfigTest, StandardsFollowConfig) {
    auto config = EngineConfig::builder()
        .min_resolution(800, 600)
        .blur_threshold(42.0)
        .aspect_ratio_tolerance(0.05)
        .build();
    auto standards = ImageQualityStandards::from_config(config);
    EXPECT_EQ(standards.min_width, 800u);
    EXPECT_EQ(standards.min_height, 600u);
    EXPECT_DOUBLE_EQ(standards.blur_threshold, 42.0);
    EXPECT_DOUBLE_EQ(standards.aspect_ratio_tolerance, 0.05);
}
