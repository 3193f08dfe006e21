/**
 * @file test_collapse_detector.cpp
 * @brief Tests for the z-score and threshold collapse detectors
 */

#include <catch2/catch_test_macros.hpp>

#include "collapsex/collapse_detector.hpp"
#include "collapsex/errors.hpp"

#include <vector>

using namespace collapsex;

namespace {

/// Feed a rate series, returning the index of the first detection or -1
int first_detection(CollapseDetector& detector, const std::vector<double>& rates) {
    int found = -1;
    for (size_t i = 0; i < rates.size(); ++i) {
        if (detector.observe(static_cast<int>(i), rates[i]) && found < 0) {
            found = static_cast<int>(i);
        }
    }
    return found;
}

const std::vector<double> kNoisyThenSpike = {
    -0.010, -0.011, -0.009, -0.010, -0.012,
    -0.008, -0.010, -0.011, -0.009, -0.010,
    -5.0};

}  // namespace

TEST_CASE("Z-score detector flags the spike step and not before", "[ZScoreDetector]") {
    ZScoreDetector detector(5, 3.0);
    REQUIRE(first_detection(detector, kNoisyThenSpike) == 10);
    REQUIRE(detector.triggered());
    REQUIRE(detector.triggered_step() == 10);
}

TEST_CASE("Z-score detector is inactive until its window fills", "[ZScoreDetector]") {
    ZScoreDetector detector(5, 3.0);
    std::vector<double> rates = {0.0, -5.0, -10.0, -20.0, -40.0};
    REQUIRE(first_detection(detector, rates) == -1);
    REQUIRE_FALSE(detector.triggered());
    REQUIRE(detector.history().size() == 5);
}

TEST_CASE("Z-score detector floors sigma on a flat window", "[ZScoreDetector]") {
    ZScoreDetector detector(3, 3.0, 1e-9);
    std::vector<double> rates = {0.0, 0.0, 0.0, 0.0, -1e-6};
    REQUIRE(first_detection(detector, rates) == 4);
}

TEST_CASE("Detection is terminal until reset", "[CollapseDetector]") {
    ZScoreDetector detector(5, 3.0);
    first_detection(detector, kNoisyThenSpike);
    REQUIRE(detector.triggered_step() == 10);

    REQUIRE_FALSE(detector.observe(11, -100.0));
    REQUIRE(detector.triggered_step() == 10);

    detector.reset();
    REQUIRE_FALSE(detector.triggered());
    REQUIRE(detector.triggered_step() == -1);
    REQUIRE(detector.history().empty());
}

TEST_CASE("Threshold detector flags the first rate below -threshold", "[ThresholdDetector]") {
    ThresholdDetector detector(0.5);
    std::vector<double> rates = {-0.1, 0.2, -0.5, -0.6, -2.0};
    REQUIRE(first_detection(detector, rates) == 3);
    REQUIRE(detector.triggered_step() == 3);

    REQUIRE_THROWS_AS(ThresholdDetector(0.0), ConfigurationError);
}

TEST_CASE("Detection method names", "[CollapseDetector][config]") {
    REQUIRE(parse_detection_method("zscore") == DetectionMethod::ZScore);
    REQUIRE(parse_detection_method("threshold") == DetectionMethod::Threshold);
    REQUIRE_THROWS_AS(parse_detection_method("ZScore"), ConfigurationError);
    REQUIRE_THROWS_AS(parse_detection_method(" threshold"), ConfigurationError);

    try {
        parse_detection_method("moving-average");
        FAIL("Unknown method name was accepted");
    } catch (const ConfigurationError& e) {
        REQUIRE(e.error().code == ErrorCode::UNKNOWN_DETECTION_METHOD);
    }
}

TEST_CASE("make_detector builds the configured strategy", "[CollapseDetector][config]") {
    DetectorConfig config;
    REQUIRE(make_detector(config)->name() == "zscore");

    config.method = DetectionMethod::Threshold;
    config.threshold = 0.2;
    auto detector = make_detector(config);
    REQUIRE(detector->name() == "threshold");
    REQUIRE(detector->observe(1, -0.3));

    config.method = static_cast<DetectionMethod>(7);
    REQUIRE_THROWS_AS(make_detector(config), ConfigurationError);

    config.method = DetectionMethod::Threshold;
    config.window = 0;
    REQUIRE_THROWS_AS(make_detector(config), ConfigurationError);
}
