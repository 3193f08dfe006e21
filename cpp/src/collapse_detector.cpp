#include "collapsex/collapse_detector.hpp"
#include "collapsex/errors.hpp"
#include <algorithm>
#include <cmath>

namespace collapsex {

DetectionMethod parse_detection_method(const std::string& name) {
    if (name == "zscore") return DetectionMethod::ZScore;
    if (name == "threshold") return DetectionMethod::Threshold;
    throw ConfigurationError(CollapsexError::unknown_method(name));
}

std::string detection_method_to_string(DetectionMethod method) {
    switch (method) {
        case DetectionMethod::ZScore: return "zscore";
        case DetectionMethod::Threshold: return "threshold";
        default: return "unknown";
    }
}

void DetectorConfig::validate() const {
    if (window < 1) {
        throw ConfigurationError(CollapsexError::invalid_parameter(
            "detector.window", "must be at least 1"));
    }
    if (!(n_sigma > 0.0)) {
        throw ConfigurationError(CollapsexError::invalid_parameter(
            "detector.n_sigma", "must be positive"));
    }
    if (!(min_sigma > 0.0)) {
        throw ConfigurationError(CollapsexError::invalid_parameter(
            "detector.min_sigma", "must be positive"));
    }
    if (!(threshold > 0.0)) {
        throw ConfigurationError(CollapsexError::invalid_parameter(
            "detector.threshold", "must be positive"));
    }
}

bool CollapseDetector::observe(int step, double rate) {
    if (triggered_) return false;
    if (test(rate)) {
        triggered_ = true;
        triggered_step_ = step;
        return true;
    }
    return false;
}

void CollapseDetector::reset() {
    triggered_ = false;
    triggered_step_ = -1;
    clear_history();
}

ZScoreDetector::ZScoreDetector(int window, double n_sigma, double min_sigma)
    : window_(window), n_sigma_(n_sigma), min_sigma_(min_sigma) {
    DetectorConfig check;
    check.window = window;
    check.n_sigma = n_sigma;
    check.min_sigma = min_sigma;
    check.validate();
}

bool ZScoreDetector::test(double rate) {
    bool detected = false;

    if (static_cast<int>(history_.size()) >= window_) {
        double mean = 0.0;
        for (double v : history_) mean += v;
        mean /= history_.size();

        double var = 0.0;
        for (double v : history_) var += (v - mean) * (v - mean);
        var /= history_.size();

        double sigma = std::max(std::sqrt(var), min_sigma_);
        detected = rate < mean - n_sigma_ * sigma;
    }

    history_.push_back(rate);
    while (static_cast<int>(history_.size()) > window_) {
        history_.pop_front();
    }
    return detected;
}

ThresholdDetector::ThresholdDetector(double threshold) : threshold_(threshold) {
    if (!(threshold > 0.0)) {
        throw ConfigurationError(CollapsexError::invalid_parameter(
            "detector.threshold", "must be positive"));
    }
}

bool ThresholdDetector::test(double rate) {
    return rate < -threshold_;
}

std::unique_ptr<CollapseDetector> make_detector(const DetectorConfig& config) {
    config.validate();
    switch (config.method) {
        case DetectionMethod::Threshold:
            return std::make_unique<ThresholdDetector>(config.threshold);
        case DetectionMethod::ZScore:
            return std::make_unique<ZScoreDetector>(config.window, config.n_sigma, config.min_sigma);
        default:
            throw ConfigurationError(CollapsexError::unknown_method(
                std::to_string(static_cast<int>(config.method))));
    }
}

} // namespace collapsex
