#pragma once

#include <deque>
#include <memory>
#include <string>

namespace collapsex {

/**
 * @brief Collapse-detection strategies selectable by name
 */
enum class DetectionMethod {
    ZScore,     ///< "zscore": statistical outlier in the entropy rate
    Threshold   ///< "threshold": fixed negative entropy-rate threshold
};

/**
 * @brief Parse "zscore" or "threshold" (case-insensitive)
 * @throws ConfigurationError for any other name
 */
DetectionMethod parse_detection_method(const std::string& name);

std::string detection_method_to_string(DetectionMethod method);

/**
 * @brief Collapse detector parameters
 */
struct DetectorConfig {
    DetectionMethod method = DetectionMethod::ZScore;
    int window = 5;             ///< Prior dS/dt values held by the z-score detector
    double n_sigma = 3.0;       ///< Standard deviations below the mean that trigger
    double min_sigma = 1e-9;    ///< Floor on the window standard deviation
    double threshold = 0.5;     ///< Threshold detector: trigger when rate < -threshold

    /**
     * @throws ConfigurationError on non-positive window, n_sigma,
     *         min_sigma or threshold
     */
    void validate() const;
};

/**
 * @brief Watches the entropy-rate series for the collapse signature
 *
 * Detectors are terminal: once observe() returns true, triggered() stays
 * true and later observations are ignored until reset().
 */
class CollapseDetector {
public:
    virtual ~CollapseDetector() = default;

    /**
     * @brief Feed the entropy rate of a step
     * @return true if collapse is detected at this step
     */
    bool observe(int step, double rate);

    bool triggered() const { return triggered_; }

    /// Step of detection, -1 if not triggered
    int triggered_step() const { return triggered_step_; }

    /// Clear history and trigger state
    void reset();

    virtual std::string name() const = 0;

protected:
    /**
     * @brief Strategy-specific test, called only while not triggered
     */
    virtual bool test(double rate) = 0;

    virtual void clear_history() {}

private:
    bool triggered_ = false;
    int triggered_step_ = -1;
};

/**
 * @brief Flags a rate more than N standard deviations below the recent mean
 *
 * The window holds the most recent prior rates. Detection is inactive until
 * the window is full. Mean and (population) standard deviation are taken
 * over the window, with the standard deviation floored at min_sigma.
 */
class ZScoreDetector : public CollapseDetector {
public:
    ZScoreDetector(int window = 5, double n_sigma = 3.0, double min_sigma = 1e-9);

    std::string name() const override { return "zscore"; }

    const std::deque<double>& history() const { return history_; }

protected:
    bool test(double rate) override;
    void clear_history() override { history_.clear(); }

private:
    int window_;
    double n_sigma_;
    double min_sigma_;
    std::deque<double> history_;
};

/**
 * @brief Flags a rate below -threshold
 */
class ThresholdDetector : public CollapseDetector {
public:
    explicit ThresholdDetector(double threshold = 0.5);

    std::string name() const override { return "threshold"; }

protected:
    bool test(double rate) override;

private:
    double threshold_;
};

/**
 * @brief Build the detector selected by a configuration
 */
std::unique_ptr<CollapseDetector> make_detector(const DetectorConfig& config);

} // namespace collapsex
