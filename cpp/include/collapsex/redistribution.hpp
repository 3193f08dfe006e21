#pragma once

#include "collapsex/frame_data.hpp"
#include "collapsex/warnings.hpp"

#include <vector>
#include <Eigen/Dense>

namespace collapsex {

/**
 * @brief Energy redistribution parameters
 */
struct RedistributionConfig {
    /// Fraction of a failed member's energy that is lost, in [0, 1]
    double dissipation_fraction = 0.0;

    /// Relative tolerance of the energy balance check
    double conservation_tolerance = 1e-9;

    /**
     * @throws ConfigurationError if a value is out of range
     */
    void validate() const;
};

/**
 * @brief Energy field after redistribution
 */
struct RedistributionResult {
    Eigen::VectorXd energy;     ///< Per member, frame member order [J]
    double dissipated = 0.0;    ///< Energy removed from the system [J]
    double total_before = 0.0;  ///< Sum of the input field [J]
    double total_after = 0.0;   ///< Sum of the output field [J]
};

/**
 * @brief Moves the strain energy of failed members onto surviving ones
 *
 * Each failed member f releases Q = (1 - dissipation)·U_f. Q is shared
 * among the active members adjacent to f in proportion to their current
 * energy (equally if they all carry none). Without an active neighbour Q
 * goes to every surviving member by the same rule; with no survivor at all
 * Q is dissipated. U_f becomes zero.
 *
 * The source is integrated with one explicit pseudo-time step of unit
 * length, so the whole of Q arrives within the step.
 */
class EnergyRedistributor {
public:
    explicit EnergyRedistributor(RedistributionConfig config = RedistributionConfig{});

    /**
     * @brief Redistribute the energy of newly failed members
     *
     * @param energy Per-member energy, indexed like frame.members
     * @param newly_failed_ids Members that failed this step, processed in order
     * @param frame Frame with failed members already deactivated
     * @param warnings Receives anomaly warnings (may be nullptr)
     * @param step Step number stamped on warnings
     * @throws NumericError if the energy balance is violated
     * @throws std::invalid_argument if the field size does not match the frame
     */
    RedistributionResult redistribute(const Eigen::VectorXd& energy,
                                      const std::vector<int>& newly_failed_ids,
                                      const FrameData& frame,
                                      WarningList* warnings = nullptr,
                                      int step = -1) const;

    const RedistributionConfig& config() const { return config_; }

private:
    RedistributionConfig config_;

    /**
     * @brief Add Q to the receivers in proportion to their energy
     */
    static void spread(Eigen::VectorXd& energy, const std::vector<int>& receivers, double Q);
};

} // namespace collapsex
