#pragma once

#include "collapsex/frame_data.hpp"
#include "collapsex/warnings.hpp"

#include <utility>
#include <vector>
#include <Eigen/Dense>

namespace collapsex {

/**
 * @brief Entropy measures of the strain-energy distribution at one step
 */
struct EntropyMetrics {
    double entropy = 0.0;             ///< S = -Σ p ln p [nats]
    double max_entropy = 0.0;         ///< ln n, 0 for n <= 1
    double normalized_entropy = 0.0;  ///< S / S_max in [0, 1]
    double entropy_rate = 0.0;        ///< dS/dt, 0 on the first step
    double gini = 0.0;                ///< Gini index of the shares in [0, 1)
    double total_energy = 0.0;        ///< Σ U over the population [J]
    int population = 0;               ///< Number of members in the population
    bool zero_energy = false;         ///< True if the total energy was zero
};

/**
 * @brief Energy fractions p_i = U_i / ΣU, all zero when ΣU = 0
 */
Eigen::VectorXd energy_shares(const Eigen::VectorXd& energy);

/**
 * @brief Shannon entropy of a share vector with 0·ln 0 = 0
 */
double shannon_entropy(const Eigen::VectorXd& shares);

/**
 * @brief Maximum entropy ln n of n members (0 for n <= 1)
 */
double max_entropy(int n);

/**
 * @brief Gini index of a non-negative distribution
 *
 * G = 2 Σ i·x_(i) / (n Σ x) - (n + 1) / n over the ascending sort x_(1..n).
 * Returns 0 for n <= 1 or a zero total.
 */
double gini_index(const Eigen::VectorXd& values);

/**
 * @brief Members carrying the largest energy fractions
 *
 * @param member_ids IDs matching the entries of shares
 * @param shares Energy fractions
 * @param top_n Maximum number of entries returned
 * @return (member id, share) pairs, largest first, ties by lower id
 */
std::vector<std::pair<int, double>> most_localized_members(const std::vector<int>& member_ids,
                                                           const Eigen::VectorXd& shares,
                                                           int top_n = 3);

/**
 * @brief Computes entropy metrics over the active members of a frame
 */
class EntropyEvaluator {
public:
    /**
     * @brief Evaluate the metrics of one step
     *
     * @param energy Per-member energy indexed like frame.members
     * @param frame Frame whose active flags define the population
     * @param previous Entropy of the previous step, nullptr on the first step
     * @param warnings Receives a warning when the total energy is zero
     * @param step Step number stamped on warnings
     */
    EntropyMetrics evaluate(const Eigen::VectorXd& energy, const FrameData& frame,
                            const double* previous = nullptr,
                            WarningList* warnings = nullptr, int step = -1) const;

    /**
     * @brief Evaluate the metrics of an energy population directly
     */
    EntropyMetrics evaluate(const Eigen::VectorXd& population_energy,
                            const double* previous = nullptr,
                            WarningList* warnings = nullptr, int step = -1) const;
};

} // namespace collapsex
