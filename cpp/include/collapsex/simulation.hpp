#pragma once

#include "collapsex/collapse_detector.hpp"
#include "collapsex/entropy.hpp"
#include "collapsex/equilibrium.hpp"
#include "collapsex/failure.hpp"
#include "collapsex/frame_data.hpp"
#include "collapsex/redistribution.hpp"
#include "collapsex/solver.hpp"
#include "collapsex/warnings.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <Eigen/Dense>

namespace collapsex {

/**
 * @brief Parameters of one progressive-collapse run
 */
struct SimulationConfig {
    int max_steps = 50;                 ///< Number of steps (0 .. max_steps-1)
    double initial_load_factor = 1.0;   ///< Load factor at step 0
    double load_step = 0.0;             ///< Increment per step (0 holds the design load)
    DetectorConfig detector;
    FailureConfig failure;
    RedistributionConfig redistribution;
    SolverSettings solver;
    LinearSolver::Method solver_method = LinearSolver::Method::SimplicialLDLT;
    double energy_tolerance = 1e-9;     ///< Relative tolerance for negative energies
    bool stop_when_all_failed = true;   ///< End the run once no member is left

    /**
     * @brief Load factor applied at a step
     */
    double load_factor_at(int step) const { return initial_load_factor + step * load_step; }

    /**
     * @throws ConfigurationError if any parameter is out of range
     */
    void validate() const;
};

/**
 * @brief Everything observed at one step
 */
struct StepRecord {
    int step = 0;
    double load_factor = 0.0;
    Eigen::VectorXd displacements;  ///< Global displacements [m, rad]
    Eigen::VectorXd strain_energy;  ///< Per member in frame order, after redistribution [J]
    double entropy = 0.0;
    double entropy_rate = 0.0;
    double normalized_entropy = 0.0;
    double gini = 0.0;
    double total_energy = 0.0;
    int active_members = 0;         ///< Active at the end of the step
    std::vector<int> newly_failed;  ///< Members failing at this step
    std::vector<std::pair<int, double>> top_localized;  ///< Largest energy shares
};

enum class CollapseCause {
    StructuralSingularity,  ///< Stiffness matrix became singular
    EntropyDetection,       ///< Collapse detector flagged the entropy rate
    AllMembersFailed        ///< No active member left
};

std::string collapse_cause_to_string(CollapseCause cause);

/**
 * @brief Terminal state of a run
 *
 * Either Collapsed (step, cause, load factor, surviving members) or
 * CompletedWithoutCollapse (final step).
 */
struct Outcome {
    enum class Kind { Collapsed, CompletedWithoutCollapse };

    Kind kind = Kind::CompletedWithoutCollapse;
    int step = -1;                     ///< Collapse step, or final step
    CollapseCause cause = CollapseCause::StructuralSingularity;  ///< Only meaningful if collapsed
    double load_factor = 0.0;
    std::vector<int> active_members;   ///< Active members at collapse
    std::string message;               ///< Solver diagnosis for a singular collapse

    bool collapsed() const { return kind == Kind::Collapsed; }

    static Outcome collapsed_at(int step, CollapseCause cause, double load_factor,
                                std::vector<int> active_members);

    static Outcome completed(int final_step);

    std::string to_string() const;
};

/**
 * @brief Mutable state of a run, owned by the Simulation
 */
struct SimulationState {
    double load_factor = 0.0;
    std::vector<int> active_members;
    std::vector<Eigen::VectorXd> energy_history;
    std::vector<EntropyMetrics> entropy_history;
    std::vector<FailureEvent> failure_log;
    std::optional<int> collapse_step;
    WarningList warnings;
};

/**
 * @brief Step records and outcome of a finished run
 */
struct SimulationResult {
    std::vector<StepRecord> steps;
    std::vector<FailureEvent> failure_log;
    Outcome outcome;
    WarningList warnings;

    /**
     * @brief Failed member IDs in failure order
     */
    std::vector<int> failed_sequence() const;

    /**
     * @brief Multi-line text summary of the run
     */
    std::string summary() const;
};

/**
 * @brief Progressive-collapse step loop for one frame
 *
 * Each step: set the load factor, assemble the active members, solve,
 * remove the most overstressed member, redistribute its energy, evaluate
 * entropy and feed the entropy rate to the collapse detector.
 *
 * The Simulation works on its own copy of the frame, so the caller's frame
 * is never modified and independent runs can execute concurrently.
 *
 * Usage:
 *   SimulationConfig config;
 *   config.load_step = 0.1;
 *   Simulation sim(frame, config);
 *   SimulationResult result = sim.run();
 */
class Simulation {
public:
    /**
     * @brief Validate and copy the frame and configuration
     * @throws ConfigurationError if either is invalid
     */
    Simulation(const FrameData& frame, SimulationConfig config);

    /**
     * @brief Execute all steps until collapse or max_steps
     *
     * Calling run() again restarts from the intact frame.
     */
    SimulationResult run();

    const FrameData& frame() const { return frame_; }
    const SimulationState& state() const { return state_; }
    const SimulationConfig& config() const { return config_; }

private:
    FrameData initial_frame_;
    FrameData frame_;
    SimulationConfig config_;
    SimulationState state_;

    /**
     * @brief Execute one step, appending its record
     * @return Outcome if the step is terminal
     */
    std::optional<Outcome> step(int n, EquilibriumSolver& solver, CollapseDetector& detector,
                                std::vector<StepRecord>& records);
};

/**
 * @brief Validate and run a simulation on a private copy of the frame
 */
SimulationResult run(const FrameData& frame, const SimulationConfig& config);

/**
 * @brief Convenience overload selecting the detection method by name
 * @throws ConfigurationError for an unknown method name
 */
SimulationResult run(const FrameData& frame, const std::string& method,
                     SimulationConfig config = SimulationConfig{});

} // namespace collapsex
