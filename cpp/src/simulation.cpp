#include "collapsex/simulation.hpp"
#include "collapsex/assembler.hpp"
#include "collapsex/errors.hpp"
#include "collapsex/logger.hpp"
#include <cmath>
#include <sstream>

namespace collapsex {

std::string collapse_cause_to_string(CollapseCause cause) {
    switch (cause) {
        case CollapseCause::StructuralSingularity: return "StructuralSingularity";
        case CollapseCause::EntropyDetection: return "EntropyDetection";
        case CollapseCause::AllMembersFailed: return "AllMembersFailed";
        default: return "Unknown";
    }
}

void SimulationConfig::validate() const {
    if (max_steps < 1) {
        throw ConfigurationError(CollapsexError::invalid_parameter(
            "max_steps", "must be at least 1"));
    }
    if (!std::isfinite(initial_load_factor) || !std::isfinite(load_step)) {
        throw ConfigurationError(CollapsexError::invalid_parameter(
            "load_factor", "initial load factor and load step must be finite"));
    }
    if (load_step < 0.0) {
        throw ConfigurationError(CollapsexError::invalid_parameter(
            "load_step", "must be non-negative"));
    }
    if (!(energy_tolerance >= 0.0)) {
        throw ConfigurationError(CollapsexError::invalid_parameter(
            "energy_tolerance", "must be non-negative"));
    }
    detector.validate();
    failure.validate();
    redistribution.validate();
    solver.validate();
}

Outcome Outcome::collapsed_at(int step, CollapseCause cause, double load_factor,
                              std::vector<int> active_members) {
    Outcome o;
    o.kind = Kind::Collapsed;
    o.step = step;
    o.cause = cause;
    o.load_factor = load_factor;
    o.active_members = std::move(active_members);
    return o;
}

Outcome Outcome::completed(int final_step) {
    Outcome o;
    o.kind = Kind::CompletedWithoutCollapse;
    o.step = final_step;
    return o;
}

std::string Outcome::to_string() const {
    std::ostringstream oss;
    if (collapsed()) {
        oss << "Collapsed at step " << step << " (" << collapse_cause_to_string(cause)
            << ", load factor " << load_factor << ", " << active_members.size()
            << " active member(s))";
    } else {
        oss << "Completed without collapse (final step " << step << ")";
    }
    return oss.str();
}

std::vector<int> SimulationResult::failed_sequence() const {
    std::vector<int> ids;
    ids.reserve(failure_log.size());
    for (const auto& e : failure_log) ids.push_back(e.member_id);
    return ids;
}

std::string SimulationResult::summary() const {
    std::ostringstream oss;
    oss << outcome.to_string() << "\n";
    oss << "Steps recorded: " << steps.size() << "\n";
    oss << "Failures: " << failure_log.size();
    for (const auto& e : failure_log) {
        oss << "\n  step " << e.step << ": member " << e.member_id
            << " (ratio " << e.stress_ratio << ", load factor " << e.load_factor << ")";
    }
    oss << "\n" << warnings.summary();
    return oss.str();
}

Simulation::Simulation(const FrameData& frame, SimulationConfig config)
    : initial_frame_(frame), frame_(frame), config_(std::move(config)) {
    initial_frame_.validate();
    config_.validate();
}

SimulationResult Simulation::run() {
    frame_ = initial_frame_;
    state_ = SimulationState{};
    state_.active_members = frame_.active_member_ids();

    EquilibriumSolver solver(config_.solver, config_.solver_method, config_.energy_tolerance);
    std::unique_ptr<CollapseDetector> detector = make_detector(config_.detector);

    logger()->info("Starting run '{}': {} nodes, {} members, {} steps, detector {}",
                   frame_.name, frame_.num_nodes(), frame_.num_members(),
                   config_.max_steps, detector->name());

    SimulationResult result;
    std::optional<Outcome> outcome;
    for (int n = 0; n < config_.max_steps && !outcome; ++n) {
        outcome = step(n, solver, *detector, result.steps);
    }

    result.outcome = outcome ? *outcome : Outcome::completed(config_.max_steps - 1);
    if (result.outcome.collapsed()) {
        state_.collapse_step = result.outcome.step;
    }
    result.failure_log = state_.failure_log;
    result.warnings = state_.warnings;

    logger()->info("Run '{}' finished: {}", frame_.name, result.outcome.to_string());
    return result;
}

std::optional<Outcome> Simulation::step(int n, EquilibriumSolver& solver,
                                        CollapseDetector& detector,
                                        std::vector<StepRecord>& records) {
    state_.load_factor = config_.load_factor_at(n);
    logger()->debug("Step {}: load factor {:.4f}, {} active member(s)",
                    n, state_.load_factor, state_.active_members.size());

    Assembler assembler(frame_);
    AssembledSystem system = assembler.assemble(state_.active_members, state_.load_factor);

    EquilibriumResult eq = solver.solve(frame_, system, n);
    for (const auto& w : eq.warnings) state_.warnings.add(w);

    if (eq.singular) {
        logger()->info("Step {}: structure collapsed, stiffness matrix singular ({})",
                       n, eq.message);
        Outcome o = Outcome::collapsed_at(n, CollapseCause::StructuralSingularity,
                                          state_.load_factor, state_.active_members);
        o.message = eq.message;
        return o;
    }

    Eigen::VectorXd energy = Eigen::VectorXd::Zero(frame_.num_members());
    for (const auto& r : eq.responses) {
        energy(frame_.member_index(r.member_id)) = r.strain_energy;
    }

    FailureDetector failure(config_.failure);
    std::vector<FailureEvent> events = failure.evaluate(frame_, eq.responses, n, state_.load_factor);
    failure.apply(frame_, events, static_cast<int>(state_.failure_log.size()));

    std::vector<int> failed_ids;
    for (const auto& e : events) {
        failed_ids.push_back(e.member_id);
        state_.failure_log.push_back(e);
    }
    state_.active_members = frame_.active_member_ids();

    if (!failed_ids.empty()) {
        EnergyRedistributor redistributor(config_.redistribution);
        energy = redistributor.redistribute(energy, failed_ids, frame_, &state_.warnings, n).energy;
    }

    EntropyEvaluator evaluator;
    const double* previous = state_.entropy_history.empty()
                                 ? nullptr
                                 : &state_.entropy_history.back().entropy;
    EntropyMetrics metrics = evaluator.evaluate(energy, frame_, previous, &state_.warnings, n);

    StepRecord record;
    record.step = n;
    record.load_factor = state_.load_factor;
    record.displacements = eq.u;
    record.strain_energy = energy;
    record.entropy = metrics.entropy;
    record.entropy_rate = metrics.entropy_rate;
    record.normalized_entropy = metrics.normalized_entropy;
    record.gini = metrics.gini;
    record.total_energy = metrics.total_energy;
    record.active_members = static_cast<int>(state_.active_members.size());
    record.newly_failed = failed_ids;

    Eigen::VectorXd active_energy(state_.active_members.size());
    for (size_t k = 0; k < state_.active_members.size(); ++k) {
        active_energy(k) = energy(frame_.member_index(state_.active_members[k]));
    }
    record.top_localized = most_localized_members(state_.active_members,
                                                  energy_shares(active_energy), 3);

    // The first step has no rate
    bool detected = previous != nullptr && detector.observe(n, metrics.entropy_rate);

    state_.energy_history.push_back(energy);
    state_.entropy_history.push_back(metrics);
    records.push_back(std::move(record));

    logger()->debug("Step {}: S = {:.6f}, dS/dt = {:.6f}, S/Smax = {:.4f}, Gini = {:.4f}",
                    n, metrics.entropy, metrics.entropy_rate, metrics.normalized_entropy,
                    metrics.gini);

    if (config_.stop_when_all_failed && state_.active_members.empty()) {
        logger()->info("Step {}: all members have failed", n);
        return Outcome::collapsed_at(n, CollapseCause::AllMembersFailed,
                                     state_.load_factor, state_.active_members);
    }

    if (detected) {
        logger()->info("Step {}: collapse detected by {} detector (dS/dt = {:.6f})",
                       n, detector.name(), metrics.entropy_rate);
        return Outcome::collapsed_at(n, CollapseCause::EntropyDetection,
                                     state_.load_factor, state_.active_members);
    }

    return std::nullopt;
}

SimulationResult run(const FrameData& frame, const SimulationConfig& config) {
    Simulation sim(frame, config);
    return sim.run();
}

SimulationResult run(const FrameData& frame, const std::string& method,
                     SimulationConfig config) {
    config.detector.method = parse_detection_method(method);
    return run(frame, config);
}

} // namespace collapsex
