#include "collapsex/redistribution.hpp"
#include "collapsex/errors.hpp"
#include "collapsex/logger.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace collapsex {

void RedistributionConfig::validate() const {
    if (!(dissipation_fraction >= 0.0 && dissipation_fraction <= 1.0)) {
        throw ConfigurationError(CollapsexError::invalid_parameter(
            "redistribution.dissipation_fraction", "must be in [0, 1]"));
    }
    if (!(conservation_tolerance > 0.0) || !std::isfinite(conservation_tolerance)) {
        throw ConfigurationError(CollapsexError::invalid_parameter(
            "redistribution.conservation_tolerance", "must be finite and positive"));
    }
}

EnergyRedistributor::EnergyRedistributor(RedistributionConfig config) : config_(config) {}

void EnergyRedistributor::spread(Eigen::VectorXd& energy, const std::vector<int>& receivers,
                                 double Q) {
    double total = 0.0;
    for (int idx : receivers) total += energy(idx);

    Eigen::VectorXd source = Eigen::VectorXd::Zero(energy.size());
    for (int idx : receivers) {
        double share = total > 0.0 ? energy(idx) / total
                                   : 1.0 / static_cast<double>(receivers.size());
        source(idx) = share * Q;
    }

    const double dt = 1.0;
    energy += dt * source;
}

RedistributionResult EnergyRedistributor::redistribute(const Eigen::VectorXd& energy,
                                                       const std::vector<int>& newly_failed_ids,
                                                       const FrameData& frame,
                                                       WarningList* warnings,
                                                       int step) const {
    if (energy.size() != frame.num_members()) {
        throw std::invalid_argument("Energy field size does not match member count");
    }

    RedistributionResult result;
    result.energy = energy;
    result.total_before = energy.sum();

    std::vector<int> survivors;
    for (int i = 0; i < frame.num_members(); ++i) {
        if (frame.members[i].active) survivors.push_back(i);
    }

    for (int failed_id : newly_failed_ids) {
        int f = frame.member_index(failed_id);
        if (f < 0) {
            throw std::out_of_range("Unknown failed member " + std::to_string(failed_id));
        }

        double U_f = result.energy(f);
        double Q = (1.0 - config_.dissipation_fraction) * U_f;
        result.dissipated += U_f - Q;
        result.energy(f) = 0.0;

        std::vector<int> receivers;
        for (int id : frame.adjacent_members(failed_id, true)) {
            receivers.push_back(frame.member_index(id));
        }

        if (receivers.empty() && !survivors.empty()) {
            receivers = survivors;
            CollapsexWarning warn = CollapsexWarning::no_surviving_neighbour(failed_id);
            warn.step = step;
            logger()->warn("Step {}: member {} has no surviving neighbour, "
                           "spreading {:.6e} J over {} survivors",
                           step, failed_id, Q, survivors.size());
            if (warnings) warnings->add(std::move(warn));
        }

        if (receivers.empty()) {
            result.dissipated += Q;
            CollapsexWarning warn = CollapsexWarning::energy_lost(failed_id, Q);
            warn.step = step;
            logger()->warn("Step {}: no surviving member, {:.6e} J of member {} dissipated",
                           step, Q, failed_id);
            if (warnings) warnings->add(std::move(warn));
            continue;
        }

        spread(result.energy, receivers, Q);
        logger()->debug("Step {}: member {} released {:.6e} J to {} member(s)",
                        step, failed_id, Q, receivers.size());
    }

    result.total_after = result.energy.sum();

    if (!std::isfinite(result.total_after)) {
        CollapsexError err(ErrorCode::NUMERICAL_OVERFLOW,
                           "Non-finite energy total after redistribution");
        err.involved_members = newly_failed_ids;
        err.details["total_before"] = std::to_string(result.total_before);
        err.suggestion = "Check member energies for overflow or NaN values.";
        throw NumericError(err);
    }

    double expected = result.total_before - result.dissipated;
    double allowed = config_.conservation_tolerance * std::max(1.0, std::abs(result.total_before));
    if (std::abs(result.total_after - expected) > allowed) {
        CollapsexError err(ErrorCode::ENERGY_NOT_CONSERVED,
                           "Energy balance violated during redistribution");
        err.involved_members = newly_failed_ids;
        err.details["total_before"] = std::to_string(result.total_before);
        err.details["total_after"] = std::to_string(result.total_after);
        err.details["dissipated"] = std::to_string(result.dissipated);
        throw NumericError(err);
    }

    return result;
}

} // namespace collapsex
