#include "collapsex/equilibrium.hpp"
#include "collapsex/logger.hpp"
#include <algorithm>
#include <cmath>

namespace collapsex {

const MemberResponse* EquilibriumResult::find(int member_id) const {
    for (const auto& r : responses) {
        if (r.member_id == member_id) return &r;
    }
    return nullptr;
}

MemberResponse compute_member_response(const FrameData& frame, const Member& member,
                                       const Eigen::VectorXd& u) {
    double L = frame.member_length(member);
    Matrix12d k_axial = local_axial_stiffness(member.material->E, member.section->A, L);
    Matrix12d k_bending = local_bending_stiffness(member.material->E, member.section->I, L);
    Vector12d u_local = member_displacements_local(frame, member, u);

    MemberResponse response;
    response.member_id = member.id;
    response.axial_energy = 0.5 * u_local.dot(k_axial * u_local);
    response.bending_energy = 0.5 * u_local.dot(k_bending * u_local);
    response.strain_energy = response.axial_energy + response.bending_energy;

    auto forces = compute_end_forces(k_axial + k_bending, u_local);
    response.end_i = forces.first;
    response.end_j = forces.second;
    return response;
}

EquilibriumSolver::EquilibriumSolver(SolverSettings settings, LinearSolver::Method method,
                                     double energy_tolerance)
    : solver_(method, settings), energy_tolerance_(energy_tolerance) {}

EquilibriumResult EquilibriumSolver::solve(const FrameData& frame, const AssembledSystem& system,
                                           int step) {
    EquilibriumResult result;
    result.u = solver_.solve(system.K, system.F);

    if (solver_.is_singular()) {
        result.singular = true;
        result.message = solver_.get_error_message();
        logger()->debug("Step {}: {}", step, result.message);
        return result;
    }

    if (solver_.is_poorly_conditioned()) {
        CollapsexWarning warn = CollapsexWarning::near_singularity(solver_.get_min_pivot_ratio());
        warn.step = step;
        logger()->warn("Step {}: stiffness matrix poorly conditioned (min pivot ratio {:.3e})",
                       step, solver_.get_min_pivot_ratio());
        result.warnings.push_back(warn);
    }

    result.responses.reserve(system.active_members.size());
    double max_energy = 0.0;
    for (int id : system.active_members) {
        const Member* member = frame.find_member(id);
        result.responses.push_back(compute_member_response(frame, *member, result.u));
        max_energy = std::max(max_energy, std::abs(result.responses.back().strain_energy));
    }

    // Round-off can leave tiny negative energies; anything larger is an anomaly
    double limit = energy_tolerance_ * max_energy;
    for (auto& r : result.responses) {
        if (r.strain_energy >= 0.0) continue;
        if (-r.strain_energy > limit) {
            CollapsexWarning warn = CollapsexWarning::negative_strain_energy(r.member_id, r.strain_energy);
            warn.step = step;
            logger()->warn("Step {}: member {} has negative strain energy {:.6e} J, clamped to zero",
                           step, r.member_id, r.strain_energy);
            result.warnings.push_back(warn);
        }
        r.strain_energy = 0.0;
    }

    return result;
}

} // namespace collapsex
