#pragma once

#include "collapsex/assembler.hpp"
#include "collapsex/beam_element.hpp"
#include "collapsex/frame_data.hpp"
#include "collapsex/solver.hpp"
#include "collapsex/warnings.hpp"

#include <string>
#include <vector>
#include <Eigen/Dense>

namespace collapsex {

/**
 * @brief Static response of one active member
 */
struct MemberResponse {
    int member_id = -1;
    double axial_energy = 0.0;    ///< ½ uᵀ k_axial u [J]
    double bending_energy = 0.0;  ///< ½ uᵀ k_bending u [J]
    double strain_energy = 0.0;   ///< Total, never negative after clamping [J]
    EndForces end_i;              ///< Forces at node_i (local axes)
    EndForces end_j;              ///< Forces at node_j (local axes)
};

/**
 * @brief Result of one equilibrium solve
 *
 * When singular is true, u is zero, responses is empty and message holds
 * the solver's diagnosis.
 */
struct EquilibriumResult {
    bool singular = false;
    std::string message;
    Eigen::VectorXd u;                     ///< Global displacements [m, rad]
    std::vector<MemberResponse> responses; ///< One per active member, member order
    std::vector<CollapsexWarning> warnings;

    /**
     * @brief Response of a member, nullptr if it was not active
     */
    const MemberResponse* find(int member_id) const;
};

/**
 * @brief Solves K·u = F and post-processes member energies and end forces
 */
class EquilibriumSolver {
public:
    /**
     * @param settings Singularity detection settings
     * @param method Factorisation used by the linear solver
     * @param energy_tolerance Negative energies smaller than this fraction of
     *        the largest member energy are clamped silently
     */
    explicit EquilibriumSolver(SolverSettings settings = SolverSettings{},
                               LinearSolver::Method method = LinearSolver::Method::SimplicialLDLT,
                               double energy_tolerance = 1e-9);

    /**
     * @brief Solve an assembled system for a frame
     *
     * @param frame Frame the system was assembled from
     * @param system Constrained system (K, F, active members)
     * @param step Step number stamped on warnings (-1 if none)
     * @return Displacements and per-member responses, or a singular result
     */
    EquilibriumResult solve(const FrameData& frame, const AssembledSystem& system,
                            int step = -1);

    const LinearSolver& linear_solver() const { return solver_; }

private:
    LinearSolver solver_;
    double energy_tolerance_;
};

/**
 * @brief Strain energy and end forces of one member from global displacements
 *
 * Energies are not clamped.
 */
MemberResponse compute_member_response(const FrameData& frame, const Member& member,
                                       const Eigen::VectorXd& u);

} // namespace collapsex
