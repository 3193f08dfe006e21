#pragma once

#include "collapsex/frame_data.hpp"
#include "collapsex/local_axes.hpp"
#include "collapsex/member.hpp"

#include <utility>
#include <Eigen/Dense>

namespace collapsex {

using Matrix12d = Eigen::Matrix<double, 12, 12>;
using Vector12d = Eigen::Matrix<double, 12, 1>;

/**
 * @brief Internal forces at one end of a member, in local axes
 *
 * Sign convention: axial force N is positive in tension. Shears and
 * moments follow the local axes of the member.
 */
struct EndForces {
    double N = 0.0;   ///< Axial force [N]
    double Vy = 0.0;  ///< Shear along local y [N]
    double Vz = 0.0;  ///< Shear along local z [N]
    double My = 0.0;  ///< Moment about local y [N·m]
    double Mz = 0.0;  ///< Moment about local z [N·m]

    /**
     * @brief Resultant bending moment sqrt(My² + Mz²) [N·m]
     */
    double bending_moment() const;
};

/*
 * 3D Euler-Bernoulli frame element with 12 DOFs
 * (6 per node: 3 translations + 3 rotations).
 *
 * DOF ordering: [ui, vi, wi, θxi, θyi, θzi, uj, vj, wj, θxj, θyj, θzj]
 *
 * Axial and bending (both local planes, same I) are uncoupled. Torsion is
 * not modelled: the θx rows and columns carry zero stiffness.
 */

/**
 * @brief Axial part of the local stiffness matrix (EA/L terms)
 */
Matrix12d local_axial_stiffness(double E, double A, double L);

/**
 * @brief Bending part of the local stiffness matrix
 *
 * 12EI/L³, 6EI/L², 4EI/L and 2EI/L terms for bending in the local x-y
 * plane (v, θz) and the local x-z plane (w, θy).
 */
Matrix12d local_bending_stiffness(double E, double I, double L);

/**
 * @brief Full local stiffness matrix of a member (axial + bending)
 *
 * @param member Member supplying E, A and I
 * @param L Member length [m]
 */
Matrix12d local_stiffness_matrix(const Member& member, double L);

/**
 * @brief Transformation matrix T (global to local), 4 copies of the
 *        direction-cosine matrix on the diagonal
 */
Matrix12d transformation_matrix(const LocalAxes& axes);

/**
 * @brief Member stiffness in global coordinates: K = Tᵀ k T
 */
Matrix12d global_stiffness_matrix(const FrameData& frame, const Member& member);

/**
 * @brief Extract a member's 12 DOF displacements and rotate them to local axes
 *
 * @param frame Frame supplying geometry and DOF numbering
 * @param member Member to extract
 * @param global_displacements Full global displacement vector
 * @return u_local = T · u_global
 */
Vector12d member_displacements_local(const FrameData& frame, const Member& member,
                                     const Eigen::VectorXd& global_displacements);

/**
 * @brief Member end forces from local stiffness and local displacements
 *
 * f = k·u, end i carries -f[0..5] and end j carries f[6..11] so that both
 * ends report the same axial force in tension-positive convention.
 *
 * @return Pair of (end i forces, end j forces)
 */
std::pair<EndForces, EndForces> compute_end_forces(const Matrix12d& k_local,
                                                   const Vector12d& u_local);

} // namespace collapsex
