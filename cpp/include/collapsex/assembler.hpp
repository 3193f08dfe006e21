#pragma once

#include <Eigen/Sparse>
#include <vector>
#include "collapsex/frame_data.hpp"
#include "collapsex/boundary_condition.hpp"

namespace collapsex {

/**
 * @brief Assembled and constrained linear system K·u = F
 */
struct AssembledSystem {
    Eigen::SparseMatrix<double> K;   ///< Global stiffness with boundary conditions applied
    Eigen::VectorXd F;               ///< Load vector with fixed entries zeroed
    std::vector<int> fixed_dofs;     ///< Sorted fixed global DOFs
    std::vector<int> active_members; ///< Member IDs that contributed stiffness
    double load_factor = 1.0;        ///< Load factor applied to F
};

/**
 * @brief Assembles the global stiffness matrix of a frame
 *
 * Only active members contribute. Members removed by failure simply drop
 * out of the sum, which can leave DOFs without any stiffness; that makes
 * the matrix singular, which the solver reports.
 *
 * Uses a triplet list for sparse assembly.
 */
class Assembler {
public:
    /**
     * @brief Construct an Assembler for a frame
     * @param frame Frame supplying geometry, members and loads
     */
    explicit Assembler(const FrameData& frame);

    /**
     * @brief Assemble the global stiffness matrix from a set of members
     * @param member_ids IDs of members to include
     * @return Sparse global stiffness matrix (6·nodes × 6·nodes)
     *
     * The assembled matrix (before boundary conditions) is:
     * - Symmetric (K_ij = K_ji)
     * - Positive semi-definite
     */
    Eigen::SparseMatrix<double> assemble_stiffness(const std::vector<int>& member_ids) const;

    /**
     * @brief Assemble the global stiffness matrix from the active members
     */
    Eigen::SparseMatrix<double> assemble_stiffness() const;

    /**
     * @brief Assemble K and F for a member set and load factor, then apply
     *        the frame's boundary conditions
     * @param member_ids IDs of members to include
     * @param load_factor Multiplier on all nodal loads
     * @throws std::out_of_range if a member ID is unknown
     */
    AssembledSystem assemble(const std::vector<int>& member_ids, double load_factor) const;

    const FrameData& frame() const { return frame_; }

private:
    const FrameData& frame_;

    /**
     * @brief Add element matrix to triplet list
     *
     * For each entry K_e(i,j), adds triplet (loc[i], loc[j], K_e(i,j)).
     * setFromTriplets sums duplicates.
     */
    void add_element_matrix(
        std::vector<Eigen::Triplet<double>>& triplets,
        const Eigen::MatrixXd& element_matrix,
        const std::vector<int>& loc_array) const;
};

} // namespace collapsex
