#ifndef COLLAPSEX_BOUNDARY_CONDITION_HPP
#define COLLAPSEX_BOUNDARY_CONDITION_HPP

#include <utility>
#include <vector>
#include <Eigen/Sparse>
#include "collapsex/frame_data.hpp"

namespace collapsex {

/**
 * @brief Boundary Condition Handler
 *
 * Collects the restrained global DOFs of a frame and enforces them on an
 * assembled system by elimination:
 *
 *   K(i, :) = 0, K(:, i) = 0, K(i, i) = 1, F(i) = 0
 *
 * for every fixed DOF i. The solved displacement at a fixed DOF is then
 * exactly zero, and any load supplied there is discarded.
 */
class BCHandler {
public:
    BCHandler() = default;

    /**
     * @brief Collect the fixed DOFs flagged on the frame's nodes
     */
    explicit BCHandler(const FrameData& frame);

    /**
     * @brief Add a fixed global DOF
     * @param global_dof Global DOF number
     */
    void add_fixed_dof(int global_dof);

    /**
     * @brief Apply boundary conditions to the system matrices
     * @param K Global stiffness matrix
     * @param F Global force vector
     * @return Pair of (modified_K, modified_F)
     *
     * Symmetry of K is preserved.
     */
    std::pair<Eigen::SparseMatrix<double>, Eigen::VectorXd> apply_to_system(
        const Eigen::SparseMatrix<double>& K,
        const Eigen::VectorXd& F) const;

    /**
     * @brief Sorted list of fixed global DOFs
     */
    const std::vector<int>& get_fixed_dofs() const { return fixed_dofs_; }

    int num_fixed_dofs() const { return static_cast<int>(fixed_dofs_.size()); }

    bool is_fixed(int global_dof) const;

    void clear() { fixed_dofs_.clear(); }

private:
    std::vector<int> fixed_dofs_;  ///< Sorted, unique fixed global DOFs
};

}  // namespace collapsex

#endif  // COLLAPSEX_BOUNDARY_CONDITION_HPP
