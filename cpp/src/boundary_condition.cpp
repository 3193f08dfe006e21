#include "collapsex/boundary_condition.hpp"
#include <algorithm>
#include <stdexcept>

namespace collapsex {

BCHandler::BCHandler(const FrameData& frame)
    : fixed_dofs_(frame.fixed_global_dofs()) {
}

void BCHandler::add_fixed_dof(int global_dof) {
    if (global_dof < 0) {
        throw std::invalid_argument("global_dof must be non-negative");
    }
    auto it = std::lower_bound(fixed_dofs_.begin(), fixed_dofs_.end(), global_dof);
    if (it != fixed_dofs_.end() && *it == global_dof) {
        return;
    }
    fixed_dofs_.insert(it, global_dof);
}

bool BCHandler::is_fixed(int global_dof) const {
    return std::binary_search(fixed_dofs_.begin(), fixed_dofs_.end(), global_dof);
}

std::pair<Eigen::SparseMatrix<double>, Eigen::VectorXd> BCHandler::apply_to_system(
    const Eigen::SparseMatrix<double>& K,
    const Eigen::VectorXd& F) const {

    int n = static_cast<int>(K.rows());
    if (K.cols() != n || F.size() != n) {
        throw std::invalid_argument("Stiffness matrix and force vector dimensions mismatch");
    }

    std::vector<bool> fixed(n, false);
    for (int dof : fixed_dofs_) {
        if (dof >= n) {
            throw std::out_of_range("Fixed DOF " + std::to_string(dof) +
                                    " exceeds system size " + std::to_string(n));
        }
        fixed[dof] = true;
    }

    std::vector<Eigen::Triplet<double>> triplets;
    triplets.reserve(K.nonZeros() + fixed_dofs_.size());

    // Copy entries outside fixed rows and columns
    for (int k = 0; k < K.outerSize(); ++k) {
        for (Eigen::SparseMatrix<double>::InnerIterator it(K, k); it; ++it) {
            if (fixed[it.row()] || fixed[it.col()]) continue;
            triplets.emplace_back(it.row(), it.col(), it.value());
        }
    }

    Eigen::VectorXd F_modified = F;
    for (int dof : fixed_dofs_) {
        triplets.emplace_back(dof, dof, 1.0);
        F_modified(dof) = 0.0;
    }

    Eigen::SparseMatrix<double> K_modified(n, n);
    K_modified.setFromTriplets(triplets.begin(), triplets.end());

    return std::make_pair(K_modified, F_modified);
}

}  // namespace collapsex
