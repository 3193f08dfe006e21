#include "collapsex/solver.hpp"
#include "collapsex/errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace collapsex {

void SolverSettings::validate() const {
    if (!(pivot_tolerance > 0.0) || pivot_tolerance >= 1.0) {
        throw ConfigurationError(CollapsexError::invalid_parameter(
            "solver.pivot_tolerance", "must be in (0, 1)"));
    }
    if (!(conditioning_warning >= pivot_tolerance) || conditioning_warning >= 1.0) {
        throw ConfigurationError(CollapsexError::invalid_parameter(
            "solver.conditioning_warning", "must be in [pivot_tolerance, 1)"));
    }
    if (!(residual_tolerance > 0.0)) {
        throw ConfigurationError(CollapsexError::invalid_parameter(
            "solver.residual_tolerance", "must be positive"));
    }
}

LinearSolver::LinearSolver(Method method, SolverSettings settings)
    : method_(method), settings_(settings) {}

void LinearSolver::mark_singular(const std::string& message) {
    singular_ = true;
    error_msg_ = message;
}

Eigen::VectorXd LinearSolver::solve(const Eigen::SparseMatrix<double>& K,
                                    const Eigen::VectorXd& F) {
    // Reset error state
    singular_ = false;
    poorly_conditioned_ = false;
    error_msg_.clear();
    min_pivot_ratio_ = 1.0;
    residual_ = 0.0;
    singular_dofs_.clear();

    if (K.rows() != K.cols()) {
        mark_singular("Stiffness matrix is not square");
        return Eigen::VectorXd::Zero(F.size());
    }

    if (K.rows() != F.size()) {
        mark_singular("Stiffness matrix and force vector dimensions mismatch");
        return Eigen::VectorXd::Zero(F.size());
    }

    if (check_singularity(K)) {
        return Eigen::VectorXd::Zero(F.size());
    }

    switch (method_) {
        case Method::SimplicialLDLT:
            return solve_simplicial_ldlt(K, F);
        case Method::SparseLU:
            return solve_sparse_lu(K, F);
        default:
            mark_singular("Unknown solver method");
            return Eigen::VectorXd::Zero(F.size());
    }
}

Eigen::VectorXd LinearSolver::solve_simplicial_ldlt(const Eigen::SparseMatrix<double>& K,
                                                    const Eigen::VectorXd& F) {
    Eigen::SimplicialLDLT<Eigen::SparseMatrix<double>> solver;
    solver.compute(K);

    if (solver.info() != Eigen::Success) {
        std::ostringstream oss;
        oss << "SimplicialLDLT decomposition failed (Eigen::ComputationInfo = " << solver.info() << ")";
        if (solver.info() == Eigen::NumericalIssue) {
            oss << " - zero pivot, structure has lost all stiffness along some DOF";
        }
        mark_singular(oss.str());
        return Eigen::VectorXd::Zero(F.size());
    }

    // Relative pivot per original DOF: D(P(i)) / K(i,i).
    // A mechanism drives the pivot of at least one DOF to round-off level.
    Eigen::VectorXd diag = K.diagonal();
    Eigen::VectorXd D = solver.vectorD();
    const auto& perm = solver.permutationP().indices();

    for (int i = 0; i < K.rows(); ++i) {
        double pivot = D(perm(i));
        double ratio = pivot / diag(i);
        if (!(ratio > settings_.pivot_tolerance)) {
            singular_dofs_.push_back(i);
        }
        min_pivot_ratio_ = std::min(min_pivot_ratio_, ratio);
    }

    if (!singular_dofs_.empty()) {
        std::ostringstream oss;
        oss << "Stiffness matrix is singular: " << singular_dofs_.size()
            << " DOF(s) with relative pivot below " << settings_.pivot_tolerance
            << " (min = " << min_pivot_ratio_ << "), first DOF " << singular_dofs_.front();
        mark_singular(oss.str());
        return Eigen::VectorXd::Zero(F.size());
    }

    poorly_conditioned_ = min_pivot_ratio_ < settings_.conditioning_warning;

    Eigen::VectorXd u = solver.solve(F);

    if (solver.info() != Eigen::Success) {
        std::ostringstream oss;
        oss << "SimplicialLDLT solve failed (Eigen::ComputationInfo = " << solver.info() << ")";
        mark_singular(oss.str());
        return Eigen::VectorXd::Zero(F.size());
    }

    if (!check_solution(K, F, u)) {
        return Eigen::VectorXd::Zero(F.size());
    }
    return u;
}

Eigen::VectorXd LinearSolver::solve_sparse_lu(const Eigen::SparseMatrix<double>& K,
                                              const Eigen::VectorXd& F) {
    Eigen::SparseLU<Eigen::SparseMatrix<double>> solver;
    solver.analyzePattern(K);
    solver.factorize(K);

    if (solver.info() != Eigen::Success) {
        std::ostringstream oss;
        oss << "SparseLU decomposition failed (Eigen::ComputationInfo = " << solver.info()
            << "): " << solver.lastErrorMessage();
        mark_singular(oss.str());
        return Eigen::VectorXd::Zero(F.size());
    }

    Eigen::VectorXd u = solver.solve(F);

    if (solver.info() != Eigen::Success) {
        std::ostringstream oss;
        oss << "SparseLU solve failed (Eigen::ComputationInfo = " << solver.info() << ")";
        mark_singular(oss.str());
        return Eigen::VectorXd::Zero(F.size());
    }

    if (!check_solution(K, F, u)) {
        return Eigen::VectorXd::Zero(F.size());
    }
    return u;
}

bool LinearSolver::check_singularity(const Eigen::SparseMatrix<double>& K) {
    // diagonal() includes structurally missing entries as zero
    Eigen::VectorXd diag = K.diagonal();

    for (int i = 0; i < diag.size(); ++i) {
        if (!(diag(i) > 0.0)) {
            singular_dofs_.push_back(i);
        }
    }

    if (!singular_dofs_.empty()) {
        std::ostringstream oss;
        oss << "Stiffness matrix is singular: " << singular_dofs_.size()
            << " DOF(s) with zero or negative diagonal stiffness, first DOF "
            << singular_dofs_.front();
        min_pivot_ratio_ = 0.0;
        mark_singular(oss.str());
        return true;
    }
    return false;
}

bool LinearSolver::check_solution(const Eigen::SparseMatrix<double>& K,
                                  const Eigen::VectorXd& F,
                                  const Eigen::VectorXd& u) {
    if (!u.allFinite()) {
        mark_singular("Solution contains non-finite values");
        return false;
    }

    double f_norm = F.norm();
    double r_norm = (K * u - F).norm();
    residual_ = f_norm > 0.0 ? r_norm / f_norm : r_norm;

    if (residual_ > settings_.residual_tolerance) {
        std::ostringstream oss;
        oss << "Solution residual " << residual_ << " exceeds tolerance "
            << settings_.residual_tolerance << " (ill-conditioned system)";
        mark_singular(oss.str());
        return false;
    }
    return true;
}

} // namespace collapsex
