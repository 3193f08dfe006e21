#pragma once

#include <Eigen/Sparse>
#include <Eigen/SparseCholesky>
#include <Eigen/SparseLU>
#include <string>
#include <vector>

namespace collapsex {

/**
 * @brief Settings controlling singularity detection in LinearSolver
 */
struct SolverSettings {
    /// Relative pivot |D_i| / K_ii below which a DOF is treated as unrestrained
    double pivot_tolerance = 1e-10;

    /// Relative pivot below which the system is flagged as poorly conditioned
    double conditioning_warning = 1e-7;

    /// Maximum accepted relative residual ||K·u - F|| / ||F||
    double residual_tolerance = 1e-6;

    /**
     * @brief Check settings for consistency
     * @throws ConfigurationError on non-positive tolerances
     */
    void validate() const;
};

/**
 * @brief Linear solver for the constrained frame system
 *
 * Solves K * u = F where:
 * - K: Global stiffness matrix [N/m] (sparse, symmetric)
 * - F: Global force vector [N]
 * - u: Global displacement vector [m, rad]
 *
 * Supported methods:
 * - SimplicialLDLT: Direct solver for symmetric matrices (default). Its
 *   pivots give a per-DOF conditioning measure.
 * - SparseLU: Direct solver for general sparse matrices.
 *
 * A singular or ill-conditioned system does not throw. The solver returns a
 * zero vector and sets is_singular(); this is how a structure that has lost
 * its last load path is detected.
 *
 * Usage:
 *   LinearSolver solver;
 *   Eigen::VectorXd u = solver.solve(K, F);
 *   if (solver.is_singular()) {
 *       logger()->info(solver.get_error_message());
 *   }
 */
class LinearSolver {
public:
    enum class Method {
        SimplicialLDLT,  ///< Eigen::SimplicialLDLT (default)
        SparseLU         ///< Eigen::SparseLU
    };

    explicit LinearSolver(Method method = Method::SimplicialLDLT,
                          SolverSettings settings = SolverSettings{});

    /**
     * @brief Solve the linear system K * u = F
     * @param K Global stiffness matrix (sparse, N×N)
     * @param F Global force vector (N×1)
     * @return Displacement vector u (N×1), zero if singular
     */
    Eigen::VectorXd solve(const Eigen::SparseMatrix<double>& K,
                          const Eigen::VectorXd& F);

    /// True if the last solve detected a singular or ill-conditioned system
    bool is_singular() const { return singular_; }

    /// True if the last solve succeeded but the system is poorly conditioned
    bool is_poorly_conditioned() const { return poorly_conditioned_; }

    /// Error message from the last solve (empty if none)
    std::string get_error_message() const { return error_msg_; }

    /// Smallest relative pivot of the last LDLT factorisation (1.0 for SparseLU)
    double get_min_pivot_ratio() const { return min_pivot_ratio_; }

    /// Relative residual of the last successful solve
    double get_residual() const { return residual_; }

    /// Global DOFs whose pivot fell below the tolerance
    const std::vector<int>& get_singular_dofs() const { return singular_dofs_; }

    Method get_method() const { return method_; }
    void set_method(Method method) { method_ = method; }

    const SolverSettings& settings() const { return settings_; }

private:
    Method method_;
    SolverSettings settings_;
    bool singular_ = false;
    bool poorly_conditioned_ = false;
    std::string error_msg_;
    double min_pivot_ratio_ = 1.0;
    double residual_ = 0.0;
    std::vector<int> singular_dofs_;

    Eigen::VectorXd solve_simplicial_ldlt(const Eigen::SparseMatrix<double>& K,
                                          const Eigen::VectorXd& F);

    Eigen::VectorXd solve_sparse_lu(const Eigen::SparseMatrix<double>& K,
                                    const Eigen::VectorXd& F);

    /**
     * @brief Detect structurally zero or non-positive diagonal entries
     * @return true if the matrix is certainly singular
     */
    bool check_singularity(const Eigen::SparseMatrix<double>& K);

    /**
     * @brief Verify the solution is finite and satisfies the residual tolerance
     */
    bool check_solution(const Eigen::SparseMatrix<double>& K,
                        const Eigen::VectorXd& F,
                        const Eigen::VectorXd& u);

    void mark_singular(const std::string& message);
};

} // namespace collapsex
