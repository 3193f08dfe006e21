/**
 * @file test_solver.cpp
 * @brief Tests for LinearSolver singularity detection and EquilibriumSolver
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "collapsex/assembler.hpp"
#include "collapsex/equilibrium.hpp"
#include "collapsex/errors.hpp"
#include "collapsex/solver.hpp"
#include "frame_fixtures.hpp"

#include <Eigen/Sparse>
#include <vector>

using namespace collapsex;
using namespace collapsex_test;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

Eigen::SparseMatrix<double> sparse_from_dense(const Eigen::MatrixXd& dense) {
    return dense.sparseView();
}

}  // namespace

TEST_CASE("LinearSolver solves a well-posed system", "[LinearSolver]") {
    Eigen::MatrixXd dense(3, 3);
    dense << 4, -1, 0,
            -1, 4, -1,
             0, -1, 4;
    Eigen::VectorXd F(3);
    F << 1, 2, 3;

    for (auto method : {LinearSolver::Method::SimplicialLDLT, LinearSolver::Method::SparseLU}) {
        LinearSolver solver(method);
        Eigen::VectorXd u = solver.solve(sparse_from_dense(dense), F);

        REQUIRE_FALSE(solver.is_singular());
        REQUIRE(solver.get_error_message().empty());
        REQUIRE((dense * u - F).norm() < 1e-12);
        REQUIRE(solver.get_residual() < 1e-12);
    }
}

TEST_CASE("LinearSolver method can be switched", "[LinearSolver]") {
    LinearSolver solver;
    REQUIRE(solver.get_method() == LinearSolver::Method::SimplicialLDLT);
    solver.set_method(LinearSolver::Method::SparseLU);
    REQUIRE(solver.get_method() == LinearSolver::Method::SparseLU);
}

TEST_CASE("LinearSolver reports an exactly singular system", "[LinearSolver]") {
    Eigen::MatrixXd dense(2, 2);
    dense << 1, -1,
            -1, 1;
    Eigen::VectorXd F(2);
    F << 1, -1;

    LinearSolver solver;
    Eigen::VectorXd u = solver.solve(sparse_from_dense(dense), F);

    REQUIRE(solver.is_singular());
    REQUIRE_FALSE(solver.get_error_message().empty());
    REQUIRE(u.isZero());
}

TEST_CASE("LinearSolver reports a near-zero pivot as singular", "[LinearSolver]") {
    Eigen::MatrixXd dense(2, 2);
    dense << 1, -1,
            -1, 1 + 1e-12;
    Eigen::VectorXd F(2);
    F << 1, 0;

    LinearSolver solver;
    solver.solve(sparse_from_dense(dense), F);

    REQUIRE(solver.is_singular());
    REQUIRE(solver.get_min_pivot_ratio() < 1e-10);
    REQUIRE_FALSE(solver.get_singular_dofs().empty());
}

TEST_CASE("LinearSolver flags a poorly conditioned but solvable system", "[LinearSolver]") {
    Eigen::MatrixXd dense(2, 2);
    dense << 1, -1,
            -1, 1 + 1e-8;
    Eigen::VectorXd F(2);
    F << 0, 1e-8;

    LinearSolver solver;
    Eigen::VectorXd u = solver.solve(sparse_from_dense(dense), F);

    REQUIRE_FALSE(solver.is_singular());
    REQUIRE(solver.is_poorly_conditioned());
    REQUIRE_THAT(u(0), WithinRel(1.0, 1e-6));
    REQUIRE_THAT(u(1), WithinRel(1.0, 1e-6));
}

TEST_CASE("LinearSolver reports a DOF without stiffness", "[LinearSolver]") {
    // Structurally missing diagonal entry
    std::vector<Eigen::Triplet<double>> triplets = {{0, 0, 2.0}, {2, 2, 3.0}};
    Eigen::SparseMatrix<double> K(3, 3);
    K.setFromTriplets(triplets.begin(), triplets.end());
    Eigen::VectorXd F = Eigen::VectorXd::Ones(3);

    LinearSolver solver;
    solver.solve(K, F);

    REQUIRE(solver.is_singular());
    REQUIRE(solver.get_singular_dofs() == std::vector<int>{1});
}

TEST_CASE("LinearSolver rejects mismatched dimensions", "[LinearSolver]") {
    Eigen::SparseMatrix<double> K(3, 3);
    K.setIdentity();
    Eigen::VectorXd F = Eigen::VectorXd::Ones(2);

    LinearSolver solver;
    Eigen::VectorXd u = solver.solve(K, F);
    REQUIRE(solver.is_singular());
    REQUIRE(u.size() == 2);
}

TEST_CASE("SolverSettings validation", "[LinearSolver][config]") {
    SolverSettings settings;
    REQUIRE_NOTHROW(settings.validate());

    settings.pivot_tolerance = 0.0;
    REQUIRE_THROWS_AS(settings.validate(), ConfigurationError);

    settings = SolverSettings{};
    settings.residual_tolerance = -1.0;
    REQUIRE_THROWS_AS(settings.validate(), ConfigurationError);
}

TEST_CASE("Equilibrium of a simply supported beam", "[EquilibriumSolver]") {
    SimpleBeamFixture fx;
    AssembledSystem system = Assembler(fx.frame).assemble(fx.frame.active_member_ids(), 1.0);

    EquilibriumSolver solver;
    EquilibriumResult result = solver.solve(fx.frame, system, 0);

    REQUIRE_FALSE(result.singular);
    REQUIRE(result.responses.size() == 2);
    REQUIRE(result.warnings.empty());

    const double P = 50e3;
    const double L = 10.0;
    const double EI = 200e9 * 1e-4;
    const double deflection = P * L * L * L / (48.0 * EI);
    REQUIRE_THAT(result.u(fx.frame.global_dof(1, UY)), WithinRel(-deflection, 1e-9));

    // External work equals internal strain energy, split evenly by symmetry
    const double work = 0.5 * P * deflection;
    const MemberResponse& r0 = result.responses[0];
    const MemberResponse& r1 = result.responses[1];
    REQUIRE_THAT(r0.strain_energy + r1.strain_energy, WithinRel(work, 1e-9));
    REQUIRE_THAT(r0.strain_energy, WithinRel(r1.strain_energy, 1e-9));
    REQUIRE_THAT(r0.axial_energy, WithinAbs(0.0, 1e-6));
    REQUIRE_THAT(r0.bending_energy, WithinRel(r0.strain_energy, 1e-12));

    // Midspan moment PL/4 at the shared node, zero at the supports
    REQUIRE_THAT(r0.end_j.bending_moment(), WithinRel(P * L / 4.0, 1e-9));
    REQUIRE_THAT(r0.end_i.bending_moment(), WithinAbs(0.0, 1e-3));
    REQUIRE_THAT(r1.end_i.bending_moment(), WithinRel(P * L / 4.0, 1e-9));

    REQUIRE(result.find(1) == &result.responses[1]);
    REQUIRE(result.find(7) == nullptr);
}

TEST_CASE("Axial force is positive in tension", "[EquilibriumSolver]") {
    const double P = 1000.0;
    CantileverFixture fx(UX, P);
    AssembledSystem system = Assembler(fx.frame).assemble({0}, 1.0);

    EquilibriumResult result = EquilibriumSolver().solve(fx.frame, system);
    REQUIRE_FALSE(result.singular);

    const MemberResponse& r = result.responses.front();
    REQUIRE_THAT(r.end_i.N, WithinRel(P, 1e-9));
    REQUIRE_THAT(r.end_j.N, WithinRel(P, 1e-9));

    const double EA = 200e9 * 0.01;
    REQUIRE_THAT(r.axial_energy, WithinRel(0.5 * P * P * 2.0 / EA, 1e-9));
    REQUIRE_THAT(r.bending_energy, WithinAbs(0.0, 1e-12));
}

TEST_CASE("Equilibrium reports a mechanism as singular", "[EquilibriumSolver]") {
    FrameData frame("Free member");
    frame.add_node(0, 0.0, 0.0);
    frame.add_node(1, 3.0, 0.0);
    frame.add_member(0, 0, 1, steel(), box_section());
    frame.add_load(1, UY, -1e3);

    AssembledSystem system = Assembler(frame).assemble({0}, 1.0);
    EquilibriumResult result = EquilibriumSolver().solve(frame, system, 4);

    REQUIRE(result.singular);
    REQUIRE_FALSE(result.message.empty());
    REQUIRE(result.responses.empty());
}
