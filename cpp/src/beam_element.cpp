#include "collapsex/beam_element.hpp"
#include <cmath>

namespace collapsex {

double EndForces::bending_moment() const {
    return std::hypot(My, Mz);
}

Matrix12d local_axial_stiffness(double E, double A, double L) {
    Matrix12d K = Matrix12d::Zero();

    // Axial stiffness terms (DOFs 0, 6: u_i, u_j)
    double k_axial = E * A / L;
    K(0, 0) = k_axial;
    K(0, 6) = -k_axial;
    K(6, 0) = -k_axial;
    K(6, 6) = k_axial;

    return K;
}

Matrix12d local_bending_stiffness(double E, double I, double L) {
    Matrix12d K = Matrix12d::Zero();

    double L2 = L * L;
    double L3 = L2 * L;

    double k1 = 12.0 * E * I / L3;
    double k2 = 6.0 * E * I / L2;
    double k3 = 4.0 * E * I / L;
    double k4 = 2.0 * E * I / L;

    // Bending about z-axis (in-plane y, DOFs 1, 5, 7, 11: v_i, θz_i, v_j, θz_j)
    K(1, 1) = k1;
    K(1, 5) = k2;
    K(1, 7) = -k1;
    K(1, 11) = k2;

    K(5, 1) = k2;
    K(5, 5) = k3;
    K(5, 7) = -k2;
    K(5, 11) = k4;

    K(7, 1) = -k1;
    K(7, 5) = -k2;
    K(7, 7) = k1;
    K(7, 11) = -k2;

    K(11, 1) = k2;
    K(11, 5) = k4;
    K(11, 7) = -k2;
    K(11, 11) = k3;

    // Bending about y-axis (w, DOFs 2, 4, 8, 10: w_i, θy_i, w_j, θy_j)
    // θy = -dw/dx, hence the sign flips on the coupling terms
    K(2, 2) = k1;
    K(2, 4) = -k2;
    K(2, 8) = -k1;
    K(2, 10) = -k2;

    K(4, 2) = -k2;
    K(4, 4) = k3;
    K(4, 8) = k2;
    K(4, 10) = k4;

    K(8, 2) = -k1;
    K(8, 4) = k2;
    K(8, 8) = k1;
    K(8, 10) = k2;

    K(10, 2) = -k2;
    K(10, 4) = k4;
    K(10, 8) = k2;
    K(10, 10) = k3;

    return K;
}

Matrix12d local_stiffness_matrix(const Member& member, double L) {
    double E = member.material->E;
    return local_axial_stiffness(E, member.section->A, L) +
           local_bending_stiffness(E, member.section->I, L);
}

Matrix12d transformation_matrix(const LocalAxes& axes) {
    Matrix12d T = Matrix12d::Zero();
    const Eigen::Matrix3d& R = axes.rotation_matrix;

    T.block<3, 3>(0, 0) = R;   // Node i translations
    T.block<3, 3>(3, 3) = R;   // Node i rotations
    T.block<3, 3>(6, 6) = R;   // Node j translations
    T.block<3, 3>(9, 9) = R;   // Node j rotations

    return T;
}

Matrix12d global_stiffness_matrix(const FrameData& frame, const Member& member) {
    Matrix12d k_local = local_stiffness_matrix(member, frame.member_length(member));
    Matrix12d T = transformation_matrix(frame.member_axes(member));
    return T.transpose() * k_local * T;
}

Vector12d member_displacements_local(const FrameData& frame, const Member& member,
                                     const Eigen::VectorXd& global_displacements) {
    std::vector<int> loc = frame.location_array(member);

    Vector12d u_global;
    for (int i = 0; i < 12; ++i) {
        u_global(i) = global_displacements(loc[i]);
    }

    // T is orthogonal, so global to local is T itself
    return transformation_matrix(frame.member_axes(member)) * u_global;
}

std::pair<EndForces, EndForces> compute_end_forces(const Matrix12d& k_local,
                                                   const Vector12d& u_local) {
    Vector12d f = k_local * u_local;

    EndForces end_i;
    end_i.N = -f(0);
    end_i.Vy = -f(1);
    end_i.Vz = -f(2);
    end_i.My = -f(4);
    end_i.Mz = -f(5);

    EndForces end_j;
    end_j.N = f(6);
    end_j.Vy = f(7);
    end_j.Vz = f(8);
    end_j.My = f(10);
    end_j.Mz = f(11);

    return {end_i, end_j};
}

} // namespace collapsex
