#include "collapsex/local_axes.hpp"
#include <cmath>
#include <stdexcept>

namespace collapsex {

LocalAxes::LocalAxes(const Eigen::Vector3d& end_a, const Eigen::Vector3d& end_b) {
    Eigen::Vector3d member_vector = end_b - end_a;
    double length = member_vector.norm();

    if (length < 1e-10) {
        throw std::invalid_argument("Member length is too small (near-zero)");
    }

    x_axis = member_vector / length;

    // Nearly vertical members use global X as the reference direction
    Eigen::Vector3d global_x(1.0, 0.0, 0.0);
    Eigen::Vector3d global_z(0.0, 0.0, 1.0);
    Eigen::Vector3d reference = (std::abs(x_axis.dot(global_z)) > 0.99) ? global_x : global_z;

    // Gram-Schmidt: z_axis = normalize(reference - (reference · x) x)
    Eigen::Vector3d z_temp = reference - reference.dot(x_axis) * x_axis;
    double z_norm = z_temp.norm();

    if (z_norm < 1e-10) {
        throw std::runtime_error("Failed to compute local z-axis (degenerate case)");
    }

    z_axis = z_temp / z_norm;
    y_axis = z_axis.cross(x_axis);

    rotation_matrix.row(0) = x_axis.transpose();
    rotation_matrix.row(1) = y_axis.transpose();
    rotation_matrix.row(2) = z_axis.transpose();
}

Eigen::Vector3d LocalAxes::to_local(const Eigen::Vector3d& global) const {
    return rotation_matrix * global;
}

Eigen::Vector3d LocalAxes::to_global(const Eigen::Vector3d& local) const {
    return rotation_matrix.transpose() * local;
}

} // namespace collapsex
