#pragma once

#include <Eigen/Dense>

namespace collapsex {

/**
 * @brief Local coordinate system of a frame member
 *
 * Computes the member's direction cosines from its two end points.
 *
 * The local axes are defined as:
 * - x_axis: Along the member from end_a to end_b
 * - z_axis: Global Z projected perpendicular to x (global X for
 *           nearly vertical members, |x · global_z| > 0.99)
 * - y_axis: Completes the right-handed system (z × x)
 */
class LocalAxes {
public:
    Eigen::Matrix3d rotation_matrix;  ///< Direction cosines, rows are local axes (global to local)
    Eigen::Vector3d x_axis;           ///< Local x-axis (along member)
    Eigen::Vector3d y_axis;           ///< Local y-axis
    Eigen::Vector3d z_axis;           ///< Local z-axis

    /**
     * @brief Construct local axes from two points
     *
     * @param end_a First endpoint position [m]
     * @param end_b Second endpoint position [m]
     * @throws std::invalid_argument if the points coincide
     */
    LocalAxes(const Eigen::Vector3d& end_a, const Eigen::Vector3d& end_b);

    /**
     * @brief Transform a vector from global to local coordinates
     */
    Eigen::Vector3d to_local(const Eigen::Vector3d& global) const;

    /**
     * @brief Transform a vector from local to global coordinates
     */
    Eigen::Vector3d to_global(const Eigen::Vector3d& local) const;
};

} // namespace collapsex
