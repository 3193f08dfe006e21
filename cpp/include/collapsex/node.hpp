#pragma once

#include <array>
#include <Eigen/Dense>

namespace collapsex {

/**
 * @brief DOF index constants for clarity
 *
 * Local DOF numbering at each node:
 * - UX, UY, UZ: Translations in global X, Y, Z directions
 * - RX, RY, RZ: Rotations about global X, Y, Z axes
 */
enum DOFIndex {
    UX = 0,   ///< Translation in X direction (m)
    UY = 1,   ///< Translation in Y direction (m)
    UZ = 2,   ///< Translation in Z direction (m)
    RX = 3,   ///< Rotation about X axis (rad)
    RY = 4,   ///< Rotation about Y axis (rad)
    RZ = 5    ///< Rotation about Z axis (rad)
};

/// Number of degrees of freedom per node
constexpr int DOFS_PER_NODE = 6;

/**
 * @brief Represents a joint of the frame
 *
 * A Node is a point in 3D space with 6 degrees of freedom
 * (3 translations, 3 rotations). Each DOF is either free or fixed.
 * Nodes are immutable once the frame has been built.
 *
 * Coordinates are in meters [m].
 */
class Node {
public:
    int id;           ///< Unique node identifier
    double x, y, z;   ///< Nodal coordinates [m]

    /// Fixity flags (true = restrained). Order: [UX, UY, UZ, RX, RY, RZ]
    std::array<bool, DOFS_PER_NODE> fixed = {false, false, false, false, false, false};

    /**
     * @brief Construct a new free Node
     *
     * @param id Unique node identifier
     * @param x X-coordinate [m]
     * @param y Y-coordinate [m]
     * @param z Z-coordinate [m]
     */
    Node(int id, double x, double y, double z = 0.0);

    /**
     * @brief Get the node position as an Eigen vector
     */
    Eigen::Vector3d position() const;

    /**
     * @brief Restrain a single DOF
     * @param dof Local DOF index (0-5)
     */
    Node& fix_dof(int dof);

    /**
     * @brief Restrain all 6 DOFs (built-in support)
     */
    Node& fix_all();

    /**
     * @brief Restrain translations only (pinned support)
     */
    Node& pin();

    /**
     * @brief Check whether a DOF is restrained
     * @param dof Local DOF index (0-5)
     */
    bool is_fixed(int dof) const;

    /**
     * @brief Number of restrained DOFs at this node
     */
    int num_fixed_dofs() const;
};

} // namespace collapsex
