#pragma once

#include "collapsex/node.hpp"
#include "collapsex/member.hpp"
#include "collapsex/local_axes.hpp"

#include <string>
#include <vector>
#include <Eigen/Dense>

namespace collapsex {

/**
 * @brief Complete structural model of a frame
 *
 * Holds the ordered nodes, ordered members and nodal loads of one scenario.
 * The global DOF count is 6 × number of nodes; the DOFs of the node stored
 * at position k occupy global indices [6k, 6k + 6).
 *
 * FrameData is a value type: copying it copies nodes, members and loads
 * while materials and sections stay shared. After construction only the
 * members' active flags change, and only from true to false.
 *
 * Usage:
 *   FrameData frame("Simple beam");
 *   auto steel = std::make_shared<Material>(Material::steel_s275(1));
 *   auto sec = std::make_shared<Section>(Section::compact(1, "Box", 0.01, 1e-4));
 *   frame.add_node(0, 0.0, 0.0).pin();
 *   frame.add_node(1, 5.0, 0.0);
 *   frame.add_member(0, 0, 1, steel, sec);
 *   frame.add_load(1, UY, -50e3);
 *   frame.validate();
 */
class FrameData {
public:
    std::string name;                ///< Human-readable frame name
    std::vector<Node> nodes;         ///< Nodes in DOF order
    std::vector<Member> members;     ///< Members in reporting order
    std::vector<NodalLoad> loads;    ///< Applied loads at load factor 1.0

    explicit FrameData(std::string name = "");

    /**
     * @brief Append a node
     *
     * The returned reference is invalidated by the next add_node call.
     */
    Node& add_node(int id, double x, double y, double z = 0.0);

    /**
     * @brief Append a member between two node IDs
     *
     * References are not checked here; validate() reports dangling ones.
     * The returned reference is invalidated by the next add_member call.
     */
    Member& add_member(int id, int node_i, int node_j,
                       std::shared_ptr<const Material> material,
                       std::shared_ptr<const Section> section);

    /**
     * @brief Append a nodal load
     */
    void add_load(int node_id, int dof, double magnitude);

    int num_nodes() const { return static_cast<int>(nodes.size()); }
    int num_members() const { return static_cast<int>(members.size()); }
    int num_dofs() const { return DOFS_PER_NODE * num_nodes(); }

    /**
     * @brief Position of a node in the node list, -1 if absent
     */
    int node_index(int node_id) const;

    /**
     * @brief Position of a member in the member list, -1 if absent
     */
    int member_index(int member_id) const;

    const Node* find_node(int node_id) const;
    const Member* find_member(int member_id) const;
    Member* find_member(int member_id);

    /**
     * @brief Global DOF number for a node DOF
     * @throws std::out_of_range if the node does not exist
     */
    int global_dof(int node_id, int dof) const;

    /**
     * @brief The 12 global DOF numbers of a member ([node_i DOFs, node_j DOFs])
     */
    std::vector<int> location_array(const Member& member) const;

    /**
     * @brief Member length [m]
     */
    double member_length(const Member& member) const;

    /**
     * @brief Local coordinate system of a member
     */
    LocalAxes member_axes(const Member& member) const;

    /**
     * @brief Global load vector scaled by a load factor
     *
     * Loads at fixed DOFs are included here; they are discarded when
     * boundary conditions are applied.
     */
    Eigen::VectorXd load_vector(double load_factor = 1.0) const;

    /**
     * @brief Sorted global DOF numbers of all restrained DOFs
     */
    std::vector<int> fixed_global_dofs() const;

    /**
     * @brief IDs of members still active, in member order
     */
    std::vector<int> active_member_ids() const;

    int num_active_members() const;

    /**
     * @brief IDs of members sharing an end node with the given member
     * @param member_id Member whose neighbours are requested
     * @param active_only Skip failed neighbours (default true)
     */
    std::vector<int> adjacent_members(int member_id, bool active_only = true) const;

    /**
     * @brief Check the frame for configuration errors
     *
     * Rejects: no nodes or members, duplicate IDs, non-finite coordinates,
     * dangling or coincident member end nodes, missing or non-positive
     * material and section properties, loads on unknown nodes or invalid
     * DOFs, non-finite loads and nonzero loads at fixed DOFs.
     *
     * @throws ConfigurationError on the first violation found
     */
    void validate() const;
};

} // namespace collapsex
