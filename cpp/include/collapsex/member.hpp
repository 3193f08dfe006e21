#pragma once

#include "collapsex/material.hpp"
#include "collapsex/section.hpp"
#include <memory>

namespace collapsex {

/**
 * @brief Frame member (beam or column) connecting two nodes
 *
 * Members are plain data: every member has the same shape and differs only
 * in its field values. Behaviour lives in free functions and the pipeline
 * components (assembler, failure detector, redistributor).
 *
 * The active flag is monotonic: it starts true and is cleared once when the
 * member fails. failure_order records the member's position in the run's
 * failure log (-1 while intact).
 */
struct Member {
    int id;                                   ///< Unique member identifier
    int node_i;                               ///< ID of the start node
    int node_j;                               ///< ID of the end node
    std::shared_ptr<const Material> material; ///< Shared material
    std::shared_ptr<const Section> section;   ///< Shared cross-section
    bool active = true;                       ///< False once the member has failed
    int failure_order = -1;                   ///< Index in the failure log, -1 if intact

    Member(int id, int node_i, int node_j,
           std::shared_ptr<const Material> material,
           std::shared_ptr<const Section> section);

    /**
     * @brief Check whether the member is attached to a node
     */
    bool connects(int node_id) const;

    /**
     * @brief Check whether two distinct members share an end node
     */
    bool shares_node_with(const Member& other) const;
};

/**
 * @brief External force or moment applied at a node
 *
 * Multiple loads on the same DOF are summed.
 */
struct NodalLoad {
    int node_id;      ///< Loaded node ID
    int dof;          ///< Local DOF index (0-5)
    double magnitude; ///< Force [N] or moment [N·m] at load factor 1.0
};

} // namespace collapsex
