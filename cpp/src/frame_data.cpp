#include "collapsex/frame_data.hpp"
#include "collapsex/errors.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace collapsex {

FrameData::FrameData(std::string name)
    : name(std::move(name)) {
}

Node& FrameData::add_node(int id, double x, double y, double z) {
    nodes.emplace_back(id, x, y, z);
    return nodes.back();
}

Member& FrameData::add_member(int id, int node_i, int node_j,
                              std::shared_ptr<const Material> material,
                              std::shared_ptr<const Section> section) {
    members.emplace_back(id, node_i, node_j, std::move(material), std::move(section));
    return members.back();
}

void FrameData::add_load(int node_id, int dof, double magnitude) {
    loads.push_back(NodalLoad{node_id, dof, magnitude});
}

int FrameData::node_index(int node_id) const {
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (nodes[i].id == node_id) return static_cast<int>(i);
    }
    return -1;
}

int FrameData::member_index(int member_id) const {
    for (size_t i = 0; i < members.size(); ++i) {
        if (members[i].id == member_id) return static_cast<int>(i);
    }
    return -1;
}

const Node* FrameData::find_node(int node_id) const {
    int idx = node_index(node_id);
    return idx < 0 ? nullptr : &nodes[idx];
}

const Member* FrameData::find_member(int member_id) const {
    int idx = member_index(member_id);
    return idx < 0 ? nullptr : &members[idx];
}

Member* FrameData::find_member(int member_id) {
    int idx = member_index(member_id);
    return idx < 0 ? nullptr : &members[idx];
}

int FrameData::global_dof(int node_id, int dof) const {
    int idx = node_index(node_id);
    if (idx < 0) {
        throw std::out_of_range("Node " + std::to_string(node_id) + " not found in frame");
    }
    return idx * DOFS_PER_NODE + dof;
}

std::vector<int> FrameData::location_array(const Member& member) const {
    std::vector<int> loc(2 * DOFS_PER_NODE);
    int base_i = global_dof(member.node_i, 0);
    int base_j = global_dof(member.node_j, 0);
    for (int d = 0; d < DOFS_PER_NODE; ++d) {
        loc[d] = base_i + d;
        loc[DOFS_PER_NODE + d] = base_j + d;
    }
    return loc;
}

double FrameData::member_length(const Member& member) const {
    const Node* ni = find_node(member.node_i);
    const Node* nj = find_node(member.node_j);
    if (!ni || !nj) {
        throw std::out_of_range("Member " + std::to_string(member.id) +
                                " references a missing node");
    }
    return (nj->position() - ni->position()).norm();
}

LocalAxes FrameData::member_axes(const Member& member) const {
    const Node* ni = find_node(member.node_i);
    const Node* nj = find_node(member.node_j);
    if (!ni || !nj) {
        throw std::out_of_range("Member " + std::to_string(member.id) +
                                " references a missing node");
    }
    return LocalAxes(ni->position(), nj->position());
}

Eigen::VectorXd FrameData::load_vector(double load_factor) const {
    Eigen::VectorXd F = Eigen::VectorXd::Zero(num_dofs());
    for (const auto& load : loads) {
        F(global_dof(load.node_id, load.dof)) += load.magnitude * load_factor;
    }
    return F;
}

std::vector<int> FrameData::fixed_global_dofs() const {
    std::vector<int> dofs;
    for (size_t k = 0; k < nodes.size(); ++k) {
        for (int d = 0; d < DOFS_PER_NODE; ++d) {
            if (nodes[k].fixed[d]) {
                dofs.push_back(static_cast<int>(k) * DOFS_PER_NODE + d);
            }
        }
    }
    return dofs;
}

std::vector<int> FrameData::active_member_ids() const {
    std::vector<int> ids;
    ids.reserve(members.size());
    for (const auto& m : members) {
        if (m.active) ids.push_back(m.id);
    }
    return ids;
}

int FrameData::num_active_members() const {
    return static_cast<int>(std::count_if(members.begin(), members.end(),
                                          [](const Member& m) { return m.active; }));
}

std::vector<int> FrameData::adjacent_members(int member_id, bool active_only) const {
    std::vector<int> result;
    const Member* self = find_member(member_id);
    if (!self) return result;

    for (const auto& other : members) {
        if (active_only && !other.active) continue;
        if (self->shares_node_with(other)) {
            result.push_back(other.id);
        }
    }
    return result;
}

void FrameData::validate() const {
    if (nodes.empty()) {
        CollapsexError err(ErrorCode::NO_NODES, "Model has no nodes");
        err.suggestion = "Add nodes before members.";
        throw ConfigurationError(err);
    }
    if (members.empty()) {
        throw ConfigurationError(CollapsexError::empty_model());
    }

    std::set<int> node_ids;
    for (const auto& node : nodes) {
        if (!node_ids.insert(node.id).second) {
            CollapsexError err(ErrorCode::DUPLICATE_ID, "Duplicate node id");
            err.involved_nodes.push_back(node.id);
            throw ConfigurationError(err);
        }
        if (!std::isfinite(node.x) || !std::isfinite(node.y) || !std::isfinite(node.z)) {
            throw ConfigurationError(
                CollapsexError::invalid_node(node.id, "non-finite coordinates"));
        }
    }

    std::set<int> member_ids;
    for (const auto& m : members) {
        if (!member_ids.insert(m.id).second) {
            CollapsexError err(ErrorCode::DUPLICATE_ID, "Duplicate member id");
            err.involved_members.push_back(m.id);
            throw ConfigurationError(err);
        }

        for (int end_node : {m.node_i, m.node_j}) {
            if (node_ids.count(end_node) == 0) {
                CollapsexError err = CollapsexError::invalid_node(
                    end_node, "member " + std::to_string(m.id) + " end node does not exist");
                err.involved_members.push_back(m.id);
                throw ConfigurationError(err);
            }
        }

        if (m.node_i == m.node_j || member_length(m) < 1e-10) {
            throw ConfigurationError(
                CollapsexError::invalid_member(m.id, "end nodes coincide (zero length)"));
        }

        if (!m.material) {
            CollapsexError err(ErrorCode::INVALID_MATERIAL, "Member has no material");
            err.involved_members.push_back(m.id);
            throw ConfigurationError(err);
        }
        if (!m.section) {
            CollapsexError err(ErrorCode::INVALID_SECTION, "Member has no section");
            err.involved_members.push_back(m.id);
            throw ConfigurationError(err);
        }

        if (!(m.material->E > 0.0)) {
            throw ConfigurationError(CollapsexError::invalid_property(
                ErrorCode::INVALID_MATERIAL, m.id, "E", m.material->E));
        }
        if (!(m.material->sigma_lim > 0.0)) {
            throw ConfigurationError(CollapsexError::invalid_property(
                ErrorCode::INVALID_MATERIAL, m.id, "sigma_lim", m.material->sigma_lim));
        }
        if (!(m.section->A > 0.0)) {
            throw ConfigurationError(CollapsexError::invalid_property(
                ErrorCode::INVALID_SECTION, m.id, "A", m.section->A));
        }
        if (!(m.section->I > 0.0)) {
            throw ConfigurationError(CollapsexError::invalid_property(
                ErrorCode::INVALID_SECTION, m.id, "I", m.section->I));
        }
        if (!(m.section->c > 0.0)) {
            throw ConfigurationError(CollapsexError::invalid_property(
                ErrorCode::INVALID_SECTION, m.id, "c", m.section->c));
        }
    }

    for (const auto& load : loads) {
        const Node* node = find_node(load.node_id);
        if (!node) {
            CollapsexError err(ErrorCode::INVALID_LOAD_NODE, "Load references a missing node");
            err.involved_nodes.push_back(load.node_id);
            throw ConfigurationError(err);
        }
        if (load.dof < 0 || load.dof >= DOFS_PER_NODE) {
            CollapsexError err(ErrorCode::INVALID_LOAD_DOF, "Load DOF must be in range [0, 5]");
            err.involved_nodes.push_back(load.node_id);
            err.details["dof"] = std::to_string(load.dof);
            throw ConfigurationError(err);
        }
        if (!std::isfinite(load.magnitude)) {
            CollapsexError err(ErrorCode::INVALID_PARAMETER, "Load magnitude is not finite");
            err.involved_nodes.push_back(load.node_id);
            throw ConfigurationError(err);
        }
        if (node->fixed[load.dof] && load.magnitude != 0.0) {
            throw ConfigurationError(
                CollapsexError::load_at_fixed_dof(load.node_id, load.dof, load.magnitude));
        }
    }
}

} // namespace collapsex
