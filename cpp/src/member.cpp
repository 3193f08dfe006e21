#include "collapsex/member.hpp"

namespace collapsex {

Member::Member(int id, int node_i, int node_j,
               std::shared_ptr<const Material> material,
               std::shared_ptr<const Section> section)
    : id(id), node_i(node_i), node_j(node_j),
      material(std::move(material)), section(std::move(section)) {
}

bool Member::connects(int node_id) const {
    return node_i == node_id || node_j == node_id;
}

bool Member::shares_node_with(const Member& other) const {
    if (other.id == id) return false;
    return connects(other.node_i) || connects(other.node_j);
}

} // namespace collapsex
