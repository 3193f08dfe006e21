#include "collapsex/node.hpp"
#include <stdexcept>
#include <string>

namespace collapsex {

Node::Node(int id, double x, double y, double z)
    : id(id), x(x), y(y), z(z) {
}

Eigen::Vector3d Node::position() const {
    return Eigen::Vector3d(x, y, z);
}

Node& Node::fix_dof(int dof) {
    if (dof < 0 || dof >= DOFS_PER_NODE) {
        throw std::invalid_argument("DOF index must be in range [0, 5], got " +
                                    std::to_string(dof));
    }
    fixed[dof] = true;
    return *this;
}

Node& Node::fix_all() {
    fixed.fill(true);
    return *this;
}

Node& Node::pin() {
    fixed[UX] = true;
    fixed[UY] = true;
    fixed[UZ] = true;
    return *this;
}

bool Node::is_fixed(int dof) const {
    if (dof < 0 || dof >= DOFS_PER_NODE) return false;
    return fixed[dof];
}

int Node::num_fixed_dofs() const {
    int count = 0;
    for (bool f : fixed) {
        if (f) count++;
    }
    return count;
}

} // namespace collapsex
