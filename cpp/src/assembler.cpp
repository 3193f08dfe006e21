#include "collapsex/assembler.hpp"
#include "collapsex/beam_element.hpp"
#include <stdexcept>
#include <string>

namespace collapsex {

Assembler::Assembler(const FrameData& frame)
    : frame_(frame) {}

Eigen::SparseMatrix<double> Assembler::assemble_stiffness(
    const std::vector<int>& member_ids) const {

    int total_dofs = frame_.num_dofs();
    Eigen::SparseMatrix<double> K_global(total_dofs, total_dofs);

    std::vector<Eigen::Triplet<double>> triplets;
    triplets.reserve(member_ids.size() * 144);

    for (int id : member_ids) {
        const Member* member = frame_.find_member(id);
        if (!member) {
            throw std::out_of_range("Member " + std::to_string(id) + " not found in frame");
        }
        if (!member->active) continue;

        Matrix12d K_elem = global_stiffness_matrix(frame_, *member);
        add_element_matrix(triplets, K_elem, frame_.location_array(*member));
    }

    K_global.setFromTriplets(triplets.begin(), triplets.end());
    return K_global;
}

Eigen::SparseMatrix<double> Assembler::assemble_stiffness() const {
    return assemble_stiffness(frame_.active_member_ids());
}

AssembledSystem Assembler::assemble(const std::vector<int>& member_ids,
                                    double load_factor) const {
    AssembledSystem system;
    system.load_factor = load_factor;
    system.active_members = member_ids;

    BCHandler bc(frame_);
    auto [K_bc, F_bc] = bc.apply_to_system(assemble_stiffness(member_ids),
                                           frame_.load_vector(load_factor));
    system.K = std::move(K_bc);
    system.F = std::move(F_bc);
    system.fixed_dofs = bc.get_fixed_dofs();
    return system;
}

void Assembler::add_element_matrix(
    std::vector<Eigen::Triplet<double>>& triplets,
    const Eigen::MatrixXd& element_matrix,
    const std::vector<int>& loc_array) const {

    int n_elem_dofs = static_cast<int>(element_matrix.rows());

    for (int i = 0; i < n_elem_dofs; ++i) {
        int global_i = loc_array[i];
        for (int j = 0; j < n_elem_dofs; ++j) {
            double value = element_matrix(i, j);
            if (value == 0.0) continue;
            triplets.emplace_back(global_i, loc_array[j], value);
        }
    }
}

} // namespace collapsex
