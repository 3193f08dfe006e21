#include "collapsex/material.hpp"

namespace collapsex {

Material::Material(int id, std::string name, double E, double sigma_lim, double rho)
    : id(id), name(std::move(name)), E(E), sigma_lim(sigma_lim), rho(rho) {
}

Material Material::steel_s275(int id) {
    return Material(id, "S275 Steel", 200e9, 275e6, 7850.0);
}

Material Material::steel_s355(int id) {
    return Material(id, "S355 Steel", 200e9, 355e6, 7850.0);
}

} // namespace collapsex
