#include "collapsex/section.hpp"
#include <cmath>

namespace collapsex {

Section::Section(int id, std::string name, double A, double I, double c)
    : id(id), name(std::move(name)), A(A), I(I), c(c) {
}

Section Section::compact(int id, std::string name, double A, double I) {
    double c = (A > 0.0 && I > 0.0) ? std::sqrt(I / A) : 0.0;
    return Section(id, std::move(name), A, I, c);
}

double Section::section_modulus() const {
    return I / c;
}

} // namespace collapsex
