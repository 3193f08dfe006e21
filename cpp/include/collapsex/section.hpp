#pragma once

#include <string>

namespace collapsex {

/**
 * @brief Cross-section properties for frame members
 *
 * Stores geometric properties of member cross-sections:
 * - A: Cross-sectional area [m²]
 * - I: Second moment of area [m⁴], used for bending in both local planes
 * - c: Distance from the neutral axis to the extreme fibre [m]
 *
 * A single I describes compact, doubly symmetric sections. Torsion is not
 * modelled, so no torsional constant is stored.
 */
class Section {
public:
    int id;             ///< Unique section identifier
    std::string name;   ///< Section name
    double A;           ///< Cross-sectional area [m²]
    double I;           ///< Second moment of area [m⁴]
    double c;           ///< Extreme fibre distance [m]

    /**
     * @brief Construct a new Section
     *
     * @param id Unique section identifier
     * @param name Section name
     * @param A Cross-sectional area [m²]
     * @param I Second moment of area [m⁴]
     * @param c Extreme fibre distance [m]
     */
    Section(int id, std::string name, double A, double I, double c);

    /**
     * @brief Create a compact section with c = sqrt(I / A)
     *
     * The radius of gyration stands in for the extreme fibre distance when
     * the section depth is not known.
     *
     * @param id Unique section identifier
     * @param name Section name
     * @param A Cross-sectional area [m²]
     * @param I Second moment of area [m⁴]
     * @return Section with derived fibre distance
     */
    static Section compact(int id, std::string name, double A, double I);

    /**
     * @brief Elastic section modulus W = I / c [m³]
     */
    double section_modulus() const;
};

} // namespace collapsex
