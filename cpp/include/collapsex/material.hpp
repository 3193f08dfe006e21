#pragma once

#include <string>

namespace collapsex {

/**
 * @brief Material properties for frame members
 *
 * Stores material properties in consistent units:
 * - E: Young's modulus [Pa]
 * - sigma_lim: Stress limit used by the failure criterion [Pa]
 * - rho: Density [kg/m³] (not used by the static analysis)
 *
 * Materials are immutable once created and shared between all members
 * of the same type.
 */
class Material {
public:
    int id;             ///< Unique material identifier
    std::string name;   ///< Material name
    double E;           ///< Young's modulus [Pa]
    double sigma_lim;   ///< Yield/ultimate stress limit [Pa]
    double rho;         ///< Density [kg/m³]

    /**
     * @brief Construct a new Material
     *
     * @param id Unique material identifier
     * @param name Material name
     * @param E Young's modulus [Pa]
     * @param sigma_lim Stress limit [Pa]
     * @param rho Density [kg/m³] (default: 7850, structural steel)
     */
    Material(int id, std::string name, double E, double sigma_lim, double rho = 7850.0);

    /**
     * @brief S275 structural steel (E = 200 GPa, σ_lim = 275 MPa)
     */
    static Material steel_s275(int id);

    /**
     * @brief S355 structural steel (E = 200 GPa, σ_lim = 355 MPa)
     */
    static Material steel_s355(int id);
};

} // namespace collapsex
