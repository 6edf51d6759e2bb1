/**
 * @file physical_constants.hpp
 * @author remzerrr (remi.helleboid@gmail.com)
 * @brief  Common physical constants used in the project.
 * @version 0.1
 * @date 2025-10-12
 *
 *
 */

#pragma once

#include <cmath>
#include <numbers>

namespace pbands {

namespace Constants {

constexpr double h   = 6.62607015e-34;   // J·s (exact)
constexpr double k_B = 1.380649e-23;     // J/K (exact)
constexpr double q_e = 1.602176634e-19;  // C = J/eV (exact)

// === Derived fundamentals ===
constexpr double pi       = std::numbers::pi_v<double>;
constexpr double h_bar    = h / (2.0 * pi);   // J·s
constexpr double eV_to_J  = q_e;              // J/eV
constexpr double h_bar_eV = h_bar / eV_to_J;  // eV·s
constexpr double k_b_eV   = k_B / eV_to_J;    // eV/K

constexpr double eps_0 = 8.8541878128e-12;  // F/m
constexpr double m_e   = 9.1093837015e-31;  // kg

constexpr double Hartree_to_J  = 4.3597447222071e-18;  // J
constexpr double Hartree_to_eV = Hartree_to_J / eV_to_J;
constexpr double Ryd_to_eV     = Hartree_to_eV / 2.0;  // ~13.605693122994
constexpr double e_Ry          = Ryd_to_eV * eV_to_J;  // J

// conversions
constexpr double meV_to_eV = 1e-3;

}  // namespace Constants
}  // namespace pbands
