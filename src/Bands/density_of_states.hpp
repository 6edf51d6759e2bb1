/**
 * @file density_of_states.hpp
 * @author remzerrr (remi.helleboid@gmail.com)
 * @brief Density of states of parabolic subbands in 1, 2 and 3 dimensions.
 * @version 0.1
 * @date 2025-10-21
 *
 *
 */

#pragma once

#include <vector>

namespace pbands::dos {

enum class EnergyUnit { eV, joule };

/**
 * @brief Density of states of a single parabolic subband for a 1D, 2D or 3D electron gas.
 *
 * g(E) = Omega_d / (2 pi)^d * (2 m / hbar^2)^(d/2) * E^((d-2)/2) * Theta(E),
 * with Omega_d = 2, 2 pi, 4 pi. Eq. (6.17) of Haug & Koch, Quantum Theory of the Optical and
 * Electronic Properties of Semiconductors (2004).
 *
 * The energy is measured from the subband edge, in the direction of increasing carrier kinetic energy.
 * Theta(0) = 1/2. At E = 0 the power term is taken as 0 (d = 1 and d = 3) or 1 (d = 2).
 *
 * @param energy Energies relative to the subband edge.
 * @param effective_mass Effective mass in kg.
 * @param dimension 1, 2 or 3.
 * @param unit Unit of the energy array.
 * @return std::vector<double> DOS per unit length, area or volume, per Joule.
 */
std::vector<double> density_of_states_single_subband(const std::vector<double>& energy,
                                                     double                     effective_mass,
                                                     int                        dimension,
                                                     EnergyUnit                 unit = EnergyUnit::eV);

double density_of_states_single_subband(double energy, double effective_mass, int dimension, EnergyUnit unit = EnergyUnit::eV);

}  // namespace pbands::dos
