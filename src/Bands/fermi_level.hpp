/**
 * @file fermi_level.hpp
 * @author remzerrr (remi.helleboid@gmail.com)
 * @brief Carrier density integration and density -> Fermi level tables.
 * @version 0.1
 * @date 2025-10-13
 *
 *
 */

#pragma once

#include <cstddef>
#include <vector>

#include "interpolation.hpp"

namespace pbands::fermi {

/**
 * @brief Sampling used to tabulate the carrier density as a function of the Fermi level.
 * Energies are relative to the band edge of the carrier type, in eV. The lower bound of the
 * probed Fermi levels is mid-gap and is set by the band structure.
 *
 */
struct SamplingGrid {
    double      probe_max_eV  = 1.5;
    std::size_t nb_probes     = 50;
    double      energy_min_eV = -0.5;
    double      energy_max_eV = 5.0;
    std::size_t nb_energies   = 3000;
};

inline SamplingGrid default_electron_grid() { return SamplingGrid{1.5, 50, -0.5, 5.0, 3000}; }
inline SamplingGrid default_hole_grid() { return SamplingGrid{1.0, 550, 0.0, 10.0, 350}; }

/**
 * @brief Density -> Fermi level maps for one temperature. Fermi levels are in eV relative to the
 * band edge of each carrier type (hole levels are counted positive into the valence band).
 *
 */
struct FermiLevelTables {
    interpolate::LinearInterpolant electrons;
    interpolate::LinearInterpolant holes;
};

/**
 * @brief Integrate f(E, Ef, T) * g(E) over the energy grid (trapezoidal rule).
 *
 * @param energies_eV
 * @param dos DOS per Joule per unit length/area/volume.
 * @param fermi_level_eV
 * @param temperature_K
 * @return double Carrier density per unit length/area/volume.
 */
double carrier_density(const std::vector<double>& energies_eV, const std::vector<double>& dos, double fermi_level_eV, double temperature_K);

/**
 * @brief Tabulate the carrier density for each probe Fermi level and return the inverse map
 * density -> Fermi level.
 *
 * Densities that do not increase strictly with the probe level (underflow of the occupation far
 * below the edge) are skipped so that the map stays invertible.
 *
 * @param energies_eV
 * @param dos
 * @param probe_fermi_levels_eV Increasing probe Fermi levels.
 * @param temperature_K
 * @return interpolate::LinearInterpolant
 */
interpolate::LinearInterpolant compute_density_to_fermi_level_table(const std::vector<double>& energies_eV,
                                                                    const std::vector<double>& dos,
                                                                    const std::vector<double>& probe_fermi_levels_eV,
                                                                    double                     temperature_K);

/**
 * @brief Closed-form Fermi level of a single 2D parabolic subband,
 * Ef = kT ln(exp(pi hbar^2 n / (m kT)) - 1).
 *
 * @param effective_mass In kg.
 * @param temperature_K
 * @param density In m^-2.
 * @return double Fermi level relative to the subband edge, in eV.
 */
double analytic_fermi_level_2d(double effective_mass, double temperature_K, double density);

}  // namespace pbands::fermi
