/**
 * @file physical_functions.hpp
 * @author remzerrr (remi.helleboid@gmail.com)
 * @brief Occupation statistics and empirical band-gap temperature laws.
 * @version 0.1
 * @date 2025-10-12
 *
 *
 */

#pragma once

#include <cmath>
#include <stdexcept>
#include <string>

#include "physical_constants.hpp"

namespace pbands {

namespace physics {

/**
 * @brief Fermi-Dirac occupation probability 1 / (1 + exp((E - Ef) / kT)).
 *
 * The temperature must be strictly positive: the T -> 0 limit is a step function that the
 * density integration cannot use, so it is reported as an error.
 *
 * @param energy_eV
 * @param fermi_level_eV
 * @param temperature_K
 * @return double
 */
inline double fermi_dirac_distribution(double energy_eV, double fermi_level_eV, double temperature_K) {
    if (!(temperature_K > 0.0) || !std::isfinite(temperature_K)) {
        throw std::invalid_argument("fermi_dirac_distribution: temperature must be > 0 K (T = " + std::to_string(temperature_K) + ")");
    }
    const double kT = Constants::k_b_eV * temperature_K;
    const double x  = (energy_eV - fermi_level_eV) / kT;

    // No cutoff on |x|: densities sampled far from the edge must stay strictly ordered.
    if (x > 0.0) {
        const double emx = std::exp(-x);
        return emx / (1.0 + emx);
    } else {
        const double ex = std::exp(x);
        return 1.0 / (1.0 + ex);
    }
}

/**
 * @brief Varshni law for the band gap reduction, in eV.
 * Eg(T) = Eg(0) - alpha * T^2 / (T + beta).
 *
 * @param alpha_meV_K Varshni alpha in meV/K.
 * @param beta_K Varshni beta in K.
 * @param temperature_K
 * @return double
 */
inline double varshni_gap_shift(double alpha_meV_K, double beta_K, double temperature_K) {
    return Constants::meV_to_eV * alpha_meV_K * temperature_K * temperature_K / (temperature_K + beta_K);
}

/**
 * @brief O'Donnell-Chen law for the band gap reduction, in eV.
 * Eg(T) = Eg(0) - S <hw> (coth(<hw> / 2kT) - 1), see Appl. Phys. Lett. 58 (25) (1991).
 *
 * @param coupling Dimensionless electron-phonon coupling S.
 * @param phonon_energy_meV Average phonon energy <hw> in meV.
 * @param temperature_K Must be > 0.
 * @return double
 */
inline double odonnell_chen_gap_shift(double coupling, double phonon_energy_meV, double temperature_K) {
    if (!(temperature_K > 0.0)) {
        throw std::invalid_argument("odonnell_chen_gap_shift: temperature must be > 0 K (T = " + std::to_string(temperature_K) + ")");
    }
    const double phonon_energy_eV = Constants::meV_to_eV * phonon_energy_meV;
    const double x                = phonon_energy_eV / (2.0 * Constants::k_b_eV * temperature_K);
    return phonon_energy_eV * coupling * (1.0 / std::tanh(x) - 1.0);
}

}  // namespace physics

}  // namespace pbands
