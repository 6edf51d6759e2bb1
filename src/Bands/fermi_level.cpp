/**
 * @file fermi_level.cpp
 * @author remzerrr (remi.helleboid@gmail.com)
 * @brief
 * @version 0.1
 * @date 2025-10-13
 *
 *
 */

#include "fermi_level.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "integrals.hpp"  // pbands::integrate::trapz
#include "physical_constants.hpp"
#include "physical_functions.hpp"  // pbands::physics::fermi_dirac_distribution

namespace pbands::fermi {

double carrier_density(const std::vector<double>& energies_eV, const std::vector<double>& dos, double fermi_level_eV, double temperature_K) {
    if (energies_eV.size() != dos.size()) {
        throw std::invalid_argument("carrier_density: energy and DOS arrays must have the same size.");
    }
    std::vector<double> energies_J;
    std::vector<double> w;
    energies_J.reserve(energies_eV.size());
    w.reserve(energies_eV.size());
    for (std::size_t i = 0; i < energies_eV.size(); ++i) {
        energies_J.push_back(energies_eV[i] * Constants::q_e);
        w.push_back(dos[i] * physics::fermi_dirac_distribution(energies_eV[i], fermi_level_eV, temperature_K));
    }
    return integrate::trapz(energies_J, w);
}

interpolate::LinearInterpolant compute_density_to_fermi_level_table(const std::vector<double>& energies_eV,
                                                                    const std::vector<double>& dos,
                                                                    const std::vector<double>& probe_fermi_levels_eV,
                                                                    double                     temperature_K) {
    std::vector<double> list_densities;
    std::vector<double> list_fermi_levels;
    list_densities.reserve(probe_fermi_levels_eV.size());
    list_fermi_levels.reserve(probe_fermi_levels_eV.size());
    for (double fermi_level : probe_fermi_levels_eV) {
        const double density = carrier_density(energies_eV, dos, fermi_level, temperature_K);
        if (!list_densities.empty() && !(density > list_densities.back())) {
            continue;
        }
        list_densities.push_back(density);
        list_fermi_levels.push_back(fermi_level);
    }
    if (list_densities.size() < 2) {
        throw std::runtime_error("compute_density_to_fermi_level_table: less than 2 distinct densities sampled at T = " +
                                 std::to_string(temperature_K) + " K.");
    }
    return interpolate::LinearInterpolant(list_densities, list_fermi_levels);
}

double analytic_fermi_level_2d(double effective_mass, double temperature_K, double density) {
    if (!(temperature_K > 0.0)) {
        throw std::invalid_argument("analytic_fermi_level_2d: temperature must be > 0 K.");
    }
    const double beta = 1.0 / (Constants::k_B * temperature_K);
    const double x    = Constants::h_bar * beta * Constants::pi * density * Constants::h_bar / effective_mass;
    return Constants::k_b_eV * temperature_K * std::log(std::expm1(x));
}

}  // namespace pbands::fermi
