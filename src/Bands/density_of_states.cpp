/**
 * @file density_of_states.cpp
 * @author remzerrr (remi.helleboid@gmail.com)
 * @brief
 * @version 0.1
 * @date 2025-10-21
 *
 *
 */

#include "density_of_states.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "physical_constants.hpp"

namespace pbands::dos {

/**
 * @brief Integrated solid angle of the d-dimensional k-space.
 *
 * @param dimension
 * @return double
 */
static double solid_angle(int dimension) {
    switch (dimension) {
        case 1:
            return 2.0;
        case 2:
            return 2.0 * Constants::pi;
        case 3:
            return 4.0 * Constants::pi;
        default:
            throw std::invalid_argument("density_of_states: dimension must be 1, 2 or 3 (got " + std::to_string(dimension) + ")");
    }
}

double density_of_states_single_subband(double energy, double effective_mass, int dimension, EnergyUnit unit) {
    const double omega_D = solid_angle(dimension);
    if (!(effective_mass > 0.0)) {
        throw std::invalid_argument("density_of_states: effective mass must be positive.");
    }
    const double alpha       = (unit == EnergyUnit::eV) ? Constants::q_e : 1.0;
    const double energy_J    = energy * alpha;
    const double half_dim    = 0.5 * static_cast<double>(dimension);
    const double pre_factor  = omega_D / std::pow(2.0 * Constants::pi, dimension) *
                              std::pow(2.0 * effective_mass / Constants::h_bar / Constants::h_bar, half_dim);
    if (energy_J < 0.0 || std::isnan(energy_J)) {
        return 0.0;
    }
    if (energy_J == 0.0) {
        // Band edge: step gate is 1/2, the 1D divergence is floored to 0.
        const double power_at_edge = (dimension == 2) ? 1.0 : 0.0;
        return pre_factor * power_at_edge * 0.5;
    }
    return pre_factor * std::pow(energy_J, 0.5 * static_cast<double>(dimension - 2));
}

std::vector<double> density_of_states_single_subband(const std::vector<double>& energy,
                                                     double                     effective_mass,
                                                     int                        dimension,
                                                     EnergyUnit                 unit) {
    std::vector<double> dos;
    dos.reserve(energy.size());
    for (double value : energy) {
        dos.push_back(density_of_states_single_subband(value, effective_mass, dimension, unit));
    }
    return dos;
}

}  // namespace pbands::dos
