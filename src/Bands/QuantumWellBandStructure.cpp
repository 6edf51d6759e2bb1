/**
 * @file QuantumWellBandStructure.cpp
 * @author remzerrr (remi.helleboid@gmail.com)
 * @brief
 * @version 0.1
 * @date 2025-10-23
 *
 *
 */

#include "QuantumWellBandStructure.h"

#include "physical_constants.hpp"

namespace pbands {

QuantumWellBandStructure::QuantumWellBandStructure(const Material&            material,
                                                   const std::vector<double>& edges_conduction,
                                                   const std::vector<double>& edges_valence)
    : BandStructure(material, edges_conduction, edges_valence) {}

double QuantumWellBandStructure::conduction_energy(std::size_t band_index, double k) const {
    check_conduction_index(band_index, "QuantumWellBandStructure::conduction_energy");
    return m_edges_conduction[band_index] + Constants::h_bar * Constants::h_bar * k * k / (2 * m_material.get_electron_mass());
}

double QuantumWellBandStructure::valence_energy(std::size_t band_index, double k) const {
    check_valence_index(band_index, "QuantumWellBandStructure::valence_energy");
    return m_edges_valence[band_index] - Constants::h_bar * Constants::h_bar * k * k / (2 * get_valence_effective_mass(band_index));
}

double QuantumWellBandStructure::dipole(std::size_t valence_index, std::size_t conduction_index, double /*k*/) const {
    check_valence_index(valence_index, "QuantumWellBandStructure::dipole");
    check_conduction_index(conduction_index, "QuantumWellBandStructure::dipole");
    return 1.0;
}

double QuantumWellBandStructure::get_valence_effective_mass(std::size_t band_index) const {
    check_valence_index(band_index, "QuantumWellBandStructure::get_valence_effective_mass");
    return m_material.get_heavy_hole_mass();
}

}  // namespace pbands
