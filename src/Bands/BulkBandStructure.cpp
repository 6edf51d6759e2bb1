/**
 * @file BulkBandStructure.cpp
 * @author remzerrr (remi.helleboid@gmail.com)
 * @brief
 * @version 0.1
 * @date 2025-10-22
 *
 *
 */

#include "BulkBandStructure.h"

#include <cmath>
#include <stdexcept>
#include <string>

#include "physical_constants.hpp"

namespace pbands {

BulkBandStructure::BulkBandStructure(const Material&            material,
                                     const std::vector<double>& edges_conduction,
                                     const std::vector<double>& edges_valence)
    : BandStructure(material, edges_conduction, edges_valence) {}

double BulkBandStructure::conduction_energy(std::size_t band_index, double k) const {
    check_conduction_index(band_index, "BulkBandStructure::conduction_energy");
    return m_edges_conduction[band_index] + Constants::h_bar * Constants::h_bar * k * k / (2 * m_material.get_electron_mass());
}

double BulkBandStructure::valence_energy(std::size_t band_index, double k) const {
    check_valence_index(band_index, "BulkBandStructure::valence_energy");
    return m_edges_valence[band_index] - Constants::h_bar * Constants::h_bar * k * k / (2 * get_valence_effective_mass(band_index));
}

double BulkBandStructure::dipole(std::size_t valence_index, std::size_t conduction_index, double k) const {
    check_valence_index(valence_index, "BulkBandStructure::dipole");
    check_conduction_index(conduction_index, "BulkBandStructure::dipole");

    const double p = std::sqrt(Constants::q_e * m_material.get_kane_energy_eV() * Constants::h_bar / Constants::m_e * Constants::h_bar / 2);
    return p * m_material.get_band_gap() / (conduction_energy(conduction_index, k) - valence_energy(valence_index, k));
}

double BulkBandStructure::get_valence_effective_mass(std::size_t band_index) const {
    switch (band_index) {
        case 0:
            return m_material.get_heavy_hole_mass();
        case 1:
            return m_material.get_light_hole_mass();
        case 2:
            return m_material.get_split_off_mass();
        default:
            throw std::out_of_range("BulkBandStructure: no valence band with index " + std::to_string(band_index) +
                                    " (0: heavy hole, 1: light hole, 2: split-off).");
    }
}

}  // namespace pbands
