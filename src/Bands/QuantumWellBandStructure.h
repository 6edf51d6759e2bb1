/**
 * @file QuantumWellBandStructure.h
 * @author remzerrr (remi.helleboid@gmail.com)
 * @brief Parabolic subbands of a quantum well (2D carriers).
 * @version 0.1
 * @date 2025-10-23
 *
 *
 */

#pragma once

#include <cstddef>
#include <vector>

#include "BandStructure.h"

namespace pbands {

/**
 * @brief Quantum well subbands: every valence subband uses the heavy hole mass of the material
 * and the dipole matrix element is 1 (strong confinement approximation).
 *
 */
class QuantumWellBandStructure : public BandStructure {
 public:
    static constexpr int dimension = 2;

    explicit QuantumWellBandStructure(const Material&            material,
                                      const std::vector<double>& edges_conduction = {0.0},
                                      const std::vector<double>& edges_valence    = {0.0, 0.0});

    // The material is referenced, a temporary would dangle.
    QuantumWellBandStructure(Material&&,
                             const std::vector<double>& = {0.0},
                             const std::vector<double>& = {0.0, 0.0}) = delete;

    using BandStructure::conduction_energy;
    using BandStructure::dipole;
    using BandStructure::valence_energy;

    int get_dimension() const override { return dimension; }

    double conduction_energy(std::size_t band_index, double k) const override;
    double valence_energy(std::size_t band_index, double k) const override;
    double dipole(std::size_t valence_index, std::size_t conduction_index, double k) const override;
    double get_valence_effective_mass(std::size_t band_index) const override;
};

}  // namespace pbands
