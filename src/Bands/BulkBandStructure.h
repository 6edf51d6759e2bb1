/**
 * @file BulkBandStructure.h
 * @author remzerrr (remi.helleboid@gmail.com)
 * @brief Parabolic band structure of a bulk (3D) semiconductor.
 * @version 0.1
 * @date 2025-10-22
 *
 *
 */

#pragma once

#include <cstddef>
#include <vector>

#include "BandStructure.h"

namespace pbands {

/**
 * @brief One conduction band mass and up to three valence bands:
 * heavy hole (index 0), light hole (index 1) and split-off (index 2).
 *
 */
class BulkBandStructure : public BandStructure {
 public:
    static constexpr int dimension = 3;

    explicit BulkBandStructure(const Material&            material,
                               const std::vector<double>& edges_conduction = {0.0},
                               const std::vector<double>& edges_valence    = {0.0, 0.0});

    // The material is referenced, a temporary would dangle.
    BulkBandStructure(Material&&,
                      const std::vector<double>& = {0.0},
                      const std::vector<double>& = {0.0, 0.0}) = delete;

    using BandStructure::conduction_energy;
    using BandStructure::dipole;
    using BandStructure::valence_energy;

    int get_dimension() const override { return dimension; }

    double conduction_energy(std::size_t band_index, double k) const override;
    double valence_energy(std::size_t band_index, double k) const override;

    /**
     * @brief Two-band interband dipole, p * Eg / (Ec(k) - Ev(k)) with p = sqrt(e * E_P * hbar^2 / (2 m0)).
     *
     */
    double dipole(std::size_t valence_index, std::size_t conduction_index, double k) const override;

    /**
     * @brief Mass of the heavy hole, light hole or split-off band.
     * Indices above 2 have no mass and raise std::out_of_range.
     *
     */
    double get_valence_effective_mass(std::size_t band_index) const override;
};

}  // namespace pbands
