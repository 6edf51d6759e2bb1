/**
 * @file BandStructure.h
 * @author remzerrr (remi.helleboid@gmail.com)
 * @brief Parabolic band structure interface, shared DOS and Fermi level machinery.
 * @version 0.1
 * @date 2025-10-22
 *
 *
 */

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "Material.h"
#include "fermi_level.hpp"

namespace pbands {

enum class CarrierType { electrons, holes };

/**
 * @brief Parse "electrons"/"electron" or "holes"/"hole". Any other string is rejected.
 *
 * @param name
 * @return CarrierType
 */
CarrierType carrier_type_from_string(const std::string& name);

/**
 * @brief Quasi-Fermi levels of holes and electrons, absolute energies in J.
 *
 */
struct FermiLevels {
    double holes;
    double electrons;
};

/**
 * @brief Data of an optical transition between one valence and one conduction subband along k.
 *
 */
struct OpticalTransition {
    std::vector<double> k;
    std::vector<double> valence_energy;
    std::vector<double> conduction_energy;
    std::vector<double> dipole;
};

/**
 * @brief Band structure in the parabolic band approximation.
 *
 * Energies are in J. The valence band top of the bulk material is the energy origin and the
 * conduction edges passed at construction are shifted by the band gap of the material.
 * The material is referenced, not owned: it must outlive the band structure.
 *
 * Fermi level tables are computed once per temperature and kept for the lifetime of the object
 * (no eviction).
 *
 */
class BandStructure {
 protected:
    const Material&     m_material;
    std::vector<double> m_edges_conduction;
    std::vector<double> m_edges_valence;

    fermi::SamplingGrid m_electron_grid = fermi::default_electron_grid();
    fermi::SamplingGrid m_hole_grid     = fermi::default_hole_grid();

    std::map<double, fermi::FermiLevelTables> m_fermi_levels_cache;

    void check_conduction_index(std::size_t band_index, const char* caller) const;
    void check_valence_index(std::size_t band_index, const char* caller) const;

    fermi::FermiLevelTables compute_fermi_level_tables(double temperature_K) const;

 public:
    /**
     * @brief Construct a new Band Structure object.
     *
     * @param material
     * @param edges_conduction Conduction subband edges relative to the bulk conduction band edge, in J.
     * @param edges_valence Valence subband edges relative to the bulk valence band top, in J.
     */
    BandStructure(const Material& material, const std::vector<double>& edges_conduction, const std::vector<double>& edges_valence);
    BandStructure(Material&&, const std::vector<double>&, const std::vector<double>&) = delete;
    virtual ~BandStructure() = default;

    virtual int get_dimension() const = 0;

    /**
     * @brief Conduction subband energy at k (k in 1/m).
     *
     */
    virtual double conduction_energy(std::size_t band_index, double k) const = 0;

    /**
     * @brief Valence subband energy at k (k in 1/m).
     *
     */
    virtual double valence_energy(std::size_t band_index, double k) const = 0;

    /**
     * @brief Interband dipole matrix element between a valence and a conduction subband.
     *
     */
    virtual double dipole(std::size_t valence_index, std::size_t conduction_index, double k) const = 0;

    virtual double get_valence_effective_mass(std::size_t band_index) const = 0;

    std::vector<double> conduction_energy(std::size_t band_index, const std::vector<double>& list_k) const;
    std::vector<double> valence_energy(std::size_t band_index, const std::vector<double>& list_k) const;
    std::vector<double> dipole(std::size_t valence_index, std::size_t conduction_index, const std::vector<double>& list_k) const;

    OpticalTransition optical_transition(const std::vector<double>& list_k, std::size_t valence_index, std::size_t conduction_index) const;

    /**
     * @brief Sum of the subband DOS at the model dimension, per Joule per unit volume (3D) or area (2D).
     *
     * For electrons the energy (eV) is on the absolute scale, increasing upward. For holes it is
     * the hole energy, increasing downward from the valence band top of the bulk material.
     *
     * @param energy_eV
     * @param carrier_type
     * @return std::vector<double>
     */
    std::vector<double> density_of_states(const std::vector<double>& energy_eV, CarrierType carrier_type) const;

    /**
     * @brief Quasi-Fermi levels reproducing the given carrier density (m^-3 in 3D, m^-2 in 2D)
     * for both electrons and holes.
     *
     * @param temperature_K Must be > 0.
     * @param density
     * @return FermiLevels
     */
    FermiLevels fermi_levels(double temperature_K, double density);

    /**
     * @brief Cached density -> Fermi level tables at the given temperature, computed on first use.
     * The reference is invalidated by set_sampling_grids, which empties the cache.
     *
     * @param temperature_K
     * @return const fermi::FermiLevelTables&
     */
    const fermi::FermiLevelTables& get_fermi_level_tables(double temperature_K);

    std::size_t get_number_cached_temperatures() const { return m_fermi_levels_cache.size(); }

    /**
     * @brief Change the Fermi level sampling. Clears the cache: references returned by
     * get_fermi_level_tables before the call must not be used afterwards.
     *
     * @param electron_grid
     * @param hole_grid
     */
    void set_sampling_grids(const fermi::SamplingGrid& electron_grid, const fermi::SamplingGrid& hole_grid);

    const Material&            get_material() const { return m_material; }
    const std::vector<double>& get_conduction_edges() const { return m_edges_conduction; }
    const std::vector<double>& get_valence_edges() const { return m_edges_valence; }
    std::size_t                get_number_conduction_subbands() const { return m_edges_conduction.size(); }
    std::size_t                get_number_valence_subbands() const { return m_edges_valence.size(); }

    /**
     * @brief Lowest conduction subband edge, in eV.
     *
     */
    double get_conduction_band_bottom_eV() const;

    /**
     * @brief Highest valence subband edge on the hole energy axis (-max(edges_v)), in eV.
     *
     */
    double get_valence_band_top_eV() const;
};

}  // namespace pbands
