/**
 * @file BandStructure.cpp
 * @author remzerrr (remi.helleboid@gmail.com)
 * @brief
 * @version 0.1
 * @date 2025-10-22
 *
 *
 */

#include "BandStructure.h"

#include <fmt/core.h>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <functional>
#include <stdexcept>
#include <utility>

#include "density_of_states.hpp"
#include "numerical_helper.hpp"
#include "physical_constants.hpp"

namespace pbands {

CarrierType carrier_type_from_string(const std::string& name) {
    if (name == "electrons" || name == "electron") {
        return CarrierType::electrons;
    }
    if (name == "holes" || name == "hole") {
        return CarrierType::holes;
    }
    throw std::invalid_argument("Unknown carrier type: " + name + " (expected \"electrons\" or \"holes\").");
}

BandStructure::BandStructure(const Material& material, const std::vector<double>& edges_conduction, const std::vector<double>& edges_valence)
    : m_material(material),
      m_edges_conduction(numerical::shifted(edges_conduction, material.get_band_gap())),
      m_edges_valence(edges_valence) {
    if (m_edges_conduction.empty() || m_edges_valence.empty()) {
        throw std::invalid_argument("BandStructure: at least one conduction and one valence subband edge are required.");
    }
}

void BandStructure::check_conduction_index(std::size_t band_index, const char* caller) const {
    if (band_index >= m_edges_conduction.size()) {
        throw std::out_of_range(fmt::format("{}: conduction band index {} exceeds maximal value {}.",
                                            caller,
                                            band_index,
                                            m_edges_conduction.size() - 1));
    }
}

void BandStructure::check_valence_index(std::size_t band_index, const char* caller) const {
    if (band_index >= m_edges_valence.size()) {
        throw std::out_of_range(
            fmt::format("{}: valence band index {} exceeds maximal value {}.", caller, band_index, m_edges_valence.size() - 1));
    }
}

std::vector<double> BandStructure::conduction_energy(std::size_t band_index, const std::vector<double>& list_k) const {
    check_conduction_index(band_index, "conduction_energy");
    std::vector<double> energies;
    energies.reserve(list_k.size());
    for (double k : list_k) {
        energies.push_back(conduction_energy(band_index, k));
    }
    return energies;
}

std::vector<double> BandStructure::valence_energy(std::size_t band_index, const std::vector<double>& list_k) const {
    check_valence_index(band_index, "valence_energy");
    std::vector<double> energies;
    energies.reserve(list_k.size());
    for (double k : list_k) {
        energies.push_back(valence_energy(band_index, k));
    }
    return energies;
}

std::vector<double> BandStructure::dipole(std::size_t valence_index, std::size_t conduction_index, const std::vector<double>& list_k) const {
    check_valence_index(valence_index, "dipole");
    check_conduction_index(conduction_index, "dipole");
    std::vector<double> dipoles;
    dipoles.reserve(list_k.size());
    for (double k : list_k) {
        dipoles.push_back(dipole(valence_index, conduction_index, k));
    }
    return dipoles;
}

OpticalTransition BandStructure::optical_transition(const std::vector<double>& list_k,
                                                    std::size_t                valence_index,
                                                    std::size_t                conduction_index) const {
    return OpticalTransition{list_k,
                             valence_energy(valence_index, list_k),
                             conduction_energy(conduction_index, list_k),
                             dipole(valence_index, conduction_index, list_k)};
}

std::vector<double> BandStructure::density_of_states(const std::vector<double>& energy_eV, CarrierType carrier_type) const {
    const int           dimension = get_dimension();
    std::vector<double> dos(energy_eV.size(), 0.0);
    if (carrier_type == CarrierType::electrons) {
        for (double edge : m_edges_conduction) {
            const auto subband_dos = dos::density_of_states_single_subband(numerical::shifted(energy_eV, -edge / Constants::q_e),
                                                                           m_material.get_electron_mass(),
                                                                           dimension);
            std::transform(dos.begin(), dos.end(), subband_dos.begin(), dos.begin(), std::plus<double>());
        }
    } else {
        for (std::size_t idx_band = 0; idx_band < m_edges_valence.size(); ++idx_band) {
            const auto subband_dos = dos::density_of_states_single_subband(
                numerical::shifted(energy_eV, m_edges_valence[idx_band] / Constants::q_e),
                get_valence_effective_mass(idx_band),
                dimension);
            std::transform(dos.begin(), dos.end(), subband_dos.begin(), dos.begin(), std::plus<double>());
        }
    }
    return dos;
}

double BandStructure::get_conduction_band_bottom_eV() const {
    return *std::min_element(m_edges_conduction.begin(), m_edges_conduction.end()) / Constants::q_e;
}

double BandStructure::get_valence_band_top_eV() const {
    return -*std::max_element(m_edges_valence.begin(), m_edges_valence.end()) / Constants::q_e;
}

/**
 * @brief Tabulate density -> Fermi level for electrons and holes.
 *
 * The Fermi levels are probed from mid-gap up to a fixed distance into each band; the density is the
 * trapezoidal integral of f * g over an energy window anchored at the band edge. Everything is done
 * relative to the band edge of each carrier type.
 *
 * @param temperature_K
 * @return fermi::FermiLevelTables
 */
fermi::FermiLevelTables BandStructure::compute_fermi_level_tables(double temperature_K) const {
    const double half_gap_eV               = 0.5 * m_material.get_band_gap() / Constants::q_e;
    const double conduction_band_bottom_eV = get_conduction_band_bottom_eV();
    const double valence_band_top_eV       = get_valence_band_top_eV();

    const auto energies_electrons =
        numerical::linspace(m_electron_grid.energy_min_eV, m_electron_grid.energy_max_eV, m_electron_grid.nb_energies);
    const auto dos_electrons =
        density_of_states(numerical::shifted(energies_electrons, conduction_band_bottom_eV), CarrierType::electrons);
    const auto probes_electrons =
        numerical::linspace(half_gap_eV - conduction_band_bottom_eV, m_electron_grid.probe_max_eV, m_electron_grid.nb_probes);

    const auto energies_holes = numerical::linspace(m_hole_grid.energy_min_eV, m_hole_grid.energy_max_eV, m_hole_grid.nb_energies);
    const auto dos_holes      = density_of_states(numerical::shifted(energies_holes, valence_band_top_eV), CarrierType::holes);
    const auto probes_holes   = numerical::linspace(-half_gap_eV - valence_band_top_eV, m_hole_grid.probe_max_eV, m_hole_grid.nb_probes);

    return fermi::FermiLevelTables{
        fermi::compute_density_to_fermi_level_table(energies_electrons, dos_electrons, probes_electrons, temperature_K),
        fermi::compute_density_to_fermi_level_table(energies_holes, dos_holes, probes_holes, temperature_K)};
}

const fermi::FermiLevelTables& BandStructure::get_fermi_level_tables(double temperature_K) {
    if (!(temperature_K > 0.0) || !std::isfinite(temperature_K)) {
        throw std::invalid_argument("BandStructure: temperature must be > 0 K (T = " + std::to_string(temperature_K) + ")");
    }
    auto it = m_fermi_levels_cache.find(temperature_K);
    if (it != m_fermi_levels_cache.end()) {
        return it->second;
    }
    auto start  = std::chrono::high_resolution_clock::now();
    auto tables = compute_fermi_level_tables(temperature_K);
    auto end    = std::chrono::high_resolution_clock::now();
    fmt::print("Fermi level tables at T = {} K ({}D, {} + {} probes) computed in {} ms.\n",
               temperature_K,
               get_dimension(),
               m_electron_grid.nb_probes,
               m_hole_grid.nb_probes,
               std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count());
    return m_fermi_levels_cache.emplace(temperature_K, std::move(tables)).first->second;
}

FermiLevels BandStructure::fermi_levels(double temperature_K, double density) {
    if (!std::isfinite(density)) {
        throw std::invalid_argument("BandStructure::fermi_levels: density must be finite.");
    }
    const fermi::FermiLevelTables& tables = get_fermi_level_tables(temperature_K);

    const double fermi_holes     = tables.holes(density);
    const double fermi_electrons = tables.electrons(density);
    return FermiLevels{-(fermi_holes + get_valence_band_top_eV()) * Constants::q_e,
                       (fermi_electrons + get_conduction_band_bottom_eV()) * Constants::q_e};
}

void BandStructure::set_sampling_grids(const fermi::SamplingGrid& electron_grid, const fermi::SamplingGrid& hole_grid) {
    m_electron_grid = electron_grid;
    m_hole_grid     = hole_grid;
    m_fermi_levels_cache.clear();
}

}  // namespace pbands
