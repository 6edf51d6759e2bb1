/**
 * @file Material.h
 * @author remzerrr (remi.helleboid@gmail.com)
 * @brief Semiconductor parameters for parabolic band models.
 * @version 0.1
 * @date 2025-10-20
 *
 *
 */

#pragma once

#include <map>
#include <string>

#include "yaml-cpp/yaml.h"

namespace pbands {

/**
 * @brief Empirical law used to correct the band gap for the lattice temperature.
 *
 */
enum class TemperatureModel { none, varshni, odonnell_chen };

/**
 * @brief Parse a temperature model selector ("varshni", "odonnell", "odonnell-chen").
 * Any other string gives TemperatureModel::none, which leaves the nominal gap untouched.
 *
 * @param name
 * @return TemperatureModel
 */
TemperatureModel temperature_model_from_string(const std::string& name);

std::string to_string(TemperatureModel model);

/**
 * @brief Nominal (0 K) parameters of a semiconductor.
 * Energies in eV, masses in units of the free electron mass.
 *
 */
struct MaterialParameters {
    std::string m_name;
    std::string m_symbol;

    double m_band_gap_eV         = 0.0;
    double m_spin_orbit_split_eV = 0.0;

    /**
     * @brief Luttinger parameters. When m_gamma_1 is non-zero, the heavy and light hole masses
     * are computed from them along [001] and m_heavy_hole_mass / m_light_hole_mass are ignored.
     *
     */
    double m_gamma_1 = 0.0;
    double m_gamma_2 = 0.0;
    double m_gamma_3 = 0.0;

    double m_electron_mass   = 1.0;
    double m_heavy_hole_mass = 1.0;
    double m_light_hole_mass = 1.0;
    double m_split_off_mass  = 1.0;

    double m_permittivity     = 1.0;
    double m_refractive_index = 1.0;

    double m_varshni_alpha_meV_K = 0.0;
    double m_varshni_beta_K      = 0.0;

    double m_odonnell_coupling          = 0.0;
    double m_odonnell_phonon_energy_meV = 0.0;

    /**
     * @brief Energy of the momentum matrix element between conduction and valence bands (Kane energy), in eV.
     *
     */
    double m_kane_energy_eV = 0.0;

    /**
     * @brief Populate the parameters from a YAML node of the material database.
     *
     * @param node
     */
    void populate_from_yaml(const YAML::Node& node);
};

/**
 * @brief Band-structure relevant parameters of a semiconductor at a given lattice temperature.
 * All the quantities are in SI units (J, kg, m). The object is immutable once constructed.
 *
 */
class Material {
 private:
    std::string m_name;

    double           m_temperature;
    TemperatureModel m_temperature_model;

    /**
     * @brief Temperature corrected band gap, in J.
     *
     */
    double m_band_gap;

    /**
     * @brief Offset of the spin-orbit split-off band, in J (negative).
     *
     */
    double m_spin_orbit_split;

    double m_electron_mass;
    double m_heavy_hole_mass;
    double m_light_hole_mass;
    double m_split_off_mass;

    double m_permittivity;
    double m_refractive_index;

    /**
     * @brief Kane energy, in eV.
     *
     */
    double m_kane_energy_eV;

    // Exciton scaling constants.
    double m_reduced_mass;
    double m_bohr_radius;
    double m_rydberg_ratio;

 public:
    /**
     * @brief Build the material at the given temperature.
     *
     * @param parameters Nominal parameters.
     * @param temperature_K Lattice temperature, >= 0 (> 0 for the O'Donnell-Chen model).
     * @param model Band gap temperature law.
     */
    explicit Material(const MaterialParameters& parameters,
                      double                    temperature_K = 0.0,
                      TemperatureModel          model         = TemperatureModel::varshni);

    /**
     * @brief GaAs parameters from I. Vurgaftman, J. R. Meyer, and L. R. Ram-Mohan, J. Appl. Phys., 89 (11), 2001.
     *
     */
    static MaterialParameters GaAs_parameters();
    static Material           GaAs(double temperature_K = 0.0, TemperatureModel model = TemperatureModel::varshni);

    /**
     * @brief Toy two-band material (equal electron and hole masses of 2 m0), used to check the solvers.
     *
     */
    static MaterialParameters two_band_test_parameters();
    static Material           two_band_test_material();

    const std::string& get_name() const { return m_name; }
    double             get_temperature() const { return m_temperature; }
    TemperatureModel   get_temperature_model() const { return m_temperature_model; }

    double get_band_gap() const { return m_band_gap; }
    double get_spin_orbit_split() const { return m_spin_orbit_split; }

    double get_electron_mass() const { return m_electron_mass; }
    double get_heavy_hole_mass() const { return m_heavy_hole_mass; }
    double get_light_hole_mass() const { return m_light_hole_mass; }
    double get_split_off_mass() const { return m_split_off_mass; }

    double get_permittivity() const { return m_permittivity; }
    double get_refractive_index() const { return m_refractive_index; }
    double get_kane_energy_eV() const { return m_kane_energy_eV; }

    /**
     * @brief Electron / heavy-hole reduced mass, in kg.
     *
     */
    double get_reduced_mass() const { return m_reduced_mass; }

    /**
     * @brief Effective exciton Bohr radius, in m.
     *
     */
    double get_bohr_radius() const { return m_bohr_radius; }

    /**
     * @brief Effective exciton Rydberg energy in units of the hydrogen Rydberg energy.
     *
     */
    double get_rydberg_ratio() const { return m_rydberg_ratio; }

    void print_parameters() const;
};

/**
 * @brief Material database, read from a YAML parameter file.
 *
 */
class Materials {
 public:
    Materials() = default;
    void load_material_parameters(const std::string& filename);

    std::map<std::string, MaterialParameters> materials;

    const MaterialParameters& get_material(const std::string& symbol) const;

    void print_materials_list() const;
};

}  // namespace pbands
