#include "Material.h"

#include <fmt/core.h>

#include <cmath>
#include <stdexcept>

#include "physical_constants.hpp"
#include "physical_functions.hpp"

namespace pbands {

TemperatureModel temperature_model_from_string(const std::string& name) {
    if (name == "varshni") {
        return TemperatureModel::varshni;
    }
    if (name == "odonnell" || name == "odonnell-chen") {
        return TemperatureModel::odonnell_chen;
    }
    return TemperatureModel::none;
}

std::string to_string(TemperatureModel model) {
    switch (model) {
        case TemperatureModel::varshni:
            return "varshni";
        case TemperatureModel::odonnell_chen:
            return "odonnell-chen";
        default:
            return "none";
    }
}

void MaterialParameters::populate_from_yaml(const YAML::Node& node) {
    m_name                = node["name"].as<std::string>();
    m_symbol              = node["symbol"].as<std::string>();
    m_band_gap_eV         = node["band-gap"].as<double>();
    m_spin_orbit_split_eV = node["spin-orbit-split"].as<double>(0.0);

    auto node_masses = node["effective-masses"];
    m_electron_mass  = node_masses["electron"].as<double>();
    m_split_off_mass = node_masses["split-off"].as<double>(1.0);
    auto node_luttinger = node["luttinger-parameters"];
    if (node_luttinger) {
        m_gamma_1 = node_luttinger["gamma1"].as<double>();
        m_gamma_2 = node_luttinger["gamma2"].as<double>();
        m_gamma_3 = node_luttinger["gamma3"].as<double>();
    } else {
        m_heavy_hole_mass = node_masses["heavy-hole"].as<double>();
        m_light_hole_mass = node_masses["light-hole"].as<double>(m_heavy_hole_mass);
    }

    m_permittivity     = node["permittivity"].as<double>();
    m_refractive_index = node["refractive-index"].as<double>();
    m_kane_energy_eV   = node["kane-energy"].as<double>(0.0);

    auto node_varshni = node["varshni"];
    if (node_varshni) {
        m_varshni_alpha_meV_K = node_varshni["alpha"].as<double>();
        m_varshni_beta_K      = node_varshni["beta"].as<double>();
    }
    auto node_odonnell = node["odonnell-chen"];
    if (node_odonnell) {
        m_odonnell_coupling          = node_odonnell["coupling"].as<double>();
        m_odonnell_phonon_energy_meV = node_odonnell["phonon-energy"].as<double>();
    }
}

Material::Material(const MaterialParameters& parameters, double temperature_K, TemperatureModel model)
    : m_name(parameters.m_symbol),
      m_temperature(temperature_K),
      m_temperature_model(model),
      m_band_gap(parameters.m_band_gap_eV * Constants::q_e),
      m_spin_orbit_split(parameters.m_spin_orbit_split_eV * Constants::q_e),
      m_electron_mass(parameters.m_electron_mass * Constants::m_e),
      m_heavy_hole_mass(parameters.m_heavy_hole_mass * Constants::m_e),
      m_light_hole_mass(parameters.m_light_hole_mass * Constants::m_e),
      m_split_off_mass(parameters.m_split_off_mass * Constants::m_e),
      m_permittivity(parameters.m_permittivity),
      m_refractive_index(parameters.m_refractive_index),
      m_kane_energy_eV(parameters.m_kane_energy_eV) {
    if (!std::isfinite(temperature_K) || temperature_K < 0.0) {
        throw std::invalid_argument("Material: temperature must be a finite value >= 0 K (T = " + std::to_string(temperature_K) + ")");
    }

    if (parameters.m_gamma_1 != 0.0) {
        m_heavy_hole_mass = Constants::m_e / (parameters.m_gamma_1 - 2 * parameters.m_gamma_2);
        m_light_hole_mass = Constants::m_e / (parameters.m_gamma_1 + 2 * parameters.m_gamma_2);
    }

    const double e = Constants::q_e;
    m_reduced_mass = m_electron_mass / (m_heavy_hole_mass + m_electron_mass) * m_heavy_hole_mass;
    m_bohr_radius  = Constants::h_bar / e * Constants::eps_0 * m_permittivity * Constants::h_bar / e / m_reduced_mass * 4 * Constants::pi;
    m_rydberg_ratio = (e / Constants::eps_0 / m_permittivity) * (e / (2 * m_bohr_radius)) / Constants::e_Ry;

    if (model == TemperatureModel::varshni) {
        m_band_gap -= e * physics::varshni_gap_shift(parameters.m_varshni_alpha_meV_K, parameters.m_varshni_beta_K, temperature_K);
    } else if (model == TemperatureModel::odonnell_chen) {
        if (!(temperature_K > 0.0)) {
            throw std::invalid_argument("Material: the O'Donnell-Chen model requires a temperature > 0 K.");
        }
        m_band_gap -= e * physics::odonnell_chen_gap_shift(parameters.m_odonnell_coupling,
                                                            parameters.m_odonnell_phonon_energy_meV,
                                                            temperature_K);
    }
}

MaterialParameters Material::GaAs_parameters() {
    MaterialParameters parameters;
    parameters.m_name                = "Gallium Arsenide";
    parameters.m_symbol              = "GaAs";
    parameters.m_band_gap_eV         = 1.519;
    parameters.m_spin_orbit_split_eV = -0.341;

    parameters.m_gamma_1 = 6.98;
    parameters.m_gamma_2 = 2.06;
    parameters.m_gamma_3 = 2.93;

    parameters.m_electron_mass  = 0.0665;
    parameters.m_split_off_mass = 0.172;

    parameters.m_permittivity     = 12.93;
    parameters.m_refractive_index = 3.61;

    parameters.m_varshni_alpha_meV_K = 0.605;
    parameters.m_varshni_beta_K      = 204.0;

    parameters.m_odonnell_coupling          = 3.0;
    parameters.m_odonnell_phonon_energy_meV = 26.7;

    parameters.m_kane_energy_eV = 28.8;
    return parameters;
}

Material Material::GaAs(double temperature_K, TemperatureModel model) { return Material(GaAs_parameters(), temperature_K, model); }

MaterialParameters Material::two_band_test_parameters() {
    MaterialParameters parameters;
    parameters.m_name             = "Two-band test material";
    parameters.m_symbol           = "Tc";
    parameters.m_band_gap_eV      = 1.519;
    parameters.m_electron_mass    = 2.0;
    parameters.m_heavy_hole_mass  = 2.0;
    parameters.m_light_hole_mass  = 2.0;
    parameters.m_split_off_mass   = 2.0;
    parameters.m_permittivity     = 24.93;
    parameters.m_refractive_index = 3.61;
    return parameters;
}

Material Material::two_band_test_material() { return Material(two_band_test_parameters(), 0.0, TemperatureModel::none); }

void Material::print_parameters() const {
    const double e = Constants::q_e;
    fmt::print("Material: {} (T = {} K, gap model: {})\n", m_name, m_temperature, to_string(m_temperature_model));
    fmt::print("  Band gap:              {:.6f} eV\n", m_band_gap / e);
    fmt::print("  Spin-orbit split:      {:.6f} eV\n", m_spin_orbit_split / e);
    fmt::print("  m_e / m_hh / m_lh / m_so: {:.4f} / {:.4f} / {:.4f} / {:.4f} m0\n",
               m_electron_mass / Constants::m_e,
               m_heavy_hole_mass / Constants::m_e,
               m_light_hole_mass / Constants::m_e,
               m_split_off_mass / Constants::m_e);
    fmt::print("  Permittivity:          {}\n", m_permittivity);
    fmt::print("  Refractive index:      {}\n", m_refractive_index);
    fmt::print("  Kane energy:           {} eV\n", m_kane_energy_eV);
    fmt::print("  Exciton Bohr radius:   {:.4e} m\n", m_bohr_radius);
    fmt::print("  Exciton Rydberg ratio: {:.4e}\n", m_rydberg_ratio);
}

/**
 * @brief Load material parameters from the passed filename.
 * The file is a YAML file with a "materials" list; each entry is keyed by its symbol.
 *
 * @param filename
 */
void Materials::load_material_parameters(const std::string& filename) {
    YAML::Node config         = YAML::LoadFile(filename);
    auto       list_materials = config["materials"];
    for (const auto& material : list_materials) {
        MaterialParameters parameters;
        parameters.populate_from_yaml(material);
        materials[parameters.m_symbol] = parameters;
        fmt::print("Material {} ({}) loaded.\n", parameters.m_symbol, parameters.m_name);
    }
}

const MaterialParameters& Materials::get_material(const std::string& symbol) const {
    auto it = materials.find(symbol);
    if (it == materials.end()) {
        throw std::out_of_range("Material " + symbol + " not found in the material database.");
    }
    return it->second;
}

void Materials::print_materials_list() const {
    for (const auto& material : materials) {
        fmt::print("{}\n", material.first);
    }
}

}  // namespace pbands
