/**
 * @file test_fermi_level.cpp
 * @author remzerrr (remi.helleboid@gmail.com)
 * @brief
 * @version 0.1
 * @date 2025-10-28
 *
 *
 */

#include <cmath>
#include <stdexcept>
#include <vector>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "BulkBandStructure.h"
#include "Material.h"
#include "QuantumWellBandStructure.h"
#include "density_of_states.hpp"
#include "doctest/doctest.h"
#include "fermi_level.hpp"
#include "numerical_helper.hpp"
#include "physical_constants.hpp"

using pbands::BulkBandStructure;
using pbands::Material;
using pbands::QuantumWellBandStructure;
namespace Constants = pbands::Constants;

namespace {

/**
 * @brief Sheet density of one 2D parabolic subband with the Fermi level ef_eV above its edge.
 *
 */
double sheet_density(double mass, double temperature_K, double ef_eV) {
    const double kT = Constants::k_B * temperature_K;
    return mass * kT / (Constants::pi * Constants::h_bar * Constants::h_bar) * std::log1p(std::exp(ef_eV * Constants::q_e / kT));
}

}  // namespace

TEST_SUITE("[fermi] density integration") {
    TEST_CASE("degenerate 2D gas at low temperature") {
        const double mass     = 0.0665 * Constants::m_e;
        const auto   energies = pbands::numerical::linspace(0.0, 1.0, 20001);
        const auto   dos      = pbands::dos::density_of_states_single_subband(energies, mass, 2);
        const double ef       = 0.1;
        // n = m / (pi hbar^2) * Ef when kT << Ef.
        const double expected = mass / (Constants::pi * Constants::h_bar * Constants::h_bar) * ef * Constants::q_e;
        CHECK_EQ(pbands::fermi::carrier_density(energies, dos, ef, 4.0), doctest::Approx(expected).epsilon(1e-3));
    }

    TEST_CASE("table maps densities back to the probed levels") {
        const double mass     = 0.0665 * Constants::m_e;
        const auto   energies = pbands::numerical::linspace(0.0, 2.0, 4001);
        const auto   dos      = pbands::dos::density_of_states_single_subband(energies, mass, 2);
        const auto   probes   = pbands::numerical::linspace(-0.2, 0.5, 36);
        const auto   table    = pbands::fermi::compute_density_to_fermi_level_table(energies, dos, probes, 300.0);
        CHECK_EQ(table.size(), probes.size());
        const double density = pbands::fermi::carrier_density(energies, dos, probes[10], 300.0);
        CHECK_EQ(table(density), doctest::Approx(probes[10]));
    }

    TEST_CASE("analytic 2D Fermi level inverts the sheet density") {
        const double mass = 0.0665 * Constants::m_e;
        for (double ef : {-0.05, 0.0, 0.02, 0.1}) {
            CAPTURE(ef);
            CHECK_EQ(pbands::fermi::analytic_fermi_level_2d(mass, 300.0, sheet_density(mass, 300.0, ef)),
                     doctest::Approx(ef).epsilon(1e-9).scale(1.0));
        }
        CHECK_THROWS_AS(pbands::fermi::analytic_fermi_level_2d(mass, 0.0, 1e16), std::invalid_argument);
    }

    TEST_CASE("empty table is an error") {
        const std::vector<double> energies{0.0, 1.0};
        const std::vector<double> dos{0.0, 0.0};
        CHECK_THROWS_AS(pbands::fermi::compute_density_to_fermi_level_table(energies, dos, {0.0, 0.1, 0.2}, 300.0), std::runtime_error);
    }
}

TEST_SUITE("[fermi] band structure") {
    TEST_CASE("monotonic in the carrier density") {
        const Material    GaAs = Material::GaAs(300.0);
        BulkBandStructure bands(GaAs, {0.0, 0.3 * Constants::q_e}, {0.0, -0.1 * Constants::q_e});

        double previous_electrons = -1e300;
        double previous_holes     = 1e300;
        for (double density : {1e18, 1e20, 1e21, 1e22, 1e23, 1e24, 3e24, 1e25}) {
            CAPTURE(density);
            const auto levels = bands.fermi_levels(300.0, density);
            CHECK(levels.electrons >= previous_electrons);
            CHECK(levels.holes <= previous_holes);
            previous_electrons = levels.electrons;
            previous_holes     = levels.holes;
        }
    }

    TEST_CASE("levels lie on the expected side of the gap") {
        const Material    GaAs = Material::GaAs(300.0);
        BulkBandStructure bands(GaAs, {0.0}, {0.0, 0.0});
        const auto        levels = bands.fermi_levels(300.0, 1e22);
        // Non-degenerate: electrons below the conduction band, holes above the valence band.
        CHECK(levels.electrons < GaAs.get_band_gap());
        CHECK(levels.electrons > 0.5 * GaAs.get_band_gap());
        CHECK(levels.holes > 0.0);
        CHECK(levels.holes < 0.5 * GaAs.get_band_gap());

        // Degenerate electrons at 1e25 m^-3 are above the conduction band edge.
        CHECK(bands.fermi_levels(300.0, 1e25).electrons > GaAs.get_band_gap());
    }

    TEST_CASE("tables are cached per temperature") {
        const Material    GaAs = Material::GaAs(300.0);
        BulkBandStructure bands(GaAs, {0.0, 0.3 * Constants::q_e}, {0.0, -0.1 * Constants::q_e});
        CHECK_EQ(bands.get_number_cached_temperatures(), 0);

        bands.fermi_levels(300.0, 1e22);
        const auto* tables = &bands.get_fermi_level_tables(300.0);
        bands.fermi_levels(300.0, 1e23);
        bands.fermi_levels(300.0, 5e24);
        CHECK_EQ(bands.get_number_cached_temperatures(), 1);
        CHECK_EQ(&bands.get_fermi_level_tables(300.0), tables);

        bands.fermi_levels(77.0, 1e22);
        CHECK_EQ(bands.get_number_cached_temperatures(), 2);
        CHECK_EQ(&bands.get_fermi_level_tables(300.0), tables);

        bands.set_sampling_grids(pbands::fermi::default_electron_grid(), pbands::fermi::default_hole_grid());
        CHECK_EQ(bands.get_number_cached_temperatures(), 0);
        // Tables are rebuilt on the next request.
        const auto& rebuilt = bands.get_fermi_level_tables(300.0);
        CHECK_EQ(bands.get_number_cached_temperatures(), 1);
        CHECK(rebuilt.electrons.size() >= 2);
    }

    TEST_CASE("same result with or without the cache") {
        const Material    GaAs = Material::GaAs(300.0);
        BulkBandStructure cached(GaAs);
        BulkBandStructure fresh(GaAs);
        cached.fermi_levels(300.0, 1e21);
        const auto levels_cached = cached.fermi_levels(300.0, 2e23);
        const auto levels_fresh  = fresh.fermi_levels(300.0, 2e23);
        CHECK_EQ(levels_cached.electrons, levels_fresh.electrons);
        CHECK_EQ(levels_cached.holes, levels_fresh.holes);
    }

    TEST_CASE("invalid temperature or density") {
        const Material    GaAs = Material::GaAs();
        BulkBandStructure bands(GaAs);
        CHECK_THROWS_AS(bands.fermi_levels(0.0, 1e22), std::invalid_argument);
        CHECK_THROWS_AS(bands.fermi_levels(-300.0, 1e22), std::invalid_argument);
        CHECK_THROWS_AS(bands.fermi_levels(300.0, std::nan("")), std::invalid_argument);
        CHECK_EQ(bands.get_number_cached_temperatures(), 0);
    }

    TEST_CASE("quantum well electrons follow the analytic 2D result") {
        const Material           GaAs = Material::GaAs();
        QuantumWellBandStructure bands(GaAs, {0.0}, {0.0});
        const double             temperature = 300.0;
        for (double ef : {0.05, 0.1, 0.2}) {
            CAPTURE(ef);
            const double density  = sheet_density(GaAs.get_electron_mass(), temperature, ef);
            const double computed = bands.fermi_levels(temperature, density).electrons / Constants::q_e - bands.get_conduction_band_bottom_eV();
            CHECK(std::fabs(computed - ef) < 5e-3);
            CHECK(std::fabs(computed - pbands::fermi::analytic_fermi_level_2d(GaAs.get_electron_mass(), temperature, density)) < 5e-3);
        }
        CHECK_EQ(bands.get_number_cached_temperatures(), 1);
    }

    TEST_CASE("quantum well holes use the heavy hole mass") {
        const Material           GaAs = Material::GaAs();
        QuantumWellBandStructure bands(GaAs, {0.0}, {0.0});
        const double             temperature = 300.0;
        const double             ef          = 0.05;
        const double             density     = sheet_density(GaAs.get_heavy_hole_mass(), temperature, ef);
        // Hole quasi-Fermi level is ef below the valence band top.
        const double computed = bands.fermi_levels(temperature, density).holes / Constants::q_e;
        CHECK(std::fabs(computed + ef) < 2e-2);
    }
}
