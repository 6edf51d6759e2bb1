/**
 * @file test_density_of_states.cpp
 * @author remzerrr (remi.helleboid@gmail.com)
 * @brief
 * @version 0.1
 * @date 2025-10-27
 *
 *
 */

#include <cmath>
#include <stdexcept>
#include <vector>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "density_of_states.hpp"
#include "doctest/doctest.h"
#include "physical_constants.hpp"

using pbands::dos::density_of_states_single_subband;
using pbands::dos::EnergyUnit;

namespace {
constexpr double mass_GaAs = 0.0665 * pbands::Constants::m_e;
}

TEST_SUITE("[dos] single subband") {
    TEST_CASE("no states below the edge, finite at the edge") {
        for (int dimension : {1, 2, 3}) {
            CAPTURE(dimension);
            const auto dos = density_of_states_single_subband(std::vector<double>{-1.0, -1e-6, 0.0, 1e-3}, mass_GaAs, dimension);
            CHECK_EQ(dos[0], 0.0);
            CHECK_EQ(dos[1], 0.0);
            CHECK(std::isfinite(dos[2]));
            CHECK(dos[2] >= 0.0);
            CHECK(dos[3] > 0.0);
        }
    }

    TEST_CASE("2D step") {
        const double step = mass_GaAs / (pbands::Constants::pi * pbands::Constants::h_bar * pbands::Constants::h_bar);
        CHECK_EQ(density_of_states_single_subband(0.01, mass_GaAs, 2), doctest::Approx(step));
        CHECK_EQ(density_of_states_single_subband(1.0, mass_GaAs, 2), doctest::Approx(step));
        CHECK_EQ(density_of_states_single_subband(0.0, mass_GaAs, 2), doctest::Approx(0.5 * step));
    }

    TEST_CASE("3D square root law") {
        const double g1 = density_of_states_single_subband(0.01, mass_GaAs, 3);
        const double g4 = density_of_states_single_subband(0.04, mass_GaAs, 3);
        CHECK_EQ(g4 / g1, doctest::Approx(2.0));
        CHECK_EQ(density_of_states_single_subband(0.0, mass_GaAs, 3), 0.0);

        // g(E) = 1/(2 pi^2) (2m/hbar^2)^(3/2) sqrt(E)
        const double E_J      = 0.01 * pbands::Constants::q_e;
        const double expected = 1.0 / (2.0 * pbands::Constants::pi * pbands::Constants::pi) *
                                std::pow(2.0 * mass_GaAs / (pbands::Constants::h_bar * pbands::Constants::h_bar), 1.5) * std::sqrt(E_J);
        CHECK_EQ(g1, doctest::Approx(expected));
    }

    TEST_CASE("1D inverse square root law") {
        const double g1 = density_of_states_single_subband(0.01, mass_GaAs, 1);
        const double g4 = density_of_states_single_subband(0.04, mass_GaAs, 1);
        CHECK_EQ(g4 / g1, doctest::Approx(0.5));
        CHECK_EQ(density_of_states_single_subband(0.0, mass_GaAs, 1), 0.0);
    }

    TEST_CASE("energies in Joule") {
        const double E_eV = 0.02;
        CHECK_EQ(density_of_states_single_subband(E_eV * pbands::Constants::q_e, mass_GaAs, 3, EnergyUnit::joule),
                 doctest::Approx(density_of_states_single_subband(E_eV, mass_GaAs, 3, EnergyUnit::eV)));
    }

    TEST_CASE("invalid arguments") {
        CHECK_THROWS_AS(density_of_states_single_subband(0.1, mass_GaAs, 0), std::invalid_argument);
        CHECK_THROWS_AS(density_of_states_single_subband(0.1, mass_GaAs, 4), std::invalid_argument);
        CHECK_THROWS_AS(density_of_states_single_subband(0.1, 0.0, 3), std::invalid_argument);
        CHECK_THROWS_AS(density_of_states_single_subband(0.1, -mass_GaAs, 2), std::invalid_argument);
    }
}
