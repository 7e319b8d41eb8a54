/**
 * ==========================================================================
 * MinusHalf: automated minus-half self-energy corrections
 *
 * Copyright (c) 2022-2025 The MinusHalf developer team
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 * 
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 * ==========================================================================
 */



#undef NDEBUG

#include <cmath>
#include <string>
#include <vector>

#include "catch2/catch.hpp"

#include "fmt/format.h"
#include "nda/nda.hpp"
#include "configuration.hpp"
#include "utilities/test_common.hpp"
#include "utilities/integration.hpp"
#include "dft/concepts.hpp"
#include "atomic/vtotal.h"
#include "atomic/atomic_potential.hpp"

namespace minushalf_tests
{

using utils::VALUE_EQUAL;

// local potential of 8 points on q in [0, 8)
struct flat_potential_file
{
  std::string name() const { return "flat"; }
  double maximum_wave_vector() const { return 8.0; }
  nda::array<double,1> local_potential() const
  {
    nda::array<double,1> v(8);
    v() = -1.0;
    return v;
  }
  std::vector<std::string> corrected_lines(nda::array<double,1> const& v) const
  {
    std::vector<std::string> lines;
    for(long i=0; i<v.size(); ++i)
      lines.emplace_back(fmt::format("{:.6f}", v(i)));
    return lines;
  }
};
static_assert(dft::PotentialFile<flat_potential_file>);

auto make_potential()
{
  return atomic::atomic_potential<flat_potential_file>(
      atomic::vtotal::read(utils::utest_filename("atomic/VTOTAL.ae")),
      atomic::vtotal::read(utils::utest_filename("atomic/VTOTAL_OCC")),
      flat_potential_file{});
}

TEST_CASE("self_energy_potential", "[atomic]")
{
  auto pot = make_potential();
  auto vs = pot.self_energy_potential();
  REQUIRE(vs.size() == 6);
  for(long i=0; i<vs.size(); ++i)
    VALUE_EQUAL(vs.potential(i), 1.0);
  VALUE_EQUAL(vs.radius(2), 0.05);
}

TEST_CASE("fourier_transform", "[atomic]")
{
  auto pot = make_potential();
  atomic::radial_potential v{nda::array<double,1>{0.0, 1.0, 2.0}, nda::array<double,1>{1.0, 1.0, 1.0}};
  auto dv = pot.fourier_transform(v);
  REQUIRE(dv.size() == 8);
  // q = 0: 4 pi \int r^2 dr, trapezoid on the grid gives 3
  VALUE_EQUAL(dv(0), 12.0*constants::pi);
  // q = 1: 4 pi (0.5*sin(1) + 0.5*(sin(1) + 2 sin(2)))
  VALUE_EQUAL(dv(1), 4.0*constants::pi*(std::sin(1.0) + std::sin(2.0)));
}

TEST_CASE("correct_potential", "[atomic]")
{
  auto pot = make_potential();

  // cut beyond the grid: the whole self-energy potential is added
  auto full = pot.correct_potential(10.0, 1.0);
  REQUIRE(full.size() == 8);
  nda::array<double,1> r = pot.self_energy_potential().radius;
  r *= constants::bohr_to_angstrom;
  double expected = 4.0*constants::pi*constants::rydberg_to_ev *
                    utils::trapezoid_rule_f(r, [](double x) { return x*x; });
  VALUE_EQUAL(full(0), -1.0 + expected, 1e-8, 1e-10);

  // trimming reduces the correction at every momentum
  auto trimmed = pot.correct_potential(0.01, 1.0);
  REQUIRE(trimmed(0) < full(0));
  REQUIRE(trimmed(0) > -1.0);

  auto lines = pot.get_corrected_file_lines(full);
  REQUIRE(lines.size() == 8);
  REQUIRE(lines[1] == fmt::format("{:.6f}", full(1)));

  REQUIRE_THROWS_AS(pot.correct_potential(0.0, 1.0), utils::validation_error);
}

TEST_CASE("atomic_potential_grid_mismatch", "[atomic]")
{
  auto ae = atomic::vtotal::read(utils::utest_filename("atomic/VTOTAL.ae"));
  atomic::radial_potential occ{nda::array<double,1>{0.01, 0.02}, nda::array<double,1>{-1.0, -2.0}};
  REQUIRE_THROWS_AS(atomic::atomic_potential<flat_potential_file>(ae, occ, flat_potential_file{}),
                    utils::format_error);

  auto shifted = ae;
  shifted.radius(3) = 0.11;
  REQUIRE_THROWS_AS(atomic::atomic_potential<flat_potential_file>(ae, shifted, flat_potential_file{}),
                    utils::format_error);
}

}
