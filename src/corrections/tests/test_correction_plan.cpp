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

#include <string>

#include "catch2/catch.hpp"

#include "utilities/test_common.hpp"
#include "atomic/orbital_type.hpp"
#include "dft/band_projection.hpp"
#include "corrections/correction_plan.h"

namespace minushalf_tests
{

using utils::VALUE_EQUAL;
using namespace atomic;

dft::projection_row make_row(std::string symbol, double s, double p, double d, double f = 0.0)
{
  return dft::projection_row{symbol, {s, p, d, f}};
}

TEST_CASE("cut_key", "[corrections]")
{
  corrections::cut_key ga{"Ga", std::nullopt};
  corrections::cut_key ga_p{"Ga", p_orbital};
  REQUIRE(ga.to_string() == "Ga");
  REQUIRE(ga_p.to_string() == "Ga(p)");
  REQUIRE(not (ga == ga_p));
  REQUIRE(ga_p == corrections::cut_key{"Ga", p_orbital});
}

TEST_CASE("fractional_plan", "[corrections]")
{
  // valence band maximum of GaN
  dft::projection_table table = {make_row("Ga", 1.0, 3.0, 30.0), make_row("N", 1.0, 65.0, 0.0)};
  auto plan = corrections::correction_plan::fractional(table);
  REQUIRE(plan.is_fractional());
  REQUIRE(plan.targets().size() == 2);
  VALUE_EQUAL(plan.sum_of_contributions(), 95.0);

  auto const& ga = plan.targets()[0];
  REQUIRE(ga.symbol == "Ga");
  REQUIRE(ga.orbital == d_orbital);
  VALUE_EQUAL(ga.contribution, 30.0);
  VALUE_EQUAL(ga.percentual, 100.0*30.0/95.0);
  REQUIRE(ga.occupation_percent() == 32);
  VALUE_EQUAL(ga.occupation_fraction(), 0.16);
  REQUIRE(plan.key(ga).to_string() == "Ga(d)");

  auto const& n = plan.targets()[1];
  REQUIRE(n.orbital == p_orbital);
  REQUIRE(n.occupation_percent() == 68);
  REQUIRE(plan.key(n).to_string() == "N(p)");

  // the threshold is inclusive
  auto low = corrections::correction_plan::fractional(table, 3.0);
  REQUIRE(low.targets().size() == 3);
  REQUIRE(low.targets()[0].orbital == p_orbital);
  VALUE_EQUAL(low.sum_of_contributions(), 98.0);
}

TEST_CASE("fractional_plan_conduction", "[corrections]")
{
  dft::projection_table table = {make_row("Ga", 40.0, 10.0, 0.0), make_row("N", 5.0, 45.0, 0.0)};
  auto plan = corrections::correction_plan::fractional(table);
  REQUIRE(plan.targets().size() == 4);
  double total = 0.0;
  for(auto const& t : plan.targets()) total += t.percentual;
  VALUE_EQUAL(total, 100.0);
  REQUIRE(plan.key(plan.targets()[2]).to_string() == "N(s)");
  REQUIRE(plan.targets()[0].occupation_percent() == 40);
}

TEST_CASE("simple_plan", "[corrections]")
{
  dft::projection_table table = {make_row("Ga", 0.0, 90.0, 0.0), make_row("N", 0.0, 0.0, 3.0)};
  auto plan = corrections::correction_plan::simple(table);
  REQUIRE(not plan.is_fractional());
  REQUIRE(plan.targets().size() == 1);
  auto const& ga = plan.targets()[0];
  REQUIRE(ga.orbital == p_orbital);
  VALUE_EQUAL(ga.percentual, 100.0);
  REQUIRE(ga.occupation_percent() == 100);
  VALUE_EQUAL(ga.occupation_fraction(), 0.5);
  REQUIRE(plan.key(ga).to_string() == "Ga");
  REQUIRE(plan.key(ga) == corrections::cut_key{"Ga", std::nullopt});

  // the same table corrected fractionally
  auto frac = corrections::correction_plan::fractional(table);
  REQUIRE(frac.targets().size() == 1);
  VALUE_EQUAL(frac.targets()[0].percentual, 100.0);

  // dominant orbital of every atom
  dft::projection_table gan = {make_row("Ga", 1.0, 3.0, 30.0), make_row("N", 1.0, 65.0, 0.0)};
  auto both = corrections::correction_plan::simple(gan);
  REQUIRE(both.targets().size() == 2);
  REQUIRE(both.targets()[0].orbital == d_orbital);
  REQUIRE(both.targets()[1].orbital == p_orbital);
}

TEST_CASE("empty_plan", "[corrections]")
{
  dft::projection_table table = {make_row("Ga", 2.0, 3.0, 4.0), make_row("N", 1.0, 4.9, 0.0)};
  REQUIRE(corrections::correction_plan::fractional(table).empty());
  REQUIRE(corrections::correction_plan::simple(table).empty());
  REQUIRE(corrections::correction_plan::fractional({}).empty());
  REQUIRE_THROWS_AS(corrections::correction_plan::fractional(table, 0.0), utils::validation_error);
  REQUIRE_THROWS_AS(corrections::correction_plan::simple(table, -1.0), utils::validation_error);
}

}
