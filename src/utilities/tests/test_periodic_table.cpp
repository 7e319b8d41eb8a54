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
#include "utilities/periodic_table.h"

namespace minushalf_tests
{

namespace pt = utils::periodic_table;

TEST_CASE("periodic_table", "[utilities]")
{
  REQUIRE(pt::capitalize("ga") == "Ga");
  REQUIRE(pt::capitalize("GA") == "Ga");
  REQUIRE(pt::capitalize("n") == "N");

  REQUIRE(pt::is_element("Ga"));
  REQUIRE(pt::is_element("Og"));
  REQUIRE(not pt::is_element("Xx"));
  REQUIRE(not pt::is_element(""));

  REQUIRE(pt::atomic_number("H") == 1);
  REQUIRE(pt::atomic_number("Ga") == 31);
  REQUIRE(pt::atomic_number("Rn") == 86);
  REQUIRE(pt::atomic_number("Og") == pt::number_of_elements);
  REQUIRE(pt::symbol(7) == "N");
  REQUIRE(pt::symbol(47) == "Ag");

  for(int z=1; z<=pt::number_of_elements; ++z)
    REQUIRE(pt::atomic_number(pt::symbol(z)) == z);

  REQUIRE_THROWS_AS(pt::atomic_number("Xx"), utils::validation_error);
  REQUIRE_THROWS_AS(pt::symbol(0), utils::validation_error);
  REQUIRE_THROWS_AS(pt::symbol(119), utils::validation_error);
}

}
