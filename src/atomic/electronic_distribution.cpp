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



#include <map>
#include <string>

#include "utilities/check.hpp"
#include "utilities/periodic_table.h"
#include "atomic/electronic_distribution.h"

namespace atomic
{

namespace
{

// Ground state configurations, H to Rn.
std::map<std::string, electronic_configuration> const& distribution_table()
{
  static const std::map<std::string, electronic_configuration> table = {
    {"H", {0, {{1, 0, 1.0}}}},
    {"He", {0, {{1, 0, 2.0}}}},
    {"Li", {1, {{2, 0, 1.0}}}},
    {"Be", {1, {{2, 0, 2.0}}}},
    {"B", {1, {{2, 0, 2.0}, {2, 1, 1.0}}}},
    {"C", {1, {{2, 0, 2.0}, {2, 1, 2.0}}}},
    {"N", {1, {{2, 0, 2.0}, {2, 1, 3.0}}}},
    {"O", {1, {{2, 0, 2.0}, {2, 1, 4.0}}}},
    {"F", {1, {{2, 0, 2.0}, {2, 1, 5.0}}}},
    {"Ne", {1, {{2, 0, 2.0}, {2, 1, 6.0}}}},
    {"Na", {3, {{3, 0, 1.0}}}},
    {"Mg", {3, {{3, 0, 2.0}}}},
    {"Al", {3, {{3, 0, 2.0}, {3, 1, 1.0}}}},
    {"Si", {3, {{3, 0, 2.0}, {3, 1, 2.0}}}},
    {"P", {3, {{3, 0, 2.0}, {3, 1, 3.0}}}},
    {"S", {3, {{3, 0, 2.0}, {3, 1, 4.0}}}},
    {"Cl", {3, {{3, 0, 2.0}, {3, 1, 5.0}}}},
    {"Ar", {3, {{3, 0, 2.0}, {3, 1, 6.0}}}},
    {"K", {5, {{4, 0, 1.0}}}},
    {"Ca", {5, {{4, 0, 2.0}}}},
    {"Sc", {5, {{3, 2, 1.0}, {4, 0, 2.0}}}},
    {"Ti", {5, {{3, 2, 2.0}, {4, 0, 2.0}}}},
    {"V", {5, {{3, 2, 3.0}, {4, 0, 2.0}}}},
    {"Cr", {5, {{3, 2, 5.0}, {4, 0, 1.0}}}},
    {"Mn", {5, {{3, 2, 5.0}, {4, 0, 2.0}}}},
    {"Fe", {5, {{3, 2, 6.0}, {4, 0, 2.0}}}},
    {"Co", {5, {{3, 2, 7.0}, {4, 0, 2.0}}}},
    {"Ni", {5, {{3, 2, 8.0}, {4, 0, 2.0}}}},
    {"Cu", {5, {{3, 2, 10.0}, {4, 0, 1.0}}}},
    {"Zn", {5, {{3, 2, 10.0}, {4, 0, 2.0}}}},
    {"Ga", {5, {{3, 2, 10.0}, {4, 0, 2.0}, {4, 1, 1.0}}}},
    {"Ge", {5, {{3, 2, 10.0}, {4, 0, 2.0}, {4, 1, 2.0}}}},
    {"As", {5, {{3, 2, 10.0}, {4, 0, 2.0}, {4, 1, 3.0}}}},
    {"Se", {5, {{3, 2, 10.0}, {4, 0, 2.0}, {4, 1, 4.0}}}},
    {"Br", {5, {{3, 2, 10.0}, {4, 0, 2.0}, {4, 1, 5.0}}}},
    {"Kr", {5, {{3, 2, 10.0}, {4, 0, 2.0}, {4, 1, 6.0}}}},
    {"Rb", {8, {{5, 0, 1.0}}}},
    {"Sr", {8, {{5, 0, 2.0}}}},
    {"Y", {8, {{4, 2, 1.0}, {5, 0, 2.0}}}},
    {"Zr", {8, {{4, 2, 2.0}, {5, 0, 2.0}}}},
    {"Nb", {8, {{4, 2, 4.0}, {5, 0, 1.0}}}},
    {"Mo", {8, {{4, 2, 5.0}, {5, 0, 1.0}}}},
    {"Tc", {8, {{4, 2, 5.0}, {5, 0, 2.0}}}},
    {"Ru", {8, {{4, 2, 7.0}, {5, 0, 1.0}}}},
    {"Rh", {8, {{4, 2, 8.0}, {5, 0, 1.0}}}},
    {"Pd", {8, {{4, 2, 10.0}, {5, 0, 0.0}}}},
    {"Ag", {8, {{4, 2, 10.0}, {5, 0, 1.0}}}},
    {"Cd", {8, {{4, 2, 10.0}, {5, 0, 2.0}}}},
    {"In", {8, {{4, 2, 10.0}, {5, 0, 2.0}, {5, 1, 1.0}}}},
    {"Sn", {8, {{4, 2, 10.0}, {5, 0, 2.0}, {5, 1, 2.0}}}},
    {"Sb", {8, {{4, 2, 10.0}, {5, 0, 2.0}, {5, 1, 3.0}}}},
    {"Te", {8, {{4, 2, 10.0}, {5, 0, 2.0}, {5, 1, 4.0}}}},
    {"I", {8, {{4, 2, 10.0}, {5, 0, 2.0}, {5, 1, 5.0}}}},
    {"Xe", {8, {{4, 2, 10.0}, {5, 0, 2.0}, {5, 1, 6.0}}}},
    {"Cs", {11, {{6, 0, 1.0}}}},
    {"Ba", {11, {{6, 0, 2.0}}}},
    {"La", {11, {{5, 2, 1.0}, {6, 0, 2.0}}}},
    {"Ce", {11, {{4, 3, 1.0}, {5, 2, 1.0}, {6, 0, 2.0}}}},
    {"Pr", {11, {{4, 3, 3.0}, {6, 0, 2.0}}}},
    {"Nd", {11, {{4, 3, 4.0}, {6, 0, 2.0}}}},
    {"Pm", {11, {{4, 3, 5.0}, {6, 0, 2.0}}}},
    {"Sm", {11, {{4, 3, 6.0}, {6, 0, 2.0}}}},
    {"Eu", {11, {{4, 3, 7.0}, {6, 0, 2.0}}}},
    {"Gd", {11, {{4, 3, 7.0}, {5, 2, 1.0}, {6, 0, 2.0}}}},
    {"Tb", {11, {{4, 3, 9.0}, {6, 0, 2.0}}}},
    {"Dy", {11, {{4, 3, 10.0}, {6, 0, 2.0}}}},
    {"Ho", {11, {{4, 3, 11.0}, {6, 0, 2.0}}}},
    {"Er", {11, {{4, 3, 12.0}, {6, 0, 2.0}}}},
    {"Tm", {11, {{4, 3, 13.0}, {6, 0, 2.0}}}},
    {"Yb", {11, {{4, 3, 14.0}, {6, 0, 2.0}}}},
    {"Lu", {11, {{4, 3, 14.0}, {5, 2, 1.0}, {6, 0, 2.0}}}},
    {"Hf", {11, {{4, 3, 14.0}, {5, 2, 2.0}, {6, 0, 2.0}}}},
    {"Ta", {11, {{4, 3, 14.0}, {5, 2, 3.0}, {6, 0, 2.0}}}},
    {"W", {11, {{4, 3, 14.0}, {5, 2, 4.0}, {6, 0, 2.0}}}},
    {"Re", {11, {{4, 3, 14.0}, {5, 2, 5.0}, {6, 0, 2.0}}}},
    {"Os", {11, {{4, 3, 14.0}, {5, 2, 6.0}, {6, 0, 2.0}}}},
    {"Ir", {11, {{4, 3, 14.0}, {5, 2, 7.0}, {6, 0, 2.0}}}},
    {"Pt", {11, {{4, 3, 14.0}, {5, 2, 9.0}, {6, 0, 1.0}}}},
    {"Au", {11, {{4, 3, 14.0}, {5, 2, 10.0}, {6, 0, 1.0}}}},
    {"Hg", {11, {{4, 3, 14.0}, {5, 2, 10.0}, {6, 0, 2.0}}}},
    {"Tl", {11, {{4, 3, 14.0}, {5, 2, 10.0}, {6, 0, 2.0}, {6, 1, 1.0}}}},
    {"Pb", {11, {{4, 3, 14.0}, {5, 2, 10.0}, {6, 0, 2.0}, {6, 1, 2.0}}}},
    {"Bi", {11, {{4, 3, 14.0}, {5, 2, 10.0}, {6, 0, 2.0}, {6, 1, 3.0}}}},
    {"Po", {11, {{4, 3, 14.0}, {5, 2, 10.0}, {6, 0, 2.0}, {6, 1, 4.0}}}},
    {"At", {11, {{4, 3, 14.0}, {5, 2, 10.0}, {6, 0, 2.0}, {6, 1, 5.0}}}},
    {"Rn", {11, {{4, 3, 14.0}, {5, 2, 10.0}, {6, 0, 2.0}, {6, 1, 6.0}}}},
  };
  return table;
}

}

bool has_electronic_distribution(std::string const& symbol)
{
  auto const& table = distribution_table();
  return table.find(utils::periodic_table::capitalize(symbol)) != table.end();
}

electronic_configuration const& electronic_distribution(std::string const& symbol)
{
  auto const& table = distribution_table();
  auto it = table.find(utils::periodic_table::capitalize(symbol));
  utils::check<utils::validation_error>(it != table.end(),
      "electronic_distribution: Unknown element: {}. No default electronic configuration available.", symbol);
  return it->second;
}

}
