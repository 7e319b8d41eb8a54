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



#include <array>
#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

#include "utilities/check.hpp"
#include "utilities/periodic_table.h"

namespace utils::periodic_table
{

namespace
{

constexpr std::array<std::string_view, number_of_elements> symbols = {
  "H",                                                                                  "He",
  "Li", "Be",                                                  "B",  "C",  "N",  "O",  "F",  "Ne",
  "Na", "Mg",                                                  "Al", "Si", "P",  "S",  "Cl", "Ar",
  "K",  "Ca", "Sc", "Ti", "V",  "Cr", "Mn", "Fe", "Co", "Ni", "Cu", "Zn", "Ga", "Ge", "As", "Se", "Br", "Kr",
  "Rb", "Sr", "Y",  "Zr", "Nb", "Mo", "Tc", "Ru", "Rh", "Pd", "Ag", "Cd", "In", "Sn", "Sb", "Te", "I",  "Xe",
  "Cs", "Ba",
        "La", "Ce", "Pr", "Nd", "Pm", "Sm", "Eu", "Gd", "Tb", "Dy", "Ho", "Er", "Tm", "Yb", "Lu",
              "Hf", "Ta", "W",  "Re", "Os", "Ir", "Pt", "Au", "Hg", "Tl", "Pb", "Bi", "Po", "At", "Rn",
  "Fr", "Ra",
        "Ac", "Th", "Pa", "U",  "Np", "Pu", "Am", "Cm", "Bk", "Cf", "Es", "Fm", "Md", "No", "Lr",
              "Rf", "Db", "Sg", "Bh", "Hs", "Mt", "Ds", "Rg", "Cn", "Nh", "Fl", "Mc", "Lv", "Ts", "Og"
};

}

std::string capitalize(std::string_view symbol)
{
  std::string s(symbol);
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  if(not s.empty())
    s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
  return s;
}

bool is_element(std::string_view symbol)
{
  return std::find(symbols.begin(), symbols.end(), symbol) != symbols.end();
}

int atomic_number(std::string_view symbol)
{
  auto it = std::find(symbols.begin(), symbols.end(), symbol);
  check<validation_error>(it != symbols.end(), "periodic_table: Unknown chemical symbol: {}", symbol);
  return static_cast<int>(std::distance(symbols.begin(), it)) + 1;
}

std::string symbol(int z)
{
  check<validation_error>(z >= 1 and z <= number_of_elements,
                          "periodic_table: Atomic number out of range: {}", z);
  return std::string(symbols[z-1]);
}

}
