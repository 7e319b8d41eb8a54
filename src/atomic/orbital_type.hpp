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



#ifndef ATOMIC_ORBITAL_TYPE_HPP
#define ATOMIC_ORBITAL_TYPE_HPP

#include <array>
#include <string>
#include <string_view>
#include "utilities/check.hpp"

namespace atomic
{

// angular momentum channel, value is the quantum number l
enum orbital_type_e : int { s_orbital = 0, p_orbital = 1, d_orbital = 2, f_orbital = 3 };

inline constexpr std::array<orbital_type_e,4> orbital_types = {s_orbital, p_orbital, d_orbital, f_orbital};

inline std::string orbital_type_to_string(orbital_type_e t)
{
  switch(t) {
    case s_orbital: return "s";
    case p_orbital: return "p";
    case d_orbital: return "d";
    case f_orbital: return "f";
  }
  return "";
}

inline orbital_type_e string_to_orbital_type(std::string_view str)
{
  if(str == "s") return s_orbital;
  else if(str == "p") return p_orbital;
  else if(str == "d") return d_orbital;
  else if(str == "f") return f_orbital;
  utils::check<utils::validation_error>(false, "string_to_orbital_type: Unknown orbital type: {}", str);
  return s_orbital;
}

inline int angular_momentum(orbital_type_e t) { return static_cast<int>(t); }

}

#endif
