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



#ifndef MINUSHALF_TOP_CONFIGURATION_HPP
#define MINUSHALF_TOP_CONFIGURATION_HPP

#include <string>
#include "config.h"

using RealType = double;

namespace constants
{

// CODATA 2018
inline constexpr RealType rydberg_to_ev = 13.605693122994;
inline constexpr RealType bohr_to_angstrom = 0.529177210903;
inline constexpr RealType pi = 3.141592653589793238462643383279502884;

}

inline std::string minushalf_version() { return std::string(MINUSHALF_VERSION); }

#endif
