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



#ifndef UTILITIES_PERIODIC_TABLE_H
#define UTILITIES_PERIODIC_TABLE_H

#include <string>
#include <string_view>

namespace utils
{

/*
 * Immutable element lookup, Z = 1..118.
 */
namespace periodic_table
{

inline constexpr int number_of_elements = 118;

// "ga", "GA" -> "Ga"
std::string capitalize(std::string_view symbol);

// true if the (capitalized) symbol names an element
bool is_element(std::string_view symbol);

// atomic number of the element, throws validation_error if unknown
int atomic_number(std::string_view symbol);

// symbol of the element with atomic number z, throws validation_error if out of range
std::string symbol(int z);

}

}

#endif
