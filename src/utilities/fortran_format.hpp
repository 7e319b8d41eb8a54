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



#ifndef UTILITIES_FORTRAN_FORMAT_HPP
#define UTILITIES_FORTRAN_FORMAT_HPP

#include <cmath>
#include <string>
#include "fmt/format.h"
#include "utilities/check.hpp"

namespace utils
{

/*
 * Fortran Ew.d edit descriptor with a zero leading digit, e.g. 0.12345678E+03.
 * Result is right aligned in a field of the given width. Exponents with three digits
 * drop the E, as Fortran does: 0.15000000-119.
 * Throws utils::format_error for NaN and infinities.
 */
inline std::string fortran_e(double value, int digits = 8, int width = 16)
{
  utils::check<utils::format_error>(std::isfinite(value), "fortran_e: Non finite value: {}", value);
  if(value == 0.0)
    return fmt::format("{:>{}}", fmt::format("0.{:0>{}}E+00", "", digits), width);

  double a = std::abs(value);
  int expo = static_cast<int>(std::floor(std::log10(a))) + 1;
  double scale = std::pow(10.0, digits);
  long long mant = std::llround(a / std::pow(10.0, expo) * scale);
  // mantissa may round up to 1.0 or land below 0.1 because of log10 round-off
  if(mant >= static_cast<long long>(scale)) {
    mant = std::llround(a / std::pow(10.0, expo+1) * scale);
    expo += 1;
  } else if(mant < static_cast<long long>(scale/10.0)) {
    mant = std::llround(a / std::pow(10.0, expo-1) * scale);
    expo -= 1;
  }
  std::string s;
  if(std::abs(expo) < 100)
    s = fmt::format("{}0.{:0>{}}E{}{:02d}", (value < 0 ? "-" : ""), mant, digits,
                    (expo < 0 ? '-' : '+'), std::abs(expo));
  else
    s = fmt::format("{}0.{:0>{}}{}{:03d}", (value < 0 ? "-" : ""), mant, digits,
                    (expo < 0 ? '-' : '+'), std::abs(expo));
  utils::check<utils::format_error>(int(s.size()) <= width,
      "fortran_e: {} does not fit in a field of width {}", s, width);
  return fmt::format("{:>{}}", s, width);
}

}

#endif
