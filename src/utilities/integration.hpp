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



#ifndef UTILITIES_INTEGRATION_HPP
#define UTILITIES_INTEGRATION_HPP

#include "nda/nda.hpp"
#include "utilities/check.hpp"

namespace utils
{

/*
 * Trapezoidal rule on a non-uniform grid, \int g(r) dr over the grid points.
 * Radial meshes written by the atomic program are logarithmic, so simpson rules on
 * equally spaced points do not apply.
 */
template<typename T = double>
auto trapezoid_rule_array(::nda::MemoryArrayOfRank<1> auto const& r,
                          ::nda::MemoryArrayOfRank<1> auto const& g)
{
  long N = r.size();
  utils::check(N == g.size(), "trapezoid_rule: Size mismatch: r:{}, g:{}", N, g.size());
  T F(0);
  for(long i=1; i<N; ++i)
    F += T(0.5) * (g(i) + g(i-1)) * (r(i) - r(i-1));
  return F;
}

template<typename T = double, typename func_t>
auto trapezoid_rule_f(::nda::MemoryArrayOfRank<1> auto const& r, func_t && g)
{
  long N = r.size();
  T F(0);
  if(N < 2) return F;
  T g0 = g(r(0));
  for(long i=1; i<N; ++i) {
    T g1 = g(r(i));
    F += T(0.5) * (g1 + g0) * (r(i) - r(i-1));
    g0 = g1;
  }
  return F;
}

}

#endif
