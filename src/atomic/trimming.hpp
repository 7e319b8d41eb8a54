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



#ifndef ATOMIC_TRIMMING_HPP
#define ATOMIC_TRIMMING_HPP

#include <cmath>
#include "nda/nda.hpp"
#include "utilities/check.hpp"
#include "atomic/vtotal.h"

namespace atomic
{

/*
 * Saturating trimming factor f(x) = (1+x) exp(-x), x >= 0.
 * f(0) = 1, f'(0) = 0 and f decreases monotonically to 0.
 */
inline double trimming_factor(double x)
{
  return (1.0 + x) * std::exp(-x);
}

/**
 * Trims a radial potential beyond the cut radius.
 *
 *   r <= cut:  V'(r) = V(r)
 *   r >  cut:  V'(r) = V_inf + (V(r) - V_inf) f(amplitude * (r - cut) / cut)
 *
 * The result and its first derivative are continuous at cut. For valence corrections
 * the asymptote is V_inf = 0, for conduction corrections it is the mirrored edge value
 * V_inf = -V(cut), with V(cut) linearly interpolated on the radial grid.
 *
 * @param sample - potential to trim, left untouched
 * @param cut - cut radius, in the units of sample.radius, > 0
 * @param amplitude - decay rate of the trimming function, > 0
 * @param is_conduction - selects the asymptote
 */
inline radial_potential correct(radial_potential const& sample, double cut, double amplitude,
                                bool is_conduction = false)
{
  utils::check<utils::validation_error>(cut > 0.0, "correct: Cut radius must be positive: {}", cut);
  utils::check<utils::validation_error>(amplitude > 0.0, "correct: Amplitude must be positive: {}", amplitude);
  long n = sample.size();
  utils::check<utils::format_error>(n == sample.potential.size(),
      "correct: Size mismatch between radial grid ({}) and potential ({}).", n, sample.potential.size());

  double v_inf = 0.0;
  if(is_conduction and n > 0) {
    auto const& r = sample.radius;
    auto const& v = sample.potential;
    double v_cut = v(n-1);
    if(cut <= r(0)) {
      v_cut = v(0);
    } else {
      for(long i=1; i<n; ++i) {
        if(r(i) >= cut) {
          double t = (cut - r(i-1)) / (r(i) - r(i-1));
          v_cut = v(i-1) + t * (v(i) - v(i-1));
          break;
        }
      }
    }
    v_inf = -v_cut;
  }

  radial_potential out{sample.radius, sample.potential};
  for(long i=0; i<n; ++i) {
    double r = sample.radius(i);
    if(r > cut) {
      double x = amplitude * (r - cut) / cut;
      out.potential(i) = v_inf + (sample.potential(i) - v_inf) * trimming_factor(x);
    }
  }
  return out;
}

}

#endif
