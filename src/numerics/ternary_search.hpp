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



#ifndef NUMERICS_TERNARY_SEARCH_HPP
#define NUMERICS_TERNARY_SEARCH_HPP

#include <concepts>
#include <functional>
#include <map>
#include <utility>
#include "IO/app_loggers.h"
#include "utilities/check.hpp"

namespace numerics
{

struct ternary_search_result
{
  double x = 0.0;
  double value = 0.0;
  int iterations = 0;
  int evaluations = 0;
};

/**
 * Maximum of an objective assumed unimodal on [low, high].
 *
 * Each iteration evaluates the objective at 1/3 and 2/3 of the current interval and
 * drops the third next to the smaller value, until the interval is narrower than
 * tolerance or max_iterations is reached. Evaluations are cached, a point is never
 * evaluated twice. The best point observed is returned, which need not be the center of
 * the final interval. Exceptions thrown by the objective propagate.
 *
 * @param low, high - search interval
 * @param objective - callable, objective(x, args...) -> double
 * @param tolerance - width of the final interval
 * @param max_iterations - maximum number of narrowing steps
 * @param args - extra arguments forwarded to every call of objective
 */
template<typename Objective, typename... Args>
  requires std::invocable<Objective&, double, Args&...>
ternary_search_result ternary_search(double low, double high, Objective&& objective,
                                     double tolerance = 0.01, int max_iterations = 100,
                                     Args&&... args)
{
  utils::check<utils::validation_error>(low < high,
      "ternary_search: Invalid interval [{}, {}]", low, high);
  utils::check<utils::validation_error>(tolerance > 0.0,
      "ternary_search: Tolerance must be positive: {}", tolerance);
  utils::check<utils::validation_error>(max_iterations > 0,
      "ternary_search: Maximum number of iterations must be positive: {}", max_iterations);

  ternary_search_result res;
  std::map<double, double> cache;
  bool first = true;

  auto evaluate = [&](double x) {
    if(auto it = cache.find(x); it != cache.end())
      return it->second;
    double v = static_cast<double>(std::invoke(objective, x, args...));
    ++res.evaluations;
    cache.emplace(x, v);
    app_log(2, "  ternary_search: f({:.6f}) = {:.6f}", x, v);
    if(first or v > res.value) {
      res.x = x;
      res.value = v;
      first = false;
    }
    return v;
  };

  while(high - low > tolerance and res.iterations < max_iterations) {
    double third = (high - low) / 3.0;
    double x1 = low + third;
    double x2 = high - third;
    double f1 = evaluate(x1);
    double f2 = evaluate(x2);
    if(f1 < f2)
      low = x1;
    else
      high = x2;
    ++res.iterations;
  }

  if(high - low > tolerance)
    app_warning(" ternary_search: Interval [{:.6f}, {:.6f}] still wider than {} after {} iterations",
                low, high, tolerance, res.iterations);

  if(first)
    evaluate(0.5 * (low + high));

  app_log(2, "  ternary_search: best point {:.6f} with value {:.6f} ({} iterations, {} evaluations)",
          res.x, res.value, res.iterations, res.evaluations);
  return res;
}

}

#endif
