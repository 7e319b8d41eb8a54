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



#include <string>
#include <vector>

#include "IO/app_loggers.h"
#include "IO/ptree/InputParser.hpp"
#include "IO/ptree/ptree_utilities.hpp"
#include "utilities/check.hpp"
#include "atomic/input_file.h"
#include "IO/minushalf_input.h"

namespace io
{

minushalf_input::minushalf_input(ptree const& pt0)
{
  // xml inputs carry a root element
  ptree const& pt = (pt0.get_child_optional("minushalf") ? pt0.get_child("minushalf") : pt0);

  software = io::tolower_copy(get_value_with_default<std::string>(pt, "software", software));
  utils::check<utils::validation_error>(software == "vasp",
      "minushalf_input: Unsupported software: {}. Available: vasp", software);

  number_of_cores = get_value_with_default<int>(pt, "software_configurations.number_of_cores", number_of_cores);
  software_path = get_value_with_default<std::string>(pt, "software_configurations.path", software_path);
  mpi_command = get_value_with_default<std::string>(pt, "software_configurations.mpi_command", mpi_command);
  utils::check<utils::validation_error>(number_of_cores > 0,
      "minushalf_input: software_configurations.number_of_cores must be positive: {}", number_of_cores);

  exchange_correlation_code = get_value_with_default<std::string>(pt, "atomic_program.exchange_correlation_code",
                                                                  exchange_correlation_code);
  calculation_code = get_value_with_default<std::string>(pt, "atomic_program.calculation_code", calculation_code);
  atomic_max_iterations = get_value_with_default<int>(pt, "atomic_program.max_iterations", atomic_max_iterations);
  atomic_path = get_value_with_default<std::string>(pt, "atomic_program.path", atomic_path);
  utils::check<utils::validation_error>(atomic::input_file::is_valid_xc_code(exchange_correlation_code),
      "minushalf_input: Invalid atomic_program.exchange_correlation_code: {}", exchange_correlation_code);
  utils::check<utils::validation_error>(atomic::input_file::is_valid_calc_code(calculation_code),
      "minushalf_input: Invalid atomic_program.calculation_code: {}", calculation_code);
  utils::check<utils::validation_error>(atomic_max_iterations > 0,
      "minushalf_input: atomic_program.max_iterations must be positive: {}", atomic_max_iterations);

  correction_code = io::tolower_copy(get_value_with_default<std::string>(pt, "correction.correction_code", correction_code));
  utils::check<utils::validation_error>(correction_code == "v" or correction_code == "vf" or
                                        correction_code == "vc" or correction_code == "vfc",
      "minushalf_input: Invalid correction.correction_code: {}. Available: v, vf, vc, vfc", correction_code);
  potfiles_folder = get_value_with_default<std::string>(pt, "correction.potfiles_folder", potfiles_folder);
  amplitude = get_value_with_default<double>(pt, "correction.amplitude", amplitude);
  threshold = get_value_with_default<double>(pt, "correction.threshold", threshold);
  tolerance = get_value_with_default<double>(pt, "correction.tolerance", tolerance);
  search_max_iterations = get_value_with_default<int>(pt, "correction.max_iterations", search_max_iterations);
  auto interval = get_array_with_default<double>(pt, "correction.search_interval", {search_low, search_high});
  utils::check<utils::validation_error>(interval.size() == 2,
      "minushalf_input: correction.search_interval expects 2 values, found {}", interval.size());
  search_low = interval[0];
  search_high = interval[1];

  utils::check<utils::validation_error>(amplitude > 0.0, "minushalf_input: correction.amplitude must be positive: {}", amplitude);
  utils::check<utils::validation_error>(threshold > 0.0 and threshold <= 100.0,
      "minushalf_input: correction.threshold must be in (0, 100]: {}", threshold);
  utils::check<utils::validation_error>(search_low >= 0.0 and search_low < search_high,
      "minushalf_input: Invalid correction.search_interval: [{}, {}]", search_low, search_high);
  utils::check<utils::validation_error>(tolerance > 0.0, "minushalf_input: correction.tolerance must be positive: {}", tolerance);
  utils::check<utils::validation_error>(search_max_iterations > 0,
      "minushalf_input: correction.max_iterations must be positive: {}", search_max_iterations);
}

minushalf_input minushalf_input::from_file(std::string const& filename)
{
  if(filename.empty()) return minushalf_input{};
  InputParser parser;
  parser.read(filename);
  return minushalf_input(parser.get_root());
}

void minushalf_input::print() const
{
  app_log(1, " Input options");
  app_log(1, " -------------");
  app_log(1, "   software:                  {}", software);
  app_log(1, "   number of cores:           {}", number_of_cores);
  app_log(1, "   software path:             {}", software_path);
  app_log(1, "   mpi command:               {}", mpi_command);
  app_log(1, "   exchange correlation code: {}", exchange_correlation_code);
  app_log(1, "   calculation code:          {}", calculation_code);
  app_log(1, "   atomic max iterations:     {}", atomic_max_iterations);
  app_log(1, "   atomic program path:       {}", atomic_path);
  app_log(1, "   correction code:           {}", correction_code);
  app_log(1, "   potfiles folder:           {}", potfiles_folder);
  app_log(1, "   amplitude:                 {}", amplitude);
  app_log(1, "   threshold:                 {}%", threshold);
  app_log(1, "   search interval:           [{}, {}] A", search_low, search_high);
  app_log(1, "   tolerance:                 {}", tolerance);
  app_log(1, "   search max iterations:     {}\n", search_max_iterations);
}

}
