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



#ifndef IO_MINUSHALF_INPUT_H
#define IO_MINUSHALF_INPUT_H

#include <string>
#include <boost/property_tree/ptree.hpp>

namespace io
{

/*
 * Options of the execute command, read once from the input file and validated on
 * construction. Missing options take their default value, invalid ones throw
 * utils::validation_error naming the option.
 *
 *   software = "vasp"
 *   [software_configurations]  number_of_cores, path, mpi_command
 *   [atomic_program]           exchange_correlation_code, calculation_code, max_iterations, path
 *   [correction]               correction_code, potfiles_folder, amplitude, threshold,
 *                              search_interval, tolerance, max_iterations
 */
struct minushalf_input
{
  std::string software = "vasp";

  // software_configurations
  int number_of_cores = 4;
  std::string software_path = "vasp";
  std::string mpi_command = "mpirun";

  // atomic_program
  std::string exchange_correlation_code = "pb";
  std::string calculation_code = "ae";
  int atomic_max_iterations = 100;
  std::string atomic_path = "atm";

  // correction
  std::string correction_code = "v";
  std::string potfiles_folder = "minushalf_potfiles";
  double amplitude = 1.0;
  double threshold = 5.0;
  double search_low = 0.0;
  double search_high = 15.0;
  double tolerance = 0.01;
  int search_max_iterations = 100;

  minushalf_input() = default;
  explicit minushalf_input(boost::property_tree::ptree const& pt);

  // Reads the input file, or returns the defaults when filename is empty.
  static minushalf_input from_file(std::string const& filename);

  bool is_fractional() const { return correction_code.find('f') != std::string::npos; }
  bool has_conduction() const { return correction_code.find('c') != std::string::npos; }

  void print() const;
};

}

#endif
