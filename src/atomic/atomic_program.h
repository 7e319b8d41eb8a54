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



#ifndef ATOMIC_ATOMIC_PROGRAM_H
#define ATOMIC_ATOMIC_PROGRAM_H

#include <filesystem>
#include <string>
#include "IO/app_loggers.h"
#include "utilities/check.hpp"
#include "dft/concepts.hpp"
#include "dft/run_status.hpp"
#include "atomic/input_file.h"

namespace atomic
{

inline constexpr const char* input_filename = "INP";
inline constexpr const char* output_filename = "VTOTAL.ae";
inline constexpr const char* occupation_output_filename = "VTOTAL_OCC";
inline constexpr const char* occupation_folder = "occupation";

struct atomic_settings
{
  std::string exchange_correlation_code = "pb";
  std::string calculation_code = "ae";
  int max_iterations = 100;
};

/*
 * Runs the ATOM executable in a directory holding an INP file.
 */
class atomic_runner
{
public:
  explicit atomic_runner(std::string exe = "atm") : executable(std::move(exe)) {}

  [[nodiscard]] dft::run_status run(std::string const& dir) const;

  std::string const& path() const { return executable; }

private:
  std::string executable;
};

// Throws utils::missing_artifact_error if dir does not hold the output of the atomic program.
void check_atomic_output(std::filesystem::path const& dir);

// Writes dir/INP with the minimum setup of the element.
void stage_minimum_setup(std::filesystem::path const& dir, std::string const& symbol,
                         atomic_settings const& settings);

// Copies dir/INP to dir/occupation/INP and removes 0.5*percentual/100 electrons from channel l.
void stage_occupation(std::filesystem::path const& dir, int l, double percentual);

/*
 * Builds the reference all-electron potential of an element in dir: writes the minimum
 * setup INP and runs the atomic program, which leaves dir/VTOTAL.ae behind.
 */
template<dft::Runner AtomRunner>
void make_pseudopotential(std::filesystem::path const& dir, std::string const& symbol,
                          atomic_settings const& settings, AtomRunner& runner)
{
  std::filesystem::create_directories(dir);
  stage_minimum_setup(dir, symbol, settings);
  app_log(2, "  Running atomic program for {} in {}", symbol, dir.string());
  dft::check_run(runner.run(dir.string()), "atomic program");
  check_atomic_output(dir);
}

/*
 * Potential of the element with a fraction of half an electron removed from channel l.
 * Runs the atomic program in dir/occupation, from the INP in dir, and stores its output
 * as dir/VTOTAL_OCC.
 */
template<dft::Runner AtomRunner>
void make_occupation_potential(std::filesystem::path const& dir, int l, double percentual,
                               AtomRunner& runner)
{
  stage_occupation(dir, l, percentual);
  auto occ_dir = dir / occupation_folder;
  app_log(2, "  Running atomic program for the occupation of l={} ({}%) in {}", l, percentual, occ_dir.string());
  dft::check_run(runner.run(occ_dir.string()), "atomic program (occupation)");
  check_atomic_output(occ_dir);
  std::filesystem::copy_file(occ_dir / output_filename, dir / occupation_output_filename,
                             std::filesystem::copy_options::overwrite_existing);
}

}

#endif
