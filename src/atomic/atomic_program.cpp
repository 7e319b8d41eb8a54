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



#include <filesystem>
#include <string>

#include "IO/app_loggers.h"
#include "utilities/check.hpp"
#include "dft/process.h"
#include "atomic/input_file.h"
#include "atomic/atomic_program.h"

namespace atomic
{

namespace fs = std::filesystem;

dft::run_status atomic_runner::run(std::string const& dir) const
{
  utils::check<utils::missing_artifact_error>(fs::exists(fs::path(dir) / input_filename),
      "atomic_runner: Input file {} not found in {}", input_filename, dir);
  return dft::run_process({executable}, dir, "atom.out");
}

void check_atomic_output(fs::path const& dir)
{
  utils::check<utils::missing_artifact_error>(fs::exists(dir / output_filename),
      "atomic program: Expected output {} not found in {}", output_filename, dir.string());
}

void stage_minimum_setup(fs::path const& dir, std::string const& symbol, atomic_settings const& settings)
{
  auto inp = input_file::minimum_setup(symbol, settings.exchange_correlation_code,
                                       settings.max_iterations, settings.calculation_code);
  inp.write((dir / input_filename).string());
}

void stage_occupation(fs::path const& dir, int l, double percentual)
{
  utils::check<utils::missing_artifact_error>(fs::is_directory(dir),
      "occupation: Folder for the pseudopotential does not exist: {}", dir.string());
  auto inp = input_file::read((dir / input_filename).string());
  inp.apply_occupation_shift(0.5 * percentual / 100.0, l);

  auto occ_dir = dir / occupation_folder;
  fs::remove_all(occ_dir);
  fs::create_directories(occ_dir);
  inp.write((occ_dir / input_filename).string());
}

}
