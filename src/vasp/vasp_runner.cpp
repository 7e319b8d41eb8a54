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
#include <vector>

#include "IO/app_loggers.h"
#include "utilities/check.hpp"
#include "dft/process.h"
#include "vasp/vasp_runner.h"

namespace vasp
{

vasp_runner::vasp_runner(int cores, std::string exe, std::string mpi) :
  ncores(cores), executable(std::move(exe)), mpi_command(std::move(mpi))
{
  utils::check<utils::validation_error>(ncores > 0, "vasp_runner: Invalid number of cores: {}", ncores);
  utils::check<utils::validation_error>(not executable.empty(), "vasp_runner: Empty path to the vasp executable");
}

std::vector<std::string> vasp_runner::command() const
{
  if(mpi_command.empty())
    return {executable};
  return {mpi_command, "-np", std::to_string(ncores), executable};
}

dft::run_status vasp_runner::run(std::string const& dir) const
{
  utils::check<utils::missing_artifact_error>(std::filesystem::is_directory(dir),
      "vasp_runner: Directory does not exist: {}", dir);
  return dft::run_process(command(), dir, "vasp.out");
}

}
