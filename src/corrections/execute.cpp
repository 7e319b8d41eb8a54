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

#include "IO/app_loggers.h"
#include "atomic/atomic_program.h"
#include "vasp/vasp_runner.h"
#include "vasp/vasp_software.h"
#include "corrections/execute.h"

namespace corrections
{

correction_settings make_correction_settings(io::minushalf_input const& input)
{
  correction_settings s;
  s.atomic.exchange_correlation_code = input.exchange_correlation_code;
  s.atomic.calculation_code = input.calculation_code;
  s.atomic.max_iterations = input.atomic_max_iterations;
  s.amplitude = input.amplitude;
  s.threshold = input.threshold;
  s.search_low = input.search_low;
  s.search_high = input.search_high;
  s.tolerance = input.tolerance;
  s.max_iterations = input.search_max_iterations;
  return s;
}

workflow_result execute(io::minushalf_input const& input, std::filesystem::path const& workdir)
{
  input.print();
  vasp::vasp_software software;
  vasp::vasp_runner runner(input.number_of_cores, input.software_path, input.mpi_command);
  atomic::atomic_runner atom_runner(input.atomic_path);
  return run_workflow(input, workdir, software, runner, atom_runner);
}

}
