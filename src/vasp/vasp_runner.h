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



#ifndef VASP_VASP_RUNNER_H
#define VASP_VASP_RUNNER_H

#include <string>
#include <vector>
#include "dft/run_status.hpp"

namespace vasp
{

/*
 * Runs VASP in a directory: <mpi_command> -np <cores> <path>, or <path> alone when
 * mpi_command is empty.
 */
class vasp_runner
{
public:

  vasp_runner(int cores = 4, std::string exe = "vasp", std::string mpi = "mpirun");

  [[nodiscard]] dft::run_status run(std::string const& dir) const;

  std::vector<std::string> command() const;

  int number_of_cores() const { return ncores; }

private:

  int ncores;
  std::string executable;
  std::string mpi_command;

};

}

#endif
