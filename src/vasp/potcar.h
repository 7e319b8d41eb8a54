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



#ifndef VASP_POTCAR_H
#define VASP_POTCAR_H

#include <string>
#include <vector>
#include "nda/nda.hpp"

namespace vasp
{

/*
 * Single element POTCAR. The local part of the pseudopotential is stored in reciprocal
 * space, on N points between 0 and the maximum momentum:
 *
 *    local part
 *   <q_max>
 *   <N values, 5 per line>
 *
 * All other lines are kept verbatim and written back unchanged.
 */
class potcar
{
public:

  // Reads base_path/filename. Throws utils::format_error if the local part is missing.
  potcar(std::string const& filename, std::string const& base_path = ".");

  potcar(potcar const&) = default;
  potcar(potcar&&) = default;
  potcar& operator=(potcar const&) = default;
  potcar& operator=(potcar&&) = default;
  ~potcar() = default;

  std::string const& name() const { return fname; }
  std::string const& path() const { return fpath; }

  double maximum_wave_vector() const { return qmax; }
  nda::array<double,1> const& local_potential() const { return vloc; }

  // file lines with the local part replaced by potential, same number of points
  std::vector<std::string> corrected_lines(nda::array<double,1> const& potential) const;

  std::vector<std::string> const& lines() const { return file_lines; }

private:

  std::string fname;
  std::string fpath;
  std::vector<std::string> file_lines;
  // [first, last) lines of the local potential values
  std::size_t first = 0;
  std::size_t last = 0;
  double qmax = 0.0;
  nda::array<double,1> vloc;

};

}

#endif
