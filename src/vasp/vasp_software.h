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



#ifndef VASP_VASP_SOFTWARE_H
#define VASP_VASP_SOFTWARE_H

#include <map>
#include <string>
#include <vector>
#include "nda/nda.hpp"
#include "vasp/procar.h"
#include "vasp/potcar.h"

namespace vasp
{

/*
 * VASP seen through the capabilities used by the corrections: every getter reads the
 * output files of a finished calculation in base_path.
 */
class vasp_software
{
public:

  static constexpr const char* eigenval_filename = "EIGENVAL";
  static constexpr const char* vasprun_filename = "vasprun.xml";
  static constexpr const char* procar_filename = "PROCAR";

  nda::array<double,2> get_eigenvalues(std::string const& base_path = ".") const;
  double get_fermi_energy(std::string const& base_path = ".") const;
  std::map<std::string, std::string> get_atoms_map(std::string const& base_path = ".") const;
  long get_number_of_bands(std::string const& base_path = ".") const;
  long get_number_of_kpoints(std::string const& base_path = ".") const;
  procar get_band_projection_class(std::string const& base_path = ".") const;
  potcar get_potential_class(std::string const& filename, std::string const& base_path = ".") const;

  std::string potential_filename() const { return "POTCAR"; }
  std::vector<std::string> input_files() const { return {"INCAR", "KPOINTS", "POSCAR"}; }

};

}

#endif
