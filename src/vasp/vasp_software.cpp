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
#include <map>
#include <string>

#include "vasp/eigenval.h"
#include "vasp/vasprun.h"
#include "vasp/vasp_software.h"

namespace vasp
{

namespace
{

std::string in_dir(std::string const& base_path, std::string const& filename)
{
  return (std::filesystem::path(base_path) / filename).string();
}

}

nda::array<double,2> vasp_software::get_eigenvalues(std::string const& base_path) const
{
  return eigenval(in_dir(base_path, eigenval_filename)).eigenvalues();
}

double vasp_software::get_fermi_energy(std::string const& base_path) const
{
  return vasprun(in_dir(base_path, vasprun_filename)).fermi_energy();
}

std::map<std::string, std::string> vasp_software::get_atoms_map(std::string const& base_path) const
{
  return vasprun(in_dir(base_path, vasprun_filename)).atoms_map();
}

long vasp_software::get_number_of_bands(std::string const& base_path) const
{
  return eigenval(in_dir(base_path, eigenval_filename)).number_of_bands();
}

long vasp_software::get_number_of_kpoints(std::string const& base_path) const
{
  return eigenval(in_dir(base_path, eigenval_filename)).number_of_kpoints();
}

procar vasp_software::get_band_projection_class(std::string const& base_path) const
{
  return procar(in_dir(base_path, procar_filename));
}

potcar vasp_software::get_potential_class(std::string const& filename, std::string const& base_path) const
{
  return potcar(filename, base_path);
}

}
