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



#ifndef VASP_VASPRUN_H
#define VASP_VASPRUN_H

#include <map>
#include <string>
#include <boost/property_tree/ptree.hpp>

namespace vasp
{

/*
 * Read-only view of vasprun.xml.
 */
class vasprun
{
public:

  // Throws utils::missing_artifact_error if the file does not exist, utils::format_error if it is not valid xml.
  explicit vasprun(std::string const& filename);

  vasprun(vasprun const&) = default;
  vasprun(vasprun&&) = default;
  vasprun& operator=(vasprun const&) = default;
  vasprun& operator=(vasprun&&) = default;
  ~vasprun() = default;

  // value of the last <i name="efermi"> element, in eV
  double fermi_energy() const;

  // 1-based ion index, as a string, to chemical symbol
  std::map<std::string, std::string> atoms_map() const;

  std::string const& filename() const { return fname; }

private:

  std::string fname;
  boost::property_tree::ptree pt;

};

}

#endif
