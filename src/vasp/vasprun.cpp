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
#include <optional>
#include <string>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include "IO/app_loggers.h"
#include "utilities/check.hpp"
#include "utilities/parser.h"
#include "vasp/vasprun.h"

namespace vasp
{

using boost::property_tree::ptree;

namespace
{

// depth first, document order
void find_last_efermi(ptree const& node, std::optional<std::string>& value)
{
  for(auto const& [name, child] : node) {
    if(name == "i") {
      auto attr = child.get_optional<std::string>("<xmlattr>.name");
      if(attr and utils::trim(*attr) == "efermi")
        value = child.get_value<std::string>();
    } else if(name != "<xmlattr>") {
      find_last_efermi(child, value);
    }
  }
}

}

vasprun::vasprun(std::string const& filename) : fname(filename)
{
  utils::check<utils::missing_artifact_error>(std::filesystem::exists(fname),
      "vasprun: File not found: {}", fname);
  app_log(3, "  Reading {}", fname);
  try {
    boost::property_tree::read_xml(fname, pt);
  } catch(boost::property_tree::xml_parser_error const& e) {
    throw utils::format_error(fmt::format("vasprun: Error parsing {}: {}", fname, e.what()));
  }
}

double vasprun::fermi_energy() const
{
  std::optional<std::string> value;
  find_last_efermi(pt, value);
  utils::check<utils::format_error>(value.has_value(), "vasprun: Fermi energy not found in {}", fname);
  std::string str = utils::trim(*value);
  std::size_t pos = 0;
  double ef = 0.0;
  try {
    ef = std::stod(str, &pos);
  } catch(std::exception const&) {
    pos = 0;
  }
  utils::check<utils::format_error>(pos > 0 and pos == str.size(),
      "vasprun: Invalid Fermi energy '{}' in {}", str, fname);
  return ef;
}

std::map<std::string, std::string> vasprun::atoms_map() const
{
  auto atominfo = pt.get_child_optional("modeling.atominfo");
  utils::check<utils::format_error>(atominfo.has_value(), "vasprun: Missing atominfo block in {}", fname);

  std::map<std::string, std::string> atoms;
  for(auto const& [name, array] : *atominfo) {
    if(name != "array" or array.get<std::string>("<xmlattr>.name", "") != "atoms") continue;
    auto set = array.get_child_optional("set");
    utils::check<utils::format_error>(set.has_value(), "vasprun: Missing set in atoms array of {}", fname);
    int index = 0;
    for(auto const& [rname, rc] : *set) {
      if(rname != "rc") continue;
      auto c = rc.get_child_optional("c");
      utils::check<utils::format_error>(c.has_value(), "vasprun: Empty atom record in {}", fname);
      atoms[std::to_string(++index)] = utils::trim(c->get_value<std::string>());
    }
  }
  utils::check<utils::format_error>(not atoms.empty(), "vasprun: No atoms found in {}", fname);
  return atoms;
}

}
