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



#ifndef IO_PTREE_TOML_UTILITIES_HPP
#define IO_PTREE_TOML_UTILITIES_HPP

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <toml++/toml.hpp>
#include "IO/app_loggers.h"
#include "utilities/errors.hpp"

using boost::property_tree::ptree;

namespace io {

inline void trim_left_space(std::string &s)
{
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
    return !std::isspace(ch);
  }));
}

// "[correction]" -> "correction", "[a.b]" -> "a"
inline std::string table_parent(std::string const& header)
{
  auto end = header.find(']');
  auto dot = header.find('.');
  return header.substr(1, std::min(end, dot) - 1);
}

/*
 * Splits a toml document into top level tables. Nested tables ([a.b]) stay in the section
 * of their parent, keys before the first table form their own section.
 */
inline std::vector<std::string> split_into_sections(std::istream& stream)
{
  std::vector<std::string> sections;
  std::string line, parent, section;
  while (std::getline(stream, line)) {
    trim_left_space(line);
    if (line.starts_with('[') and not line.starts_with("[[")) {
      auto next = table_parent(line);
      if (next != parent and not section.empty()) {
        sections.push_back(section);
        section.clear();
      }
      parent = next;
    }
    section += line + "\n";
  }
  if (!section.empty())
    sections.push_back(section);
  return sections;
}

// toml -> json -> ptree, one top level table at a time
inline void read_toml(std::istream& s, ptree& main_pt)
{
  auto sections = split_into_sections(s);

  app_log(3, "\n Input Parameters");
  app_log(3, " ----------------\n");
  for (const auto& section : sections) {
    toml::table toml_data;
    try {
      toml_data = toml::parse(section);
    } catch (toml::parse_error const& e) {
      std::ostringstream err;
      err << e;
      throw utils::format_error("read_toml: Error parsing input: " + err.str());
    }
    std::ostringstream toml_ss;
    toml_ss << toml_data;
    app_log(3, "{}\n", toml_ss.str());

    std::stringstream json_ss;
    json_ss << toml::json_formatter(toml_data);

    ptree sec_pt;
    boost::property_tree::read_json(json_ss, sec_pt);
    for (const auto& it : sec_pt)
      main_pt.add_child(it.first, it.second);
  }
  app_log(3, " -- End of Input Parameters --\n");
}

}
#endif
