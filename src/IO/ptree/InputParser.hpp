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



#ifndef IO_INPUTPARSER_HPP
#define IO_INPUTPARSER_HPP
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include "IO/ptree/ptree_utilities.hpp"
#include "IO/ptree/toml_utilities.hpp"
#include "IO/app_loggers.h"
#include "utilities/check.hpp"

/*
 * Input file reader, the format is picked by the file extension (toml, json or xml).
 * A string without a supported extension is parsed as a json document.
 */
class InputParser
{
public:
  InputParser() = default; 
  ptree get_root() const {return pt;}
  InputParser(const InputParser& inp) : pt(inp.get_root()) {}
  InputParser(const ptree& pt0) : pt(pt0) {}
  InputParser(const std::string &input) {
    std::string extension = io::get_file_extension(input);
    if (extension=="json" or extension=="xml" or extension=="toml") {
      read(input);
    } else {
      std::stringstream ss;
      ss << input;
      this->parse(ss, "json");
    }
  }

  void read(std::string const& filename)
  { 
    utils::check<utils::missing_artifact_error>(std::filesystem::exists(filename),
        "InputParser: Input file not found: {}", filename);
    app_log(3, "  Reading input file: {}", filename);
    std::ifstream fp(filename);
    parse(fp, io::get_file_extension(filename));
  }

  void parse(std::istream& s, std::string const& extension)
  {
    try {
      if (extension == "json") { 
        boost::property_tree::read_json(s, pt);
      } else if (extension == "xml") {
        ptree pt0;
        boost::property_tree::read_xml(s, pt0);
        pt = io::convert_xml(pt0);
      } else if (extension == "toml") {
        io::read_toml(s, pt);
      } else {
        utils::check<utils::validation_error>(false, "InputParser: Unknown input file extension: {}", extension);
      }
    } catch (boost::property_tree::file_parser_error const& e) {
      throw utils::format_error(std::string("InputParser: ") + e.what());
    }
  }

  void parse(std::string const& s, std::string const& extension)
  {
    std::stringstream ss;
    ss << s;
    parse(ss, extension);
  }

private:
  ptree pt;
};

#endif
