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



#undef NDEBUG

#include <string>

#include "catch2/catch.hpp"

#include "utilities/test_common.hpp"
#include "IO/ptree/InputParser.hpp"
#include "IO/ptree/ptree_utilities.hpp"
#include "IO/minushalf_input.h"

namespace minushalf_tests
{

using utils::VALUE_EQUAL;

TEST_CASE("input_parser", "[io]")
{
  SECTION("toml")
  {
    std::string toml = R"(
software = "vasp"
[software_configurations]
number_of_cores = 2
[correction]
search_interval = [0.5, 4.0]
)";
    InputParser parser;
    parser.parse(toml, "toml");
    auto pt = parser.get_root();
    REQUIRE(io::get_value<std::string>(pt, "software") == "vasp");
    REQUIRE(io::get_value<int>(pt, "software_configurations.number_of_cores") == 2);
    auto interval = io::get_array_with_default<double>(pt, "correction.search_interval", {});
    REQUIRE(interval.size() == 2);
    VALUE_EQUAL(interval[1], 4.0);
    REQUIRE(io::get_value_with_default<int>(pt, "correction.max_iterations", 7) == 7);
    REQUIRE_THROWS_AS(io::get_value<int>(pt, "correction.max_iterations"), utils::validation_error);
    REQUIRE_THROWS_AS(io::get_value<int>(pt, "software"), utils::validation_error);
  }

  SECTION("json")
  {
    InputParser parser(std::string(R"({"correction": {"amplitude": 2.5}})"));
    VALUE_EQUAL(io::get_value<double>(parser.get_root(), "correction.amplitude"), 2.5);
  }

  SECTION("errors")
  {
    InputParser parser;
    REQUIRE_THROWS_AS(parser.parse(std::string("software = "), "toml"), utils::format_error);
    REQUIRE_THROWS_AS(parser.parse(std::string("{ \"software\": "), "json"), utils::format_error);
    REQUIRE_THROWS_AS(parser.parse(std::string("software: vasp"), "yaml"), utils::validation_error);
    REQUIRE_THROWS_AS(parser.read(utils::utest_filename("input/does_not_exist.toml")),
                      utils::missing_artifact_error);
  }
}

TEST_CASE("minushalf_input_defaults", "[io]")
{
  auto input = io::minushalf_input::from_file("");
  REQUIRE(input.software == "vasp");
  REQUIRE(input.number_of_cores == 4);
  REQUIRE(input.software_path == "vasp");
  REQUIRE(input.mpi_command == "mpirun");
  REQUIRE(input.exchange_correlation_code == "pb");
  REQUIRE(input.calculation_code == "ae");
  REQUIRE(input.atomic_max_iterations == 100);
  REQUIRE(input.atomic_path == "atm");
  REQUIRE(input.correction_code == "v");
  REQUIRE(input.potfiles_folder == "minushalf_potfiles");
  VALUE_EQUAL(input.amplitude, 1.0);
  VALUE_EQUAL(input.threshold, 5.0);
  VALUE_EQUAL(input.search_low, 0.0);
  VALUE_EQUAL(input.search_high, 15.0);
  VALUE_EQUAL(input.tolerance, 0.01);
  REQUIRE(input.search_max_iterations == 100);
  REQUIRE(not input.is_fractional());
  REQUIRE(not input.has_conduction());
}

TEST_CASE("minushalf_input_toml", "[io]")
{
  auto input = io::minushalf_input::from_file(utils::utest_filename("input/minushalf_filled_out.toml"));
  input.print();
  REQUIRE(input.software == "vasp");
  REQUIRE(input.number_of_cores == 6);
  REQUIRE(input.software_path == "../vasp");
  REQUIRE(input.mpi_command == "mpiexec");
  REQUIRE(input.exchange_correlation_code == "wi");
  REQUIRE(input.calculation_code == "ae");
  REQUIRE(input.atomic_max_iterations == 200);
  REQUIRE(input.atomic_path == "/opt/atom/atm");
  REQUIRE(input.correction_code == "vf");
  REQUIRE(input.potfiles_folder == "../potcar");
  VALUE_EQUAL(input.amplitude, 3.0);
  VALUE_EQUAL(input.threshold, 10.0);
  VALUE_EQUAL(input.search_low, 1.0);
  VALUE_EQUAL(input.search_high, 5.0);
  VALUE_EQUAL(input.tolerance, 0.001);
  REQUIRE(input.search_max_iterations == 40);
  REQUIRE(input.is_fractional());
  REQUIRE(not input.has_conduction());
}

TEST_CASE("minushalf_input_json_xml", "[io]")
{
  auto partial = io::minushalf_input::from_file(utils::utest_filename("input/minushalf_partially_filled.json"));
  REQUIRE(partial.number_of_cores == 6);
  REQUIRE(partial.software_path == "../vasp");
  REQUIRE(partial.mpi_command == "mpirun");
  REQUIRE(partial.exchange_correlation_code == "wi");
  REQUIRE(partial.atomic_max_iterations == 200);
  REQUIRE(partial.correction_code == "v");
  REQUIRE(partial.potfiles_folder == "minushalf_potfiles");

  auto xml = io::minushalf_input::from_file(utils::utest_filename("input/minushalf_filled_out.xml"));
  REQUIRE(xml.number_of_cores == 8);
  REQUIRE(xml.software_path == "vasp_std");
  REQUIRE(xml.correction_code == "vc");
  REQUIRE(xml.has_conduction());
  REQUIRE(not xml.is_fractional());
}

TEST_CASE("minushalf_input_invalid", "[io]")
{
  auto read = [](std::string const& name) {
    return io::minushalf_input::from_file(utils::utest_filename("input/" + name));
  };
  REQUIRE_THROWS_AS(read("minushalf_wrong_software.toml"), utils::validation_error);
  REQUIRE_THROWS_AS(read("minushalf_wrong_correction.toml"), utils::validation_error);
  REQUIRE_THROWS_AS(read("minushalf_wrong_xc.toml"), utils::validation_error);
  REQUIRE_THROWS_AS(read("minushalf_wrong_type.json"), utils::validation_error);

  InputParser parser;
  parser.parse(std::string("[correction]\nsearch_interval = [5.0, 1.0]\n"), "toml");
  REQUIRE_THROWS_AS(io::minushalf_input(parser.get_root()), utils::validation_error);
  parser = InputParser();
  parser.parse(std::string("[correction]\nthreshold = 0.0\n"), "toml");
  REQUIRE_THROWS_AS(io::minushalf_input(parser.get_root()), utils::validation_error);
}

}
