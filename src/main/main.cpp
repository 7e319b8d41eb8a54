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



#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "cxxopts.hpp"

#include "configuration.hpp"
#include "IO/AppAbort.hpp"
#include "IO/app_loggers.h"
#include "IO/minushalf_input.h"
#include "utilities/check.hpp"
#include "utilities/errors.hpp"
#include "atomic/orbital_type.hpp"
#include "atomic/atomic_program.h"
#include "dft/band_structure.h"
#include "vasp/eigenval.h"
#include "vasp/procar.h"
#include "vasp/vasprun.h"
#include "corrections/execute.h"

namespace
{

struct vasp_files
{
  std::string procar;
  std::string eigenval;
  std::string vasprun;
};

dft::band_structure make_band_structure(vasp_files const& f)
{
  vasp::eigenval eig(f.eigenval);
  vasp::vasprun run(f.vasprun);
  return dft::band_structure(eig.eigenvalues(), run.fermi_energy(), run.atoms_map(), eig.number_of_bands());
}

void band_gap(vasp_files const& f)
{
  auto r = make_band_structure(f).band_gap();
  app_log(1, " VBM: {:.6f} eV (kpoint {}, band {})", r.vbm.energy, r.vbm.kpoint+1, r.vbm.band+1);
  app_log(1, " CBM: {:.6f} eV (kpoint {}, band {})", r.cbm.energy, r.cbm.kpoint+1, r.cbm.band+1);
  app_log(1, " Gap: {:.6f} eV", r.gap);
}

void character(vasp_files const& f, bool vbm)
{
  auto bs = make_band_structure(f);
  vasp::procar proj(f.procar);
  auto table = (vbm ? bs.vbm_projection(proj) : bs.cbm_projection(proj));
  app_log(1, " {} character (%)", (vbm ? "VBM" : "CBM"));
  for(auto const& line : dft::projection_report(table))
    app_log(1, "{}", line);
}

void run_atomic(std::string const& path)
{
  atomic::atomic_runner runner(path);
  dft::check_run(runner.run("."), "atomic program");
  atomic::check_atomic_output(".");
}

void occupation(std::vector<std::string> const& args, std::string const& path)
{
  utils::check<utils::validation_error>(args.size() == 2,
      "occupation: Expected <orbital> <percentual>, e.g. 'occupation p 50' or 'occupation 1 50'");
  int l = 0;
  if(args[0].size() == 1 and std::isalpha(static_cast<unsigned char>(args[0][0])))
    l = atomic::angular_momentum(atomic::string_to_orbital_type(args[0]));
  else
    l = std::stoi(args[0]);
  double percentual = std::stod(args[1]);
  utils::check<utils::validation_error>(percentual > 0.0 and percentual <= 100.0,
      "occupation: Percentual must be in (0, 100]: {}", percentual);
  atomic::atomic_runner runner(path);
  atomic::make_occupation_potential(".", l, percentual, runner);
}

}

/** @file main.cpp
 */
int main(int argc, char** argv)
{
  std::string command;
  std::vector<std::string> arguments;
  vasp_files files;
  std::string atomic_path;
  int output_level = 2, debug_level = 0;
  { // parse command line inputs
    cxxopts::Options options(argv[0], "Automated minus-half self-energy corrections");
    options
      .positional_help("<command> [arguments]\n\n commands: execute [input file], band-gap, vbm-character, "
                       "cbm-character, run-atomic, occupation <orbital> <percentual>")
      .show_positional_help();
    options.add_options()
      ("h,help", "print help message")
      ("verbosity", "0, 1, 2, ...: higher means more", cxxopts::value<int>()->default_value("2"))
      ("debug", "0, 1, 2, ...: higher means more", cxxopts::value<int>()->default_value("0"))
      ("procar", "PROCAR file", cxxopts::value<std::string>()->default_value("PROCAR"))
      ("eigenval", "EIGENVAL file", cxxopts::value<std::string>()->default_value("EIGENVAL"))
      ("vasprun", "vasprun.xml file", cxxopts::value<std::string>()->default_value("vasprun.xml"))
      ("atomic-path", "atomic program executable", cxxopts::value<std::string>()->default_value("atm"))
      ("command", "command", cxxopts::value<std::string>())
      ("arguments", "command arguments", cxxopts::value<std::vector<std::string>>())
    ;
    options.parse_positional({"command", "arguments"});
    try {
      auto args = options.parse(argc, argv);
      if (args.count("help") or not args.count("command"))
      {
        std::cout << options.help() << std::endl;
        exit(args.count("help") ? 0 : 1);
      }

      output_level = args["verbosity"].as<int>();
      if (output_level < 0) 
      {
        std::cerr << "verbosity < 0: " << output_level << std::endl;
        exit(1);
      }
      debug_level = args["debug"].as<int>();
      if (debug_level < 0) 
      {
        std::cerr << "debug < 0: " << debug_level << std::endl;
        exit(1);
      }

      command = args["command"].as<std::string>();
      if (args.count("arguments"))
        arguments = args["arguments"].as<std::vector<std::string>>();
      files = {args["procar"].as<std::string>(), args["eigenval"].as<std::string>(),
               args["vasprun"].as<std::string>()};
      atomic_path = args["atomic-path"].as<std::string>();
    } catch (std::exception const& e) {
      std::cerr << " Error parsing command line: " << e.what() << std::endl;
      exit(1);
    }
  }

  // setup output loggers
  setup_loggers(output_level, debug_level);

  std::string welcome(
      std::string("\n ----------------------------------------\n") +
                  "   minushalf " + minushalf_version() + "\n" +
                  "   automated minus-half self-energy corrections\n" +
                  " ----------------------------------------\n");
  app_log(2, welcome);

  try {
    if (command == "execute") {
      std::string input_file = (arguments.empty() ? std::string{} : arguments[0]);
      if (input_file.empty() and std::filesystem::exists("minushalf.toml"))
        input_file = "minushalf.toml";
      if (input_file.empty())
        app_warning(" No input file found, running with default options.");
      auto input = io::minushalf_input::from_file(input_file);
      corrections::execute(input, ".");
    } else if (command == "band-gap") {
      band_gap(files);
    } else if (command == "vbm-character") {
      character(files, true);
    } else if (command == "cbm-character") {
      character(files, false);
    } else if (command == "run-atomic") {
      run_atomic(atomic_path);
    } else if (command == "occupation") {
      occupation(arguments, atomic_path);
    } else {
      APP_ABORT(" Invalid command: {}", command);
    }
  } catch (utils::minushalf_error const& e) {
    APP_ABORT(" {}", e.what());
  } catch (std::exception const& e) {
    APP_ABORT(" Unexpected error: {}", e.what());
  }

  app_log_flush();
  return 0;
}
