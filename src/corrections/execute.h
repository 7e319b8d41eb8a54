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



#ifndef CORRECTIONS_EXECUTE_H
#define CORRECTIONS_EXECUTE_H

#include <filesystem>
#include <string>
#include <vector>

#include "IO/app_loggers.h"
#include "IO/minushalf_input.h"
#include "utilities/check.hpp"
#include "dft/concepts.hpp"
#include "dft/band_structure.h"
#include "corrections/correction_plan.h"
#include "corrections/cut_correction.hpp"
#include "corrections/results.h"
#include "corrections/staging.h"

namespace corrections
{

inline constexpr const char* band_gap_start_folder = "band_gap_start";
inline constexpr const char* valence_potfiles_folder = "valence_potfiles";
inline constexpr const char* conduction_potfiles_folder = "conduction_potfiles";
inline constexpr const char* valence_correction_folder = "valence_correction";
inline constexpr const char* conduction_correction_folder = "conduction_correction";

struct workflow_result
{
  cut_list valence_cuts;
  cut_list conduction_cuts;
  double gap = 0.0;
};

correction_settings make_correction_settings(io::minushalf_input const& input);

/*
 * Complete correction in workdir, which holds the input files of the DFT code and the
 * folder with the uncorrected potential files:
 *
 *   1. runs the uncorrected calculation in band_gap_start/
 *   2. corrects the valence band maximum, simple (v) or fractional (vf)
 *   3. for vc and vfc, corrects the conduction band minimum starting from the
 *      valence corrected potential files
 *   4. writes minushalf_results.dat
 */
template<dft::Software Software, dft::Runner DftRunner, dft::Runner AtomRunner>
workflow_result run_workflow(io::minushalf_input const& input, std::filesystem::path const& workdir,
                             Software const& software, DftRunner& runner, AtomRunner& atom_runner)
{
  namespace fs = std::filesystem;
  auto settings = make_correction_settings(input);

  // uncorrected calculation
  auto start = workdir / band_gap_start_folder;
  reset_directory(start);
  auto files = software.input_files();
  files.push_back(software.potential_filename());
  copy_input_files(workdir, start, files);
  app_log(1, " Running the uncorrected calculation in {}", start.string());
  dft::check_run(runner.run(start.string()), "dft (band_gap_start)");

  auto dir = start.string();
  auto atoms_map = software.get_atoms_map(dir);
  dft::band_structure bs(software.get_eigenvalues(dir), software.get_fermi_energy(dir),
                         atoms_map, software.get_number_of_bands(dir));
  auto projections = software.get_band_projection_class(dir);
  auto atoms = dft::species(atoms_map);
  app_log(1, " Uncorrected gap: {:.4f} eV", bs.band_gap().gap);

  auto source = fs::path(input.potfiles_folder);
  if(source.is_relative()) source = workdir / source;

  workflow_result res;
  {
    auto table = bs.vbm_projection(projections);
    auto plan = (input.is_fractional() ? correction_plan::fractional(table, settings.threshold)
                                       : correction_plan::simple(table, settings.threshold));
    cut_correction valence(workdir / valence_correction_folder, workdir, software, runner, atom_runner,
                           settings, atoms, source, workdir / valence_potfiles_folder, false);
    auto r = valence.execute(plan);
    res.valence_cuts = std::move(r.cuts);
    res.gap = r.gap;
  }

  if(input.has_conduction()) {
    auto table = bs.cbm_projection(projections);
    auto plan = correction_plan::fractional(table, settings.threshold);
    cut_correction conduction(workdir / conduction_correction_folder, workdir, software, runner, atom_runner,
                              settings, atoms, workdir / valence_potfiles_folder,
                              workdir / conduction_potfiles_folder, true);
    auto r = conduction.execute(plan);
    res.conduction_cuts = std::move(r.cuts);
    res.gap = r.gap;
  }

  make_minushalf_results(res.valence_cuts, res.gap, res.conduction_cuts,
                         (workdir / results_filename).string());
  return res;
}

// run_workflow with VASP and the ATOM program configured by input.
workflow_result execute(io::minushalf_input const& input, std::filesystem::path const& workdir = ".");

}

#endif
