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



#ifndef CORRECTIONS_CUT_CORRECTION_HPP
#define CORRECTIONS_CUT_CORRECTION_HPP

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "fmt/format.h"
#include "IO/app_loggers.h"
#include "utilities/check.hpp"
#include "utilities/parser.h"
#include "utilities/Timer.hpp"
#include "numerics/ternary_search.hpp"
#include "atomic/orbital_type.hpp"
#include "atomic/vtotal.h"
#include "atomic/atomic_program.h"
#include "atomic/atomic_potential.hpp"
#include "dft/concepts.hpp"
#include "dft/band_structure.h"
#include "corrections/correction_plan.h"
#include "corrections/staging.h"

namespace corrections
{

struct correction_settings
{
  atomic::atomic_settings atomic;
  // decay rate of the trimming function
  double amplitude = 1.0;
  // minimum contribution of an orbital to the band edge, in percent
  double threshold = correction_plan::default_threshold;
  // cut radius search interval, Angstrom
  double search_low = 0.0;
  double search_high = 15.0;
  double tolerance = 0.01;
  int max_iterations = 100;
};

struct correction_result
{
  cut_list cuts;
  // gap of the best cut of the last target, eV
  double gap = 0.0;
};

/*
 * Cut radius search for one band edge.
 *
 * For every target of a correction_plan, in order:
 *   - builds the reference and occupied atomic potentials of the atom in
 *     root/mk<potential file>_<symbol>[_<orbital>]/pseudopotential,
 *   - searches the cut radius maximizing the band gap. Each evaluation writes the corrected
 *     potential file of the atom, joins the potential files of all atoms into
 *     .../find_cut/cut_<cut>/, runs the DFT code there and reads the gap back,
 *   - writes the potential file with the best cut, so later targets start from it.
 *
 * Potential files are copied from source_potfiles into potfiles_folder on construction
 * and modified there only. Any failure aborts the whole correction.
 */
template<dft::Software Software, dft::Runner DftRunner, dft::Runner AtomRunner>
class cut_correction
{
public:

  using potential_t = decltype(std::declval<Software const&>().get_potential_class(std::string{}, std::string{}));

  cut_correction(std::filesystem::path root_folder_, std::filesystem::path input_folder_,
                 Software const& software_, DftRunner& runner_, AtomRunner& atom_runner_,
                 correction_settings settings_, std::vector<std::string> atoms_,
                 std::filesystem::path const& source_potfiles, std::filesystem::path potfiles_folder_,
                 bool is_conduction_) :
    root_folder(std::move(root_folder_)),
    input_folder(std::move(input_folder_)),
    software(software_),
    runner(runner_),
    atom_runner(atom_runner_),
    settings(std::move(settings_)),
    atoms(std::move(atoms_)),
    potfiles_folder(std::move(potfiles_folder_)),
    is_conduction(is_conduction_)
  {
    utils::check<utils::validation_error>(not atoms.empty(), "cut_correction: Empty list of atoms");
    stage_potfiles(source_potfiles, potfiles_folder, atoms, software.potential_filename());
    std::filesystem::create_directories(root_folder);
  }

  correction_result execute(correction_plan const& plan)
  {
    app_log(1, "\n {} correction", (is_conduction ? "Conduction" : "Valence"));
    app_log(1, " {}\n", std::string(is_conduction ? 21 : 18, '-'));
    utils::check<utils::validation_error>(not plan.empty(),
        "cut_correction: No orbital reaches the correction threshold of {}%", settings.threshold);

    correction_result res;
    for(auto const& target : plan.targets()) {
      auto key = plan.key(target);
      app_log(2, " Correcting {} ({:.2f}% of the band edge, {}% of half an electron)",
              key.to_string(), target.contribution, target.occupation_percent());
      auto [cut, gap] = find_best_correction(target, key);
      app_log(1, "  {}: cut = {:.2f} A, gap = {:.4f} eV", key.to_string(), cut, gap);
      res.cuts.emplace_back(key, cut);
      res.gap = gap;
    }
    timers.print_all();
    return res;
  }

  /*
   * Band gap with the potential of the atom corrected at the given cut radius.
   * @param cut - cut radius in Angstrom
   * @param base_path - folder of the target
   * @param symbol - atom being corrected
   * @param potential - atomic potential of the target
   */
  double find_band_gap(double cut, std::filesystem::path const& base_path, std::string const& symbol,
                       atomic::atomic_potential<potential_t> const& potential)
  {
    auto cut_folder = base_path / "find_cut" / fmt::format("cut_{:.2f}", cut);
    reset_directory(cut_folder);
    copy_input_files(input_folder, cut_folder, software.input_files());

    write_potfile(cut, symbol, potential);
    join_potfiles(cut_folder / software.potential_filename(), potfiles_folder, atoms,
                  software.potential_filename());

    timers.start("DFT");
    auto status = runner.run(cut_folder.string());
    timers.stop("DFT");
    dft::check_run(status, "dft");

    auto dir = cut_folder.string();
    dft::band_structure bs(software.get_eigenvalues(dir), software.get_fermi_energy(dir),
                           software.get_atoms_map(dir), software.get_number_of_bands(dir));
    double gap = bs.band_gap().gap;
    app_log(2, "   cut: {:.4f} A -> gap: {:.6f} eV", cut, gap);
    return gap;
  }

  std::filesystem::path const& potential_folder() const { return potfiles_folder; }

private:

  std::filesystem::path root_folder;
  std::filesystem::path input_folder;
  Software const& software;
  DftRunner& runner;
  AtomRunner& atom_runner;
  correction_settings settings;
  std::vector<std::string> atoms;
  std::filesystem::path potfiles_folder;
  bool is_conduction;
  utils::TimerManager timers;

  std::filesystem::path target_folder(cut_key const& key) const
  {
    std::string prefix = utils::trim(software.potential_filename());
    std::transform(prefix.begin(), prefix.end(), prefix.begin(), [](unsigned char c){ return std::tolower(c); });
    if(key.orbital)
      return root_folder / fmt::format("mk{}_{}_{}", prefix, key.symbol, atomic::orbital_type_to_string(*key.orbital));
    return root_folder / fmt::format("mk{}_{}", prefix, key.symbol);
  }

  std::pair<double,double> find_best_correction(correction_target const& target, cut_key const& key)
  {
    auto path = target_folder(key);
    reset_directory(path);
    auto pseudo = path / "pseudopotential";

    timers.start("Atomic program");
    atomic::make_pseudopotential(pseudo, target.symbol, settings.atomic, atom_runner);
    atomic::make_occupation_potential(pseudo, atomic::angular_momentum(target.orbital),
                                      double(target.occupation_percent()), atom_runner);
    timers.stop("Atomic program");

    atomic::atomic_potential<potential_t> potential(
        atomic::vtotal::read((pseudo / atomic::output_filename).string()),
        atomic::vtotal::read((pseudo / atomic::occupation_output_filename).string()),
        software.get_potential_class(potfile_name(software.potential_filename(), target.symbol),
                                     potfiles_folder.string()));

    reset_directory(path / "find_cut");
    auto best = numerics::ternary_search(settings.search_low, settings.search_high,
        [&](double cut) { return find_band_gap(cut, path, target.symbol, potential); },
        settings.tolerance, settings.max_iterations);

    write_potfile(best.x, target.symbol, potential);
    return {best.x, best.value};
  }

  void write_potfile(double cut, std::string const& symbol, atomic::atomic_potential<potential_t> const& potential)
  {
    auto path = potfiles_folder / potfile_name(software.potential_filename(), symbol);
    utils::check<utils::missing_artifact_error>(std::filesystem::exists(path),
        "cut_correction: Potential file not found: {}", path.string());
    auto lines = potential.get_corrected_file_lines(
        potential.correct_potential(cut, settings.amplitude, is_conduction));
    utils::write_lines(path.string(), lines);
  }

};

}

#endif
