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

#include <cmath>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "catch2/catch.hpp"

#include "fmt/format.h"
#include "nda/nda.hpp"
#include "utilities/test_common.hpp"
#include "utilities/parser.h"
#include "atomic/orbital_type.hpp"
#include "atomic/input_file.h"
#include "atomic/atomic_program.h"
#include "dft/concepts.hpp"
#include "dft/band_projection.hpp"
#include "vasp/potcar.h"
#include "IO/minushalf_input.h"
#include "corrections/correction_plan.h"
#include "corrections/cut_correction.hpp"
#include "corrections/execute.h"

namespace minushalf_tests
{

namespace fs = std::filesystem;
using utils::VALUE_EQUAL;

constexpr double best_cut = 2.5;

// Projections of the two states of fake_software: band 0 is the VBM, band 1 the CBM.
struct fixed_projection_source
{
  dft::ion_projections get_band_projection(long, long n) const
  {
    if(n == 0) return {{0.0, 0.90, 0.0, 0.0}, {0.0, 0.0, 0.03, 0.0}};
    return {{0.6, 0.0, 0.0, 0.0}, {0.0, 0.4, 0.0, 0.0}};
  }
};

/*
 * DFT code with one kpoint and two bands. The runner leaves the band gap in a BANDS file,
 * the potential files are VASP POTCARs.
 */
struct fake_software
{
  nda::array<double,2> get_eigenvalues(std::string const& base_path) const
  {
    auto v = utils::str2vec<double>(utils::read_lines((fs::path(base_path) / "BANDS").string()).at(0));
    REQUIRE(v.size() == 2);
    return nda::array<double,2>{{v[0], v[1]}};
  }
  double get_fermi_energy(std::string const&) const { return 0.0; }
  std::map<std::string, std::string> get_atoms_map(std::string const&) const
  {
    return {{"1", "Ga"}, {"2", "N"}};
  }
  long get_number_of_bands(std::string const&) const { return 2; }
  long get_number_of_kpoints(std::string const&) const { return 1; }
  fixed_projection_source get_band_projection_class(std::string const&) const { return {}; }
  vasp::potcar get_potential_class(std::string const& filename, std::string const& base_path) const
  {
    return vasp::potcar(filename, base_path);
  }
  std::string potential_filename() const { return "POTCAR"; }
  std::vector<std::string> input_files() const { return {"INCAR"}; }
};
static_assert(dft::Software<fake_software>);

/*
 * Gap as a function of the cut radius, read back from the name of the run directory:
 * 3 - (cut - 2.5)^2. Uncorrected runs give 1 eV.
 */
struct fake_dft_runner
{
  std::vector<std::string> dirs;
  int fail_at = -1;

  dft::run_status run(std::string const& dir)
  {
    dirs.push_back(dir);
    if(int(dirs.size()) == fail_at) return dft::run_status{1, "vasp: SIGSEGV"};
    auto path = fs::path(dir);
    REQUIRE(fs::exists(path / "INCAR"));
    REQUIRE(fs::file_size(path / "POTCAR") > 0);
    double gap = 1.0;
    auto name = path.filename().string();
    if(name.rfind("cut_", 0) == 0) {
      double cut = std::stod(name.substr(4));
      gap = 3.0 - (cut - best_cut)*(cut - best_cut);
    }
    utils::write_lines((path / "BANDS").string(), {fmt::format("{:.8f} {:.8f}", -0.5, gap - 0.5)});
    return dft::run_status{};
  }
};
static_assert(dft::Runner<fake_dft_runner>);

struct fake_atomic_runner
{
  int calls = 0;

  dft::run_status run(std::string const& dir)
  {
    ++calls;
    auto path = fs::path(dir);
    REQUIRE(fs::exists(path / atomic::input_filename));
    bool occ = path.filename().string() == atomic::occupation_folder;
    fs::copy_file(utils::utest_filename(occ ? "atomic/VTOTAL_OCC" : "atomic/VTOTAL.ae"),
                  path / atomic::output_filename, fs::copy_options::overwrite_existing);
    return dft::run_status{};
  }
};

// input folder with an INCAR and a POTCAR
void make_input_folder(fs::path const& dir)
{
  fs::create_directories(dir);
  utils::write_lines((dir / "INCAR").string(), {"SYSTEM = GaN", "LORBIT = 11"});
  corrections::join_potfiles(dir / "POTCAR", utils::utest_filename("vasp/potcar"), {"Ga", "N"}, "POTCAR");
}

corrections::correction_settings search_settings()
{
  corrections::correction_settings s;
  s.search_low = 0.0;
  s.search_high = 5.0;
  s.tolerance = 0.05;
  return s;
}

TEST_CASE("staging", "[corrections]")
{
  REQUIRE(corrections::potfile_name("POTCAR", "Ga") == "POTCAR.ga");
  REQUIRE(corrections::potfile_name("potcar", "N") == "POTCAR.n");

  utils::scratch_directory dir("staging");
  auto source = utils::utest_filename("vasp/potcar");
  auto dest = dir.path / "potfiles";
  fs::create_directories(dest);
  utils::write_lines((dest / "stale").string(), {"old"});
  corrections::stage_potfiles(source, dest, {"Ga", "N"}, "POTCAR");
  REQUIRE(not fs::exists(dest / "stale"));
  REQUIRE(fs::exists(dest / "POTCAR.ga"));
  REQUIRE(fs::exists(dest / "POTCAR.n"));
  REQUIRE_THROWS_AS(corrections::stage_potfiles(source, dest, {"Ga", "O"}, "POTCAR"),
                    utils::missing_artifact_error);

  corrections::stage_potfiles(source, dest, {"Ga", "N"}, "POTCAR");
  auto joined = dir.path / "POTCAR";
  corrections::join_potfiles(joined, dest, {"N", "Ga"}, "POTCAR");
  REQUIRE(utils::read_file(joined.string()) ==
          utils::read_file((dest / "POTCAR.n").string()) + utils::read_file((dest / "POTCAR.ga").string()));
  REQUIRE_THROWS_AS(corrections::join_potfiles(joined, dest, {"O"}, "POTCAR"), utils::missing_artifact_error);

  auto to = dir.path / "copy";
  corrections::reset_directory(to);
  utils::write_lines((dir.path / "INCAR").string(), {"ISMEAR = 0"});
  corrections::copy_input_files(dir.path, to, {"INCAR", "POTCAR"});
  REQUIRE(utils::read_file((to / "INCAR").string()) == "ISMEAR = 0\n");
  REQUIRE_THROWS_AS(corrections::copy_input_files(dir.path, to, {"KPOINTS"}), utils::missing_artifact_error);
}

TEST_CASE("cut_correction_simple", "[corrections]")
{
  utils::scratch_directory dir("cut_simple");
  make_input_folder(dir.path);
  fake_software software;
  fake_dft_runner runner;
  fake_atomic_runner atom_runner;

  dft::projection_table table = {{"Ga", {0.0, 90.0, 0.0, 0.0}}, {"N", {0.0, 0.0, 3.0, 0.0}}};
  auto plan = corrections::correction_plan::simple(table);

  auto potfiles = dir.path / "valence_potfiles";
  corrections::cut_correction correction(dir.path / "valence_correction", dir.path, software, runner,
                                         atom_runner, search_settings(), {"Ga", "N"},
                                         utils::utest_filename("vasp/potcar"), potfiles, false);
  REQUIRE(fs::exists(potfiles / "POTCAR.ga"));
  auto res = correction.execute(plan);

  REQUIRE(res.cuts.size() == 1);
  REQUIRE(res.cuts[0].first.to_string() == "Ga");
  VALUE_EQUAL(res.cuts[0].second, best_cut, 0.06);
  VALUE_EQUAL(res.gap, 3.0, 0.01);
  REQUIRE(atom_runner.calls == 2);
  REQUIRE(runner.dirs.size() > 4);

  auto target = dir.path / "valence_correction" / "mkpotcar_Ga";
  REQUIRE(fs::exists(target / "pseudopotential" / atomic::output_filename));
  REQUIRE(fs::exists(target / "pseudopotential" / atomic::occupation_output_filename));
  REQUIRE(fs::is_directory(target / "find_cut"));

  // only the corrected atom changes, on its local part
  auto original = utils::read_lines(utils::utest_filename("vasp/potcar/POTCAR.ga"));
  auto corrected = utils::read_lines((potfiles / "POTCAR.ga").string());
  REQUIRE(corrected.size() == original.size());
  REQUIRE(corrected[0] == original[0]);
  REQUIRE(corrected[10] != original[10]);
  REQUIRE(utils::read_file((potfiles / "POTCAR.n").string()) ==
          utils::read_file(utils::utest_filename("vasp/potcar/POTCAR.n")));

  // the self-energy potential is positive, its q=0 component raises the local part
  vasp::potcar pot("POTCAR.ga", utils::utest_filename("vasp/potcar"));
  vasp::potcar best("POTCAR.ga", potfiles.string());
  REQUIRE(best.local_potential()(0) > pot.local_potential()(0));
}

TEST_CASE("cut_correction_fractional", "[corrections]")
{
  utils::scratch_directory dir("cut_fractional");
  make_input_folder(dir.path);
  fake_software software;
  fake_dft_runner runner;
  fake_atomic_runner atom_runner;

  dft::projection_table table = {{"Ga", {40.0, 10.0, 0.0, 0.0}}, {"N", {5.0, 45.0, 0.0, 0.0}}};
  auto plan = corrections::correction_plan::fractional(table, 10.0);
  REQUIRE(plan.targets().size() == 3);

  auto settings = search_settings();
  settings.tolerance = 0.1;
  corrections::cut_correction correction(dir.path / "conduction_correction", dir.path, software, runner,
                                         atom_runner, settings, {"Ga", "N"},
                                         utils::utest_filename("vasp/potcar"), dir.path / "potfiles", true);
  auto res = correction.execute(plan);
  REQUIRE(res.cuts.size() == 3);
  REQUIRE(res.cuts[0].first.to_string() == "Ga(s)");
  REQUIRE(res.cuts[1].first.to_string() == "Ga(p)");
  REQUIRE(res.cuts[2].first.to_string() == "N(p)");
  for(auto const& [key, cut] : res.cuts)
    VALUE_EQUAL(cut, best_cut, 0.12);
  REQUIRE(atom_runner.calls == 6);
  REQUIRE(fs::is_directory(dir.path / "conduction_correction" / "mkpotcar_Ga_s"));
  REQUIRE(fs::is_directory(dir.path / "conduction_correction" / "mkpotcar_N_p"));

  // Ga(s) takes 40/95 of the half electron: 4s 2.00 -> 1.79
  auto inp = atomic::input_file::read((dir.path / "conduction_correction" / "mkpotcar_Ga_s" / "pseudopotential" /
                                       atomic::occupation_folder / atomic::input_filename).string());
  VALUE_EQUAL(inp.valence_orbitals()[1].occupation[0], 2.0 - 0.5*0.42);
}

TEST_CASE("cut_correction_failures", "[corrections]")
{
  utils::scratch_directory dir("cut_failures");
  make_input_folder(dir.path);
  fake_software software;
  fake_atomic_runner atom_runner;
  dft::projection_table table = {{"Ga", {0.0, 90.0, 0.0, 0.0}}, {"N", {0.0, 0.0, 3.0, 0.0}}};

  {
    fake_dft_runner runner;
    corrections::cut_correction correction(dir.path / "empty", dir.path, software, runner, atom_runner,
                                           search_settings(), {"Ga", "N"}, utils::utest_filename("vasp/potcar"),
                                           dir.path / "potfiles", false);
    REQUIRE_THROWS_AS(correction.execute(corrections::correction_plan::simple(table, 95.0)),
                      utils::validation_error);
    REQUIRE(runner.dirs.empty());
  }

  {
    fake_dft_runner runner;
    runner.fail_at = 3;
    corrections::cut_correction correction(dir.path / "failing", dir.path, software, runner, atom_runner,
                                           search_settings(), {"Ga", "N"}, utils::utest_filename("vasp/potcar"),
                                           dir.path / "potfiles", false);
    REQUIRE_THROWS_AS(correction.execute(corrections::correction_plan::simple(table)),
                      utils::external_process_error);
    REQUIRE(runner.dirs.size() == 3);
  }

  {
    fake_dft_runner runner;
    REQUIRE_THROWS_AS(corrections::cut_correction(dir.path / "missing", dir.path, software, runner, atom_runner,
                                                  search_settings(), {"Ga", "O"},
                                                  utils::utest_filename("vasp/potcar"), dir.path / "potfiles", false),
                      utils::missing_artifact_error);
  }
}

TEST_CASE("run_workflow", "[corrections]")
{
  utils::scratch_directory dir("workflow");
  make_input_folder(dir.path);
  fake_software software;
  fake_dft_runner runner;
  fake_atomic_runner atom_runner;

  io::minushalf_input input;
  input.correction_code = "vfc";
  input.potfiles_folder = utils::utest_filename("vasp/potcar");
  input.search_low = 0.0;
  input.search_high = 5.0;
  input.tolerance = 0.02;

  auto settings = corrections::make_correction_settings(input);
  VALUE_EQUAL(settings.search_high, 5.0);
  VALUE_EQUAL(settings.tolerance, 0.02);

  auto res = corrections::run_workflow(input, dir.path, software, runner, atom_runner);
  REQUIRE(runner.dirs.front() == (dir.path / corrections::band_gap_start_folder).string());

  // valence: Ga(p) only, N(d) is below the threshold
  REQUIRE(res.valence_cuts.size() == 1);
  REQUIRE(res.valence_cuts[0].first.to_string() == "Ga(p)");
  // conduction: Ga(s) and N(p)
  REQUIRE(res.conduction_cuts.size() == 2);
  REQUIRE(res.conduction_cuts[0].first.to_string() == "Ga(s)");
  REQUIRE(res.conduction_cuts[1].first.to_string() == "N(p)");
  VALUE_EQUAL(res.gap, 3.0, 0.01);

  // the conduction correction starts from the valence corrected files
  REQUIRE(fs::exists(dir.path / corrections::valence_potfiles_folder / "POTCAR.ga"));
  REQUIRE(fs::exists(dir.path / corrections::conduction_potfiles_folder / "POTCAR.n"));

  auto lines = utils::read_lines((dir.path / corrections::results_filename).string());
  REQUIRE(lines.size() == 8);
  REQUIRE(lines[0] == "Valence correction cuts:");
  REQUIRE(lines[1].rfind("\tGa(p):", 0) == 0);
  REQUIRE(lines[3] == "Conduction correction cuts:");
  REQUIRE(lines[7] == "GAP: 3.00eV");
}

}
