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
#include <string>
#include <vector>

#include "catch2/catch.hpp"

#include "nda/nda.hpp"
#include "utilities/test_common.hpp"
#include "utilities/parser.h"
#include "atomic/orbital_type.hpp"
#include "dft/concepts.hpp"
#include "dft/band_structure.h"
#include "vasp/vasprun.h"
#include "vasp/eigenval.h"
#include "vasp/procar.h"
#include "vasp/potcar.h"
#include "vasp/vasp_runner.h"
#include "vasp/vasp_software.h"

namespace minushalf_tests
{

using utils::VALUE_EQUAL;

static_assert(dft::Software<vasp::vasp_software>);
static_assert(dft::PotentialFile<vasp::potcar>);
static_assert(dft::BandProjectionSource<vasp::procar>);
static_assert(dft::Runner<vasp::vasp_runner>);

TEST_CASE("vasprun", "[vasp]")
{
  vasp::vasprun xml(utils::utest_filename("vasp/gan-3d/vasprun.xml"));
  // last value in the file
  VALUE_EQUAL(xml.fermi_energy(), 5.06822674);
  auto atoms = xml.atoms_map();
  REQUIRE(atoms.size() == 2);
  REQUIRE(atoms.at("1") == "Ga");
  REQUIRE(atoms.at("2") == "N");

  REQUIRE_THROWS_AS(vasp::vasprun(utils::utest_filename("vasp/gan-3d/missing.xml")), utils::missing_artifact_error);

  utils::scratch_directory dir("vasprun");
  auto bad = (dir.path / "vasprun.xml").string();
  utils::write_lines(bad, {"<modeling>", " <atominfo>", "</modeling>"});
  REQUIRE_THROWS_AS(vasp::vasprun(bad), utils::format_error);

  auto empty = (dir.path / "empty.xml").string();
  utils::write_lines(empty, {"<modeling>", "</modeling>"});
  vasp::vasprun no_data(empty);
  REQUIRE_THROWS_AS(no_data.fermi_energy(), utils::format_error);
  REQUIRE_THROWS_AS(no_data.atoms_map(), utils::format_error);
}

TEST_CASE("eigenval", "[vasp]")
{
  vasp::eigenval eig(utils::utest_filename("vasp/gan-3d/EIGENVAL"));
  REQUIRE(eig.number_of_spins() == 1);
  REQUIRE(eig.number_of_electrons() == 18);
  REQUIRE(eig.number_of_kpoints() == 2);
  REQUIRE(eig.number_of_bands() == 4);
  VALUE_EQUAL(eig.kpoints()(1, 0), 0.5);
  VALUE_EQUAL(eig.eigenvalues()(0, 2), 6.8);
  VALUE_EQUAL(eig.eigenvalues()(1, 1), 4.9);

  utils::scratch_directory dir("eigenval");
  auto lines = utils::read_lines(utils::utest_filename("vasp/gan-3d/EIGENVAL"));
  lines.resize(lines.size() - 2);
  auto truncated = (dir.path / "EIGENVAL").string();
  utils::write_lines(truncated, lines);
  REQUIRE_THROWS_AS(vasp::eigenval(truncated), utils::format_error);
  REQUIRE_THROWS_AS(vasp::eigenval((dir.path / "missing").string()), utils::missing_artifact_error);
}

TEST_CASE("procar", "[vasp]")
{
  vasp::procar pro(utils::utest_filename("vasp/gan-3d/PROCAR"));
  REQUIRE(pro.number_of_kpoints() == 2);
  REQUIRE(pro.number_of_bands() == 4);
  REQUIRE(pro.number_of_ions() == 2);

  // valence band maximum: k-point 2, band 2
  auto vbm = pro.get_band_projection(1, 1);
  REQUIRE(vbm.size() == 2);
  VALUE_EQUAL(vbm[0][atomic::s_orbital], 0.01);
  VALUE_EQUAL(vbm[0][atomic::p_orbital], 0.03);
  VALUE_EQUAL(vbm[0][atomic::d_orbital], 0.30);
  VALUE_EQUAL(vbm[0][atomic::f_orbital], 0.0);
  VALUE_EQUAL(vbm[1][atomic::p_orbital], 0.65);

  // the spin down block does not overwrite the first k-point
  auto first = pro.get_band_projection(0, 0);
  VALUE_EQUAL(first[0][atomic::s_orbital], 0.1);
  VALUE_EQUAL(first[0][atomic::d_orbital], 0.25);

  REQUIRE_THROWS_AS(pro.get_band_projection(2, 0), utils::format_error);
  REQUIRE_THROWS_AS(pro.get_band_projection(0, 4), utils::format_error);
}

TEST_CASE("potcar", "[vasp]")
{
  auto folder = utils::utest_filename("vasp/potcar");
  vasp::potcar pot("POTCAR.n", folder);
  REQUIRE(pot.name() == "POTCAR.n");
  VALUE_EQUAL(pot.maximum_wave_vector(), 98.3986008848968);
  auto v = pot.local_potential();
  REQUIRE(v.size() == 12);
  VALUE_EQUAL(v(0), 54.941658);
  VALUE_EQUAL(v(11), -0.012345678);

  // unchanged potential gives back the file
  REQUIRE(pot.corrected_lines(v) == utils::read_lines(pot.path()));

  nda::array<double,1> shifted = v;
  shifted() += 1.0;
  auto lines = pot.corrected_lines(shifted);
  REQUIRE(lines.size() == pot.lines().size());
  REQUIRE(lines[10] == "  0.55941658E+02  0.55937256E+02  0.55924052E+02  0.55902053E+02  0.55871272E+02");
  REQUIRE(lines[12] == "  0.55503409E+02  0.98765432E+00");
  REQUIRE(lines[13] == " gradient corrections used for XC");
  REQUIRE(lines.back() == " End of Dataset");

  utils::scratch_directory dir("potcar");
  utils::write_lines((dir.path / "POTCAR").string(), lines);
  vasp::potcar back("POTCAR", dir.str());
  VALUE_EQUAL(back.local_potential()(11), 0.98765432);

  REQUIRE_THROWS_AS(pot.corrected_lines(nda::array<double,1>(3)), utils::format_error);
  // a diverged correction must not reach the file
  nda::array<double,1> broken = v;
  broken(4) = std::nan("");
  REQUIRE_THROWS_AS(pot.corrected_lines(broken), utils::format_error);
  REQUIRE_THROWS_AS(vasp::potcar("POTCAR.no_local", folder), utils::format_error);
  REQUIRE_THROWS_AS(vasp::potcar("POTCAR.missing", folder), utils::missing_artifact_error);
}

TEST_CASE("vasp_software", "[vasp]")
{
  vasp::vasp_software software;
  auto base = utils::utest_filename("vasp/gan-3d");
  REQUIRE(software.get_number_of_bands(base) == 4);
  REQUIRE(software.get_number_of_kpoints(base) == 2);
  VALUE_EQUAL(software.get_fermi_energy(base), 5.06822674);
  REQUIRE(software.potential_filename() == "POTCAR");
  REQUIRE(software.input_files() == std::vector<std::string>{"INCAR", "KPOINTS", "POSCAR"});

  dft::band_structure bs(software.get_eigenvalues(base), software.get_fermi_energy(base),
                         software.get_atoms_map(base), software.get_number_of_bands(base));
  VALUE_EQUAL(bs.band_gap().gap, 1.9);

  auto vbm = bs.vbm_projection(software.get_band_projection_class(base));
  REQUIRE(vbm.size() == 2);
  REQUIRE(vbm[0].symbol == "Ga");
  VALUE_EQUAL(vbm[0][atomic::d_orbital], 30.0);
  VALUE_EQUAL(vbm[1][atomic::p_orbital], 65.0);

  auto cbm = bs.cbm_projection(software.get_band_projection_class(base));
  VALUE_EQUAL(cbm[0][atomic::s_orbital], 40.0);
  VALUE_EQUAL(cbm[0][atomic::p_orbital], 10.0);
  VALUE_EQUAL(cbm[1][atomic::s_orbital], 5.0);
  VALUE_EQUAL(cbm[1][atomic::p_orbital], 45.0);

  auto pot = software.get_potential_class("POTCAR.ga", utils::utest_filename("vasp/potcar"));
  REQUIRE(pot.local_potential().size() == 12);
}

TEST_CASE("vasp_runner", "[vasp]")
{
  REQUIRE(vasp::vasp_runner(6, "vasp_std", "mpiexec").command() ==
          std::vector<std::string>{"mpiexec", "-np", "6", "vasp_std"});
  REQUIRE(vasp::vasp_runner(1, "vasp_gam", "").command() == std::vector<std::string>{"vasp_gam"});
  REQUIRE_THROWS_AS(vasp::vasp_runner(0), utils::validation_error);
  REQUIRE_THROWS_AS(vasp::vasp_runner(2, ""), utils::validation_error);

  utils::scratch_directory dir("vasp_runner");
  auto status = vasp::vasp_runner(1, "true", "").run(dir.str());
  REQUIRE(status.ok());
  REQUIRE(std::filesystem::exists(dir.path / "vasp.out"));
  REQUIRE_THROWS_AS(vasp::vasp_runner(1, "true", "").run((dir.path / "missing").string()),
                    utils::missing_artifact_error);
}

}
