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



#ifndef DFT_CONCEPTS_HPP
#define DFT_CONCEPTS_HPP

#include <concepts>
#include <map>
#include <string>
#include <vector>
#include "nda/nda.hpp"
#include "dft/run_status.hpp"
#include "dft/band_projection.hpp"

namespace dft
{

/*
 * Pseudopotential file of a DFT code, seen through its local potential in reciprocal space.
 */
template<class P>
concept PotentialFile = requires(P const& p, nda::array<double,1> const& v) {
  { p.name() } -> std::convertible_to<std::string>;
  { p.maximum_wave_vector() } -> std::convertible_to<double>;
  { p.local_potential() } -> std::convertible_to<nda::array<double,1>>;
  { p.corrected_lines(v) } -> std::same_as<std::vector<std::string>>;
};

template<class B>
concept BandProjectionSource = requires(B const& b, long k, long n) {
  { b.get_band_projection(k, n) } -> std::same_as<ion_projections>;
};

// Blocking run of the periodic DFT program in a directory.
template<class R>
concept Runner = requires(R& r, std::string const& dir) {
  { r.run(dir) } -> std::same_as<run_status>;
};

/*
 * Capability interface of a DFT code. Every getter takes the directory holding the
 * output of a finished calculation and throws utils::format_error on malformed files.
 */
template<class S>
concept Software = requires(S const& s, std::string const& base_path, std::string const& filename) {
  { s.get_eigenvalues(base_path) } -> std::convertible_to<nda::array<double,2>>;
  { s.get_fermi_energy(base_path) } -> std::convertible_to<double>;
  { s.get_atoms_map(base_path) } -> std::same_as<std::map<std::string,std::string>>;
  { s.get_number_of_bands(base_path) } -> std::convertible_to<long>;
  { s.get_number_of_kpoints(base_path) } -> std::convertible_to<long>;
  { s.get_band_projection_class(base_path) } -> BandProjectionSource;
  { s.get_potential_class(filename, base_path) } -> PotentialFile;
  { s.potential_filename() } -> std::convertible_to<std::string>;
  { s.input_files() } -> std::same_as<std::vector<std::string>>;
};

}

#endif
