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



#ifndef ATOMIC_INPUT_FILE_H
#define ATOMIC_INPUT_FILE_H

#include <string>
#include <vector>

namespace atomic
{

struct orbital
{
  int n = 0;
  int l = 0;
  // one component, or two for spin polarized calculations
  std::vector<double> occupation;
};

/*
 * Input deck of the ATOM program (INP).
 *
 * Layout, after comment lines are dropped:
 *   line 0: calculation code and free text description
 *   line 1: n=<symbol> c=<exchange correlation code>
 *   line 2: esoteric line, kept verbatim
 *   line 3: number of core and valence orbitals
 *   next number_valence lines: n l occupation [occupation]
 *   remaining lines kept verbatim
 *
 * Symbol, exchange correlation and calculation codes are validated on construction,
 * an invalid input_file can not be created.
 */
class input_file
{
public:

  input_file(std::string xc_code, std::string calc_code, std::string symbol,
             std::string esoteric_line, int number_core, std::vector<orbital> valence,
             std::string description = "", std::vector<std::string> trailing_lines = {});

  input_file(input_file const&) = default;
  input_file(input_file&&) = default;
  input_file& operator=(input_file const&) = default;
  input_file& operator=(input_file&&) = default;
  ~input_file() = default;

  // Parse an INP file, throws utils::format_error naming the malformed field group
  static input_file read(std::string const& filename);
  static input_file parse(std::vector<std::string> const& lines);

  // Input from the tabulated default configuration, throws utils::validation_error for unknown elements
  static input_file minimum_setup(std::string const& symbol, std::string const& xc_code,
                                  int max_iterations = 100, std::string const& calc_code = "ae");

  /*
   * Removes fraction electrons from the first occupation component of the last orbital
   * with angular momentum l which is not already empty.
   * Throws utils::occupation_error if no such orbital exists.
   */
  void apply_occupation_shift(double fraction, int l);

  std::vector<std::string> serialize() const;
  void write(std::string const& filename) const;

  static bool is_valid_xc_code(std::string const& xc);
  static bool is_valid_calc_code(std::string const& code);

  std::string const& exchange_correlation_code() const { return xc_code; }
  std::string const& calculation_code() const { return calc_code; }
  std::string const& chemical_symbol() const { return symbol; }
  std::string const& description() const { return descr; }
  std::string const& esoteric_line() const { return esoteric; }
  int number_core_orbitals() const { return ncore; }
  int number_valence_orbitals() const { return static_cast<int>(orbitals.size()); }
  std::vector<orbital> const& valence_orbitals() const { return orbitals; }
  std::vector<std::string> const& trailing_lines() const { return trailing; }

private:

  std::string xc_code;
  std::string calc_code;
  std::string symbol;
  std::string descr;
  std::string esoteric;
  int ncore = 0;
  std::vector<orbital> orbitals;
  std::vector<std::string> trailing;

};

}

#endif
