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



#include <cmath>
#include <regex>
#include <string>
#include <vector>

#include "fmt/format.h"
#include "fmt/ranges.h"
#include "IO/app_loggers.h"
#include "utilities/check.hpp"
#include "utilities/parser.h"
#include "utilities/periodic_table.h"
#include "atomic/electronic_distribution.h"
#include "atomic/input_file.h"

namespace atomic
{

namespace
{

// numpy.isclose(a, b, rtol, atol)
bool is_close(double a, double b, double rtol = 1e-4, double atol = 1e-8)
{
  return std::abs(a - b) <= atol + rtol * std::abs(b);
}

// "n=Ga" -> "Ga"
std::string key_value(std::string const& token)
{
  auto pos = token.find('=');
  if(pos == std::string::npos or pos+1 == token.size()) return std::string{};
  return token.substr(pos+1);
}

bool to_int(std::string const& token, int& value)
{
  std::size_t pos = 0;
  try {
    value = std::stoi(token, &pos);
  } catch(std::exception const&) {
    return false;
  }
  return pos == token.size();
}

orbital parse_orbital(std::string const& line)
{
  auto tokens = utils::split(line);
  orbital orb;
  bool ok = tokens.size() >= 3 and to_int(tokens[0], orb.n) and to_int(tokens[1], orb.l);
  if(ok) {
    for(std::size_t i=2; i<tokens.size() and ok; ++i) {
      std::size_t pos = 0;
      try {
        orb.occupation.push_back(std::stod(tokens[i], &pos));
        ok = (pos == tokens[i].size());
      } catch(std::exception const&) {
        ok = false;
      }
    }
  }
  utils::check<utils::format_error>(ok, "input_file::parse: Valence orbitals not provided correctly: '{}'", line);
  return orb;
}

}

input_file::input_file(std::string xc_code_, std::string calc_code_, std::string symbol_,
                       std::string esoteric_line_, int number_core, std::vector<orbital> valence,
                       std::string description_, std::vector<std::string> trailing_lines) :
  xc_code(std::move(xc_code_)),
  calc_code(std::move(calc_code_)),
  symbol(utils::periodic_table::capitalize(symbol_)),
  descr(std::move(description_)),
  esoteric(std::move(esoteric_line_)),
  ncore(number_core),
  orbitals(std::move(valence)),
  trailing(std::move(trailing_lines))
{
  utils::check<utils::validation_error>(utils::periodic_table::is_element(symbol),
      "input_file: The chemical symbol is not valid: {}", symbol_);
  utils::check<utils::validation_error>(is_valid_xc_code(xc_code),
      "input_file: Invalid exchange and correlation functional: {}", xc_code);
  utils::check<utils::validation_error>(is_valid_calc_code(calc_code),
      "input_file: Invalid calculation code: {}", calc_code);
  utils::check<utils::validation_error>(ncore >= 0,
      "input_file: Invalid number of core orbitals: {}", ncore);
  for(auto const& orb : orbitals)
    utils::check<utils::validation_error>(orb.occupation.size() == 1 or orb.occupation.size() == 2,
        "input_file: Orbital ({},{}) must carry 1 or 2 occupations, found {}", orb.n, orb.l,
        orb.occupation.size());
}

bool input_file::is_valid_xc_code(std::string const& xc)
{
  static const std::regex xc_regex("r?(ca|wi|hl|gl|bh|pb|rp|rv|bl)(s|r)?");
  return std::regex_match(xc, xc_regex);
}

bool input_file::is_valid_calc_code(std::string const& code)
{
  return code == "ae";
}

input_file input_file::read(std::string const& filename)
{
  app_log(3, "  Reading atomic input file: {}", filename);
  return parse(utils::read_lines(filename));
}

input_file input_file::parse(std::vector<std::string> const& all_lines)
{
  auto lines = utils::drop_comments(all_lines);

  // header
  std::vector<std::string> header;
  if(lines.size() > 0) header = utils::split(lines[0]);
  utils::check<utils::format_error>(header.size() > 0,
      "input_file::parse: Description or calculation code not provided");
  std::string calc = header[0];
  std::vector<std::string> dwords(header.begin()+1, header.end());
  std::string description = fmt::format("{}", fmt::join(dwords, " "));

  // symbol and functional
  std::string sym, xc;
  if(lines.size() > 1) {
    auto tokens = utils::split(lines[1]);
    if(tokens.size() >= 2) {
      sym = key_value(tokens[0]);
      xc = key_value(tokens[1]);
    }
  }
  utils::check<utils::format_error>(not sym.empty() and not xc.empty(),
      "input_file::parse: Chemical symbol or exchange correlation not provided");

  utils::check<utils::format_error>(lines.size() > 2, "input_file::parse: Esoteric line not provided");
  std::string esoteric = lines[2];

  int ncore = 0, nval = 0;
  bool counts_ok = false;
  if(lines.size() > 3) {
    auto tokens = utils::split(lines[3]);
    counts_ok = tokens.size() >= 2 and to_int(tokens[0], ncore) and to_int(tokens[1], nval) and nval >= 0;
  }
  utils::check<utils::format_error>(counts_ok,
      "input_file::parse: Number of core orbitals or number of valence orbitals not provided");

  utils::check<utils::format_error>(lines.size() >= std::size_t(4+nval),
      "input_file::parse: Valence orbitals not provided correctly. Expected {} orbital lines, found {}",
      nval, lines.size() < 4 ? 0 : lines.size()-4);
  std::vector<orbital> valence;
  valence.reserve(nval);
  for(int i=0; i<nval; ++i)
    valence.emplace_back(parse_orbital(lines[4+i]));

  std::vector<std::string> trailing(lines.begin()+4+nval, lines.end());

  return input_file(xc, calc, sym, esoteric, ncore, std::move(valence), description, std::move(trailing));
}

input_file input_file::minimum_setup(std::string const& symbol, std::string const& xc_code,
                                     int max_iterations, std::string const& calc_code)
{
  auto const& dist = electronic_distribution(symbol);
  std::vector<orbital> valence;
  valence.reserve(dist.valence.size());
  for(auto const& o : dist.valence)
    valence.emplace_back(orbital{o.n, o.l, {o.occupation}});
  auto sym = utils::periodic_table::capitalize(symbol);
  return input_file(xc_code, calc_code, sym,
                    "       0.0       0.0       0.0       0.0       0.0       0.0",
                    dist.core_orbitals, std::move(valence), sym,
                    {fmt::format("{} maxit", max_iterations)});
}

void input_file::apply_occupation_shift(double fraction, int l)
{
  for(auto it = orbitals.rbegin(); it != orbitals.rend(); ++it) {
    if(it->l == l and not is_close(it->occupation[0], 0.0)) {
      app_debug(2, "  input_file: shifting occupation of orbital ({},{}) by -{}", it->n, it->l, fraction);
      it->occupation[0] -= fraction;
      return;
    }
  }
  utils::check<utils::occupation_error>(false,
      "input_file::apply_occupation_shift: Trouble with occupation, no occupied orbital with l={} in {}. "
      "Please verify the parameters passed and the INP file.", l, symbol);
}

std::vector<std::string> input_file::serialize() const
{
  std::vector<std::string> lines;
  lines.reserve(4 + orbitals.size() + trailing.size());
  lines.emplace_back(fmt::format("   {}      {}", calc_code, descr));
  if(symbol.size() == 2)
    lines.emplace_back(fmt::format(" n={} c={}", symbol, xc_code));
  else
    lines.emplace_back(fmt::format(" n={}  c={}", symbol, xc_code));
  lines.emplace_back(esoteric);
  if(ncore <= 9)
    lines.emplace_back(fmt::format("    {}    {}", ncore, orbitals.size()));
  else
    lines.emplace_back(fmt::format("   {}    {}", ncore, orbitals.size()));
  for(auto const& orb : orbitals)
    lines.emplace_back(fmt::format("    {}    {}      {:.2f}", orb.n, orb.l,
                                   fmt::join(orb.occupation, "      ")));
  lines.insert(lines.end(), trailing.begin(), trailing.end());
  return lines;
}

void input_file::write(std::string const& filename) const
{
  utils::write_lines(filename, serialize());
}

}
