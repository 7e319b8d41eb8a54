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



#include <regex>
#include <string>
#include <vector>

#include "fmt/format.h"
#include "IO/app_loggers.h"
#include "utilities/check.hpp"
#include "utilities/parser.h"
#include "atomic/vtotal.h"

namespace atomic::vtotal
{

namespace
{

// lines of the table after the header, 4 values each
constexpr long values_per_line = 4;

void append_values(std::string const& line, std::vector<double>& values, std::size_t line_number)
{
  for(auto const& tok : utils::split(line)) {
    std::size_t pos = 0;
    double v = 0.0;
    try {
      v = std::stod(tok, &pos);
    } catch(std::exception const&) {
      pos = 0;
    }
    utils::check<utils::format_error>(pos > 0 and pos == tok.size(),
        "vtotal::parse: Non numeric value '{}' in line {}", tok, line_number+1);
    values.push_back(v);
  }
}

void append_table(std::vector<std::string>& lines, nda::array<double,1> const& values)
{
  std::string line;
  for(long i=0; i<values.size(); ++i) {
    line += fmt::format("{:20.12E}", values(i));
    if((i+1)%values_per_line == 0 or i+1 == values.size()) {
      lines.emplace_back(std::move(line));
      line.clear();
    }
  }
}

}

radial_potential parse(std::vector<std::string> const& lines)
{
  static const std::regex down_regex(R"(^.*Down\s+potential\s+follows.*)");
  static const std::regex up_regex(R"(^.*Up\s+potential\s+follows.*)");

  std::vector<double> r, v;
  std::size_t i = 1;  // header
  for(; i<lines.size(); ++i) {
    if(std::regex_match(lines[i], down_regex)) break;
    append_values(lines[i], r, i);
  }
  utils::check<utils::format_error>(i < lines.size(),
      "vtotal::parse: Potential information not found, missing 'Down potential follows' marker.");

  i += 2;  // marker and l value
  bool found_up = false;
  for(; i<lines.size(); ++i) {
    if(std::regex_match(lines[i], up_regex)) {
      found_up = true;
      break;
    }
    append_values(lines[i], v, i);
  }
  utils::check<utils::format_error>(found_up,
      "vtotal::parse: End of spin down potential not found, missing 'Up potential follows' marker.");
  utils::check<utils::format_error>(r.size() > 0, "vtotal::parse: Empty radial grid.");
  utils::check<utils::format_error>(r.size() == v.size(),
      "vtotal::parse: Size mismatch between radial grid ({}) and down potential ({}).", r.size(), v.size());
  for(std::size_t k=1; k<r.size(); ++k)
    utils::check<utils::format_error>(r[k] > r[k-1],
        "vtotal::parse: Radial grid is not strictly increasing at index {}.", k);

  long n = static_cast<long>(r.size());
  radial_potential sample{nda::array<double,1>(n), nda::array<double,1>(n)};
  for(long k=0; k<n; ++k) {
    sample.radius(k) = r[k];
    sample.potential(k) = v[k];
  }
  return sample;
}

radial_potential read(std::string const& filename)
{
  app_log(3, "  Reading radial potential: {}", filename);
  try {
    return parse(utils::read_lines(filename));
  } catch(utils::format_error const& e) {
    throw utils::format_error(fmt::format("{} (file: {})", e.what(), filename));
  }
}

std::vector<std::string> serialize(radial_potential const& sample)
{
  utils::check<utils::format_error>(sample.radius.size() == sample.potential.size(),
      "vtotal::serialize: Size mismatch between radial grid ({}) and potential ({}).",
      sample.radius.size(), sample.potential.size());
  std::vector<std::string> lines;
  lines.reserve(3*(sample.size()/values_per_line + 2));
  lines.emplace_back(" Radial grid follows");
  append_table(lines, sample.radius);
  lines.emplace_back(" Down potential follows (l on next line)");
  lines.emplace_back("  0");
  append_table(lines, sample.potential);
  // unpolarized reference, both channels are identical
  lines.emplace_back(" Up potential follows (l on next line)");
  lines.emplace_back("  0");
  append_table(lines, sample.potential);
  return lines;
}

void write(std::string const& filename, radial_potential const& sample)
{
  utils::write_lines(filename, serialize(sample));
}

}
