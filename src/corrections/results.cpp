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



#include <string>
#include <vector>

#include "fmt/format.h"
#include "IO/app_loggers.h"
#include "utilities/parser.h"
#include "corrections/results.h"

namespace corrections
{

namespace
{

constexpr const char* separator = "----------------------------------------------";

void append_cuts(std::vector<std::string>& lines, cut_list const& cuts)
{
  for(auto const& [key, cut] : cuts)
    lines.emplace_back(fmt::format("\t{}:{:.2f}A", key.to_string(), cut));
}

}

std::vector<std::string> minushalf_results_lines(cut_list const& valence_cuts, double gap,
                                                 cut_list const& conduction_cuts)
{
  std::vector<std::string> lines;
  lines.emplace_back("Valence correction cuts:");
  append_cuts(lines, valence_cuts);
  lines.emplace_back(separator);
  if(not conduction_cuts.empty()) {
    lines.emplace_back("Conduction correction cuts:");
    append_cuts(lines, conduction_cuts);
    lines.emplace_back(separator);
  }
  lines.emplace_back(fmt::format("GAP: {:.2f}eV", gap));
  return lines;
}

void make_minushalf_results(cut_list const& valence_cuts, double gap,
                            cut_list const& conduction_cuts, std::string const& name)
{
  auto lines = minushalf_results_lines(valence_cuts, gap, conduction_cuts);
  for(auto const& l : lines)
    app_log(1, "{}", l);
  utils::write_lines(name, lines);
}

}
