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



#ifndef CORRECTIONS_RESULTS_H
#define CORRECTIONS_RESULTS_H

#include <string>
#include <vector>
#include "corrections/correction_plan.h"

namespace corrections
{

inline constexpr const char* results_filename = "minushalf_results.dat";

/*
 * Final report of a correction run:
 *
 *   Valence correction cuts:
 *   \t<key>:<cut>A
 *   ----------------------------------------------
 *   Conduction correction cuts:          (only with conduction cuts)
 *   \t<key>:<cut>A
 *   ----------------------------------------------
 *   GAP: <gap>eV
 *
 * Cuts and gap are printed with two decimals.
 */
std::vector<std::string> minushalf_results_lines(cut_list const& valence_cuts, double gap,
                                                 cut_list const& conduction_cuts = {});

void make_minushalf_results(cut_list const& valence_cuts, double gap,
                            cut_list const& conduction_cuts = {},
                            std::string const& name = results_filename);

}

#endif
