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



#ifndef DFT_PROCESS_H
#define DFT_PROCESS_H

#include <string>
#include <vector>
#include "dft/run_status.hpp"

namespace dft
{

/*
 * Runs command in working_directory and blocks until it finishes. Standard output is
 * redirected to working_directory/stdout_file, standard error is captured and returned.
 * Throws utils::external_process_error if the program can not be started.
 */
[[nodiscard]] run_status run_process(std::vector<std::string> const& command,
                                     std::string const& working_directory,
                                     std::string const& stdout_file = "stdout");

}

#endif
