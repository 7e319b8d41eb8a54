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



#ifndef DFT_RUN_STATUS_HPP
#define DFT_RUN_STATUS_HPP

#include <string>
#include <string_view>
#include "IO/app_loggers.h"
#include "utilities/check.hpp"
#include "utilities/parser.h"

namespace dft
{

// Outcome of an external program run.
struct run_status
{
  int exit_code = 0;
  std::string stderr_output;

  bool ok() const { return exit_code == 0 and utils::trim(stderr_output).empty(); }
};

/*
 * Throws utils::external_process_error, tagged with component, if the run failed:
 * non-zero exit code or anything written to the error stream.
 */
inline void check_run(run_status const& status, std::string_view component)
{
  if(not status.ok() and not utils::trim(status.stderr_output).empty())
    app_error(" {} wrote to stderr:\n{}", component, status.stderr_output);
  utils::check<utils::external_process_error>(status.ok(),
      "{}: Call to external program failed (exit code: {}). stderr: {}",
      component, status.exit_code, utils::trim(status.stderr_output));
}

}

#endif
