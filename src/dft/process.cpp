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

#include <boost/filesystem.hpp>
#include <boost/process.hpp>

#include "fmt/format.h"
#include "fmt/ranges.h"
#include "IO/app_loggers.h"
#include "utilities/check.hpp"
#include "dft/process.h"

namespace dft
{

namespace bp = boost::process;

run_status run_process(std::vector<std::string> const& command,
                       std::string const& working_directory,
                       std::string const& stdout_file)
{
  utils::check<utils::external_process_error>(not command.empty(), "run_process: Empty command.");

  boost::filesystem::path exe(command[0]);
  if(not exe.has_parent_path())
    exe = bp::search_path(command[0]);
  utils::check<utils::external_process_error>(not exe.empty(),
      "run_process: Executable not found in PATH: {}", command[0]);

  std::vector<std::string> args(command.begin()+1, command.end());
  auto out_path = boost::filesystem::path(working_directory) / stdout_file;
  app_log(2, "  Running: {} (in {})", fmt::join(command, " "), working_directory);

  run_status status;
  try {
    bp::ipstream err_stream;
    bp::child c(exe, bp::args(args), bp::start_dir(working_directory),
                bp::std_in < bp::null, bp::std_out > out_path, bp::std_err > err_stream);
    std::string line;
    while(std::getline(err_stream, line))
      status.stderr_output += line + "\n";
    c.wait();
    status.exit_code = c.exit_code();
  } catch(bp::process_error const& e) {
    throw utils::external_process_error(
        fmt::format("run_process: Could not run {}: {}", command[0], e.what()));
  }
  app_debug(2, "  {} finished with exit code {}", command[0], status.exit_code);
  return status;
}

}
