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



#define CATCH_CONFIG_RUNNER
#include "catch2/catch.hpp"

#include <cstdlib>

#include "IO/app_loggers.h"
#include "utilities/test_common.hpp"

namespace
{

// level from an environment variable, default outside [0,5]
int env_level(const char* name, int def)
{
  if(const char* env_p = std::getenv(name)) {
    int level = std::atoi(env_p);
    if(level >= 0 and level <= 5) return level;
  }
  return def;
}

}

int main(int argc, char* argv[])
{
  setup_loggers(env_level("OUTPUT_LEVEL", 2), env_level("DEBUG_LEVEL", 2));

  Catch::Session session;

  // scratch folders hold the inputs and outputs of the fake program runs
  using namespace Catch::clara;
  auto cli
    = session.cli()
    | Opt( utils::detail::keep_scratch_directories )
        ["--keep-scratch"]
        ("Do not remove the scratch folders of the tests.");
  session.cli(cli);

  int returnCode = session.applyCommandLine( argc, argv );
  if( returnCode != 0 ) // Indicates a command line error
      return returnCode;

  return session.run();
}
