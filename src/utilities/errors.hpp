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



#ifndef UTILITIES_ERRORS_HPP
#define UTILITIES_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace utils
{

/*
 * Error hierarchy. Every error raised by the library derives from minushalf_error,
 * so callers can handle them as a group and still tell them apart.
 */
struct minushalf_error : std::runtime_error
{
  using std::runtime_error::runtime_error;
};

// malformed external file
struct format_error : minushalf_error
{
  using minushalf_error::minushalf_error;
};

// invalid configuration value: chemical symbol, xc code, option in the input file, ...
struct validation_error : minushalf_error
{
  using minushalf_error::minushalf_error;
};

// no orbital can take the requested occupation shift
struct occupation_error : minushalf_error
{
  using minushalf_error::minushalf_error;
};

// spawned program reported a failure
struct external_process_error : minushalf_error
{
  using minushalf_error::minushalf_error;
};

// expected output file absent after a program run
struct missing_artifact_error : minushalf_error
{
  using minushalf_error::minushalf_error;
};

}

#endif
