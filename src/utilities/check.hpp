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



#ifndef UTILITIES_CHECK_HPP
#define UTILITIES_CHECK_HPP

#include <string>
#include <string_view>
#include "fmt/format.h"
#include "fmt/ranges.h"
#include "utilities/errors.hpp"

namespace utils
{

/**
 * Checks whether cond is true, and throws Error otherwise with the formatted message.
 * @tparam Error - exception type, derived from utils::minushalf_error
 * @param cond - condition to be verified
 * @param format_string, args - message
 */
template<class Error = minushalf_error, class... Args>
void check(bool cond, const std::string_view format_string, Args&&... args)
{
  if(not cond) {
    if constexpr (sizeof...(Args) > 0)
      throw Error(fmt::vformat(format_string, fmt::make_format_args(args...)));
    else
      throw Error(std::string(format_string));
  }
}

}

#endif
