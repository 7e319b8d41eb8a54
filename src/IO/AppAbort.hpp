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



#ifndef IO_APPABORT_HPP
#define IO_APPABORT_HPP

#include <iostream>
#include <string>
#include <string_view>
#include <cstdlib>
#include "fmt/format.h"

#if defined(ENABLE_SPDLOG)

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"

template<class... Args>
[[noreturn]] void APP_ABORT(const std::string_view format_string, Args&&... args)
{
  auto l = spdlog::get("err_console");
  if(not l)
    l = spdlog::stdout_color_mt("err_console");
  l->error("**********************************************");
  l->error("        APPLICATION ABORT: Fatal Error.");
  l->error("**********************************************");
  l->error(fmt::vformat(format_string, fmt::make_format_args(args...)));
  l->error("**********************************************");
  l->flush();
  std::exit(EXIT_FAILURE);
}


#else

template<class... Args>
[[noreturn]] void APP_ABORT(const std::string_view format_string, Args&&... args)
{
  std::cerr<<"**********************************************\n";
  std::cerr<<"        APPLICATION ABORT: Fatal Error.\n";
  std::cerr<<"**********************************************\n";
  std::cerr<<fmt::vformat(format_string, fmt::make_format_args(args...)) <<"\n";
  std::cerr<<"**********************************************\n";
  std::cerr.flush();
  std::exit(EXIT_FAILURE);
}


#endif // ENABLE_SPDLOG

#endif
