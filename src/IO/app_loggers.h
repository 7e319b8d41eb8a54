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



#ifndef IO_APP_LOGGERS_H
#define IO_APP_LOGGERS_H

#include <iostream>
#include <string>
#include <string_view>
#if defined(ENABLE_SPDLOG)
#include "spdlog/spdlog.h"
#endif
#include "fmt/format.h"
#include "fmt/ranges.h"
#include "IO/AppAbort.hpp"

extern int __app_debug_level__; 
extern int __app_output_level__; 

// app_log: uses "std_console" with a clean format
// app_warning: uses "warn_console"
// app_error/app_debug: use "err_console"

void setup_loggers(int output_level=2, int debug_level=0);
void set_output_level(int output_level);
void set_debug_level(int debug_level);

namespace io::detail
{
template<class... Args>
std::string format_message(const std::string_view string_format, Args&&... args)
{
  if constexpr (sizeof...(Args) > 0)
    return fmt::vformat(string_format, fmt::make_format_args(args...));
  else
    return std::string(string_format);
}
}

template<class... Args>
void app_log(int level, const std::string_view string_format, Args&&... args)
{
  if(__app_output_level__ > 0 and level <= __app_output_level__) {
#if defined(ENABLE_SPDLOG)
    auto l = spdlog::get("std_console");
    if(l) 
      l->info(io::detail::format_message(string_format,std::forward<Args>(args)...));
    else
      APP_ABORT(" Error: app_log used uninitialized.");
#else
    std::cout<<io::detail::format_message(string_format,std::forward<Args>(args)...) <<"\n";
#endif
  }
}

template<class... Args>
void app_warning(const std::string_view string_format, Args&&... args)
{ 
#if defined(ENABLE_SPDLOG)
  auto l = spdlog::get("warn_console");
  if(l)
    l->warn(io::detail::format_message(string_format,std::forward<Args>(args)...));
  else
    APP_ABORT(" Error: app_warning used uninitialized.");
#else
  std::cerr<<io::detail::format_message(string_format,std::forward<Args>(args)...) <<"\n";
#endif
}

template<class... Args>
void app_error(const std::string_view string_format, Args&&... args)
{ 
#if defined(ENABLE_SPDLOG)
  auto l = spdlog::get("err_console");
  if(l) { 
    l->error(io::detail::format_message(string_format,std::forward<Args>(args)...));
    l->flush();
  } else
    APP_ABORT(" Error: app_error used uninitialized.");
#else
  std::cerr<<io::detail::format_message(string_format,std::forward<Args>(args)...) <<"\n";
#endif
}

template<class... Args>
void app_debug(int level, const std::string_view string_format, Args&&... args)
{ 
  if(__app_debug_level__ > 0 and level <= __app_debug_level__) {
#if defined(ENABLE_SPDLOG)
    auto l = spdlog::get("err_console");
    if(l)
      l->debug(io::detail::format_message(string_format,std::forward<Args>(args)...));
    else
      APP_ABORT(" Error: app_debug used uninitialized.");
#else
    std::cerr<<io::detail::format_message(string_format,std::forward<Args>(args)...) <<"\n";
#endif
  }
}

inline void app_log_flush() 
{
  if(__app_output_level__ > 0) {
#if defined(ENABLE_SPDLOG)
    auto l = spdlog::get("std_console");
    if(l)
      l->flush();
    else
      APP_ABORT(" Error: app_log used uninitialized.");
#else
    std::cout.flush();
#endif
  }
}

#endif
