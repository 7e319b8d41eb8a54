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

#if defined(ENABLE_SPDLOG)
#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#endif

int __app_debug_level__  = -10000; 
int __app_output_level__ = -10000; 

namespace
{

#if defined(ENABLE_SPDLOG)
void make_console(std::string const& name, std::string const& pattern)
{
  if(not spdlog::get(name)) {
    auto console = spdlog::stdout_color_mt(name);
    console->set_pattern(pattern);
  }
}
#endif

}

void setup_loggers(int output_level, int debug_level)
{
  __app_output_level__ = output_level;
  __app_debug_level__ = debug_level;
#if defined(ENABLE_SPDLOG)
  make_console("std_console", "%v");
  make_console("warn_console", "%^[%l]%$ %v");
  spdlog::get("warn_console")->set_level(spdlog::level::warn);
  make_console("err_console", "%^[%l]%$ %v");
  if(debug_level > 0)
    spdlog::get("err_console")->set_level(spdlog::level::debug);
#endif
}

void set_debug_level(int debug_level)
{
  __app_debug_level__ = debug_level;
#if defined(ENABLE_SPDLOG)
  if(debug_level > 0) {  
    make_console("err_console", "%^[%l]%$ %v");
    spdlog::get("err_console")->set_level(spdlog::level::debug);
  }
#endif
}

void set_output_level(int output_level)
{
  __app_output_level__ = output_level;
#if defined(ENABLE_SPDLOG)
  make_console("std_console", "%v");
#endif
}
