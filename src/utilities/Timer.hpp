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



#ifndef UTILITIES_TIMER_MANAGER_HPP
#define UTILITIES_TIMER_MANAGER_HPP

#include <chrono>
#include <map>
#include <vector>
#include <string>
#include "IO/app_loggers.h"
#include "utilities/check.hpp"

namespace utils
{

// simple clock, accumulates the time between start/stop pairs
struct Watch : private std::chrono::steady_clock{
  std::string name;
  time_point  start_;
  int ncalls = 0;
  double total_time = 0.0;
  Watch(std::string name_ = "") : name(name_), start_{now()} {}
  ~Watch() = default;
  void start() { start_=now(); }
  void stop() { 
    total_time += std::chrono::duration<double>(now() - start_).count();
    ncalls++;
  } 
  double elapsed() const { return total_time; }
  double average() const { return (ncalls > 0 ? total_time/double(ncalls) : 0.0); }
  int number_of_calls() const { return ncalls; }
  void reset() {
    total_time = 0.0;
    ncalls = 0;
  }
};

// very simple flat timer, used to account for the time spent in the external programs
class TimerManager
{
private:
  std::vector<Watch> timers;
  std::map<std::string, int> id2pos;

  int getOrAdd(std::string const& str)
  {
    auto it = id2pos.find(str);
    if (it != id2pos.end())
      return it->second;
    timers.emplace_back(Watch(str));
    int n = timers.size() - 1;
    id2pos[str] = n;
    return n;
  }

  int getPos(std::string const& str) const
  {
    auto it = id2pos.find(str);
    utils::check(it != id2pos.end(), "TimerManager: Unregistered timer {}", str);
    return it->second;
  } 

public:
  TimerManager() = default;

  void start(const std::string& str) { timers[ getOrAdd(str) ].start(); }

  void stop(const std::string& str) { timers[ getPos(str) ].stop(); }

  double elapsed(const std::string& str) const { return timers[ getPos(str) ].elapsed(); }

  int number_of_calls(const std::string& str) const { return timers[ getPos(str) ].number_of_calls(); }

  void reset()
  {
    for (auto& t : timers) t.reset();
  }

  void print_all() const
  {
    app_log(2,"***************************************************************************");
    app_log(2, "{:>30}:{:>16}{:>16}{:>9}", "Timer Name", "Elapsed (s)", "Averaged (s)", 
							"# calls");
    app_log(2,"***************************************************************************");
    for (auto& t : timers) 
      app_log(2, "{:>30}:{:16.8g}{:16.8g}{:9d}", t.name, t.elapsed(),
						   t.average(), t.number_of_calls());
    app_log(2,"***************************************************************************");
    app_log_flush();
  }
};

}

#endif
