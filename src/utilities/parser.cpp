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
#include <sstream>
#include <fstream>
#include <vector>
#include <algorithm>
#include <cctype>

#include "utilities/parser.h"
#include "utilities/check.hpp"

namespace utils
{

std::vector<std::string> split(std::string const& str, std::string const& delim)
{
  std::vector<std::string> w;
  auto beg = str.find_first_not_of(delim);
  while(beg != std::string::npos) {
    auto end=str.find_first_of(delim, beg+1);
    if(end == std::string::npos) {
      w.emplace_back(str.substr(beg,str.size()-beg)); 
      break;
    }
    w.emplace_back(str.substr(beg,end-beg)); 
    beg = str.find_first_not_of(delim,end+1);
  }  
  return w;
}

std::string trim(std::string const& str)
{
  auto beg = str.find_first_not_of(" \t\r\n");
  if(beg == std::string::npos) return std::string{};
  auto end = str.find_last_not_of(" \t\r\n");
  return str.substr(beg, end-beg+1);
}

std::vector<std::string> read_lines(std::string const& filename)
{
  std::ifstream in(filename);
  check<missing_artifact_error>(in.is_open(), "read_lines: Could not open file: {}", filename);
  std::vector<std::string> lines;
  std::string line;
  while(std::getline(in, line)) {
    if(not line.empty() and line.back() == '\r') line.pop_back();
    lines.emplace_back(std::move(line));
  }
  return lines;
}

void write_lines(std::string const& filename, std::vector<std::string> const& lines)
{
  std::ofstream out(filename);
  check(out.is_open(), "write_lines: Could not open file for writing: {}", filename);
  for(auto const& l : lines)
    out << l << "\n";
  check(out.good(), "write_lines: Error writing file: {}", filename);
}

std::vector<std::string> drop_comments(std::vector<std::string> const& lines)
{
  std::vector<std::string> res;
  res.reserve(lines.size());
  std::copy_if(lines.begin(), lines.end(), std::back_inserter(res),
               [](auto const& l) { auto t = trim(l); return t.empty() or t[0] != '#'; });
  return res;
}

bool is_numeric_line(std::string const& line)
{
  auto tokens = split(line);
  if(tokens.empty()) return false;
  for(auto const& t : tokens) {
    std::size_t pos = 0;
    try {
      std::stod(t, &pos);
    } catch(std::exception const&) {
      return false;
    }
    if(pos != t.size()) return false;
  }
  return true;
}

template<typename T>
std::vector<T> str2vec(std::string const& s)
{
  std::stringstream ss(s);
  T val;
  std::vector<T> vec;
  while (ss>>val) vec.push_back(val);
  return vec;
}

template std::vector<double> str2vec<double>(std::string const&);
template std::vector<int> str2vec<int>(std::string const&);
template std::vector<long> str2vec<long>(std::string const&);

}
