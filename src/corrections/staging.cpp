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



#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "fmt/format.h"
#include "IO/app_loggers.h"
#include "utilities/check.hpp"
#include "corrections/staging.h"

namespace corrections
{

namespace fs = std::filesystem;

std::string potfile_name(std::string const& potential_filename, std::string const& symbol)
{
  std::string up(potential_filename), low(symbol);
  std::transform(up.begin(), up.end(), up.begin(), [](unsigned char c){ return std::toupper(c); });
  std::transform(low.begin(), low.end(), low.begin(), [](unsigned char c){ return std::tolower(c); });
  return fmt::format("{}.{}", up, low);
}

void reset_directory(fs::path const& dir)
{
  fs::remove_all(dir);
  fs::create_directories(dir);
}

void stage_potfiles(fs::path const& source, fs::path const& dest,
                    std::vector<std::string> const& atoms, std::string const& potential_filename)
{
  reset_directory(dest);
  for(auto const& atom : atoms) {
    auto name = potfile_name(potential_filename, atom);
    utils::check<utils::missing_artifact_error>(fs::exists(source / name),
        "stage_potfiles: Potential file {} not found in {}", name, source.string());
    fs::copy_file(source / name, dest / name, fs::copy_options::overwrite_existing);
  }
  app_log(3, "  Staged potential files of {} atoms in {}", atoms.size(), dest.string());
}

void join_potfiles(fs::path const& target, fs::path const& potfiles_folder,
                   std::vector<std::string> const& atoms, std::string const& potential_filename)
{
  std::ofstream out(target, std::ios::binary | std::ios::trunc);
  utils::check(out.is_open(), "join_potfiles: Could not open {} for writing", target.string());
  for(auto const& atom : atoms) {
    auto path = potfiles_folder / potfile_name(potential_filename, atom);
    std::ifstream in(path, std::ios::binary);
    utils::check<utils::missing_artifact_error>(in.is_open(),
        "join_potfiles: Potential file not found: {}", path.string());
    if(in.peek() != std::ifstream::traits_type::eof())
      out << in.rdbuf();
  }
  utils::check(out.good(), "join_potfiles: Error writing {}", target.string());
}

void copy_input_files(fs::path const& from, fs::path const& to, std::vector<std::string> const& files)
{
  for(auto const& f : files) {
    utils::check<utils::missing_artifact_error>(fs::exists(from / f),
        "copy_input_files: Input file {} not found in {}", f, from.string());
    fs::copy_file(from / f, to / f, fs::copy_options::overwrite_existing);
  }
}

}
