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



#ifndef CORRECTIONS_STAGING_H
#define CORRECTIONS_STAGING_H

#include <filesystem>
#include <string>
#include <vector>

namespace corrections
{

// "POTCAR", "Ga" -> "POTCAR.ga"
std::string potfile_name(std::string const& potential_filename, std::string const& symbol);

// Removes dir if it exists and creates it empty.
void reset_directory(std::filesystem::path const& dir);

/*
 * Creates dest empty and copies the potential file of every atom from source.
 * Throws utils::missing_artifact_error if one of them is missing.
 */
void stage_potfiles(std::filesystem::path const& source, std::filesystem::path const& dest,
                    std::vector<std::string> const& atoms, std::string const& potential_filename);

// Concatenates the potential files of the atoms, in order, into target.
void join_potfiles(std::filesystem::path const& target, std::filesystem::path const& potfiles_folder,
                   std::vector<std::string> const& atoms, std::string const& potential_filename);

// Copies the named files from one directory to another, missing files raise utils::missing_artifact_error.
void copy_input_files(std::filesystem::path const& from, std::filesystem::path const& to,
                      std::vector<std::string> const& files);

}

#endif
