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



#ifndef IO_PTREE_UTILITIES_HPP 
#define IO_PTREE_UTILITIES_HPP 
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <boost/property_tree/ptree.hpp>
#include <boost/optional.hpp>
#include "utilities/check.hpp"

using boost::property_tree::ptree;

namespace io
{

// Flattens an xml tree: attributes become children, <parameter name="x">v</parameter> becomes x = v.
inline ptree convert_xml(const ptree& pt0)
{
  ptree pt1;
  for(auto& it : pt0)
  {
    std::string cname = it.first;
    ptree child = it.second;
    if (cname == "<xmlattr>"){ // promote to child
      for(auto& it1 : child)
        pt1.put(it1.first, it1.second.get_value<std::string>());
    } else if (cname == "<xmlcomment>") { // ignore
    } else if (cname == "parameter") { // rename child by attribute "name"
      std::string pname = child.get<std::string>("<xmlattr>.name");
      pt1.put(pname, child.get_value<std::string>());
    } else if (child.size() < 1) {
      pt1.put(cname, child.get_value<std::string>());
    } else { // recurse
      ptree pt2 = convert_xml(child);
      if( auto str = child.get_value_optional<std::string>() )
        pt2.put_value(*str);	
      pt1.add_child(cname, pt2);
    }
  }
  return pt1;
}

/* -------------------------------- utilities ------------------------------- */
inline void str_rep(std::ostream &out, ptree const& pt, int indent=0) 
{
  for(auto& it : pt)
  {
    for (int ii=0; ii<indent; ii++) out << "  ";
    out << it.first << ": " << it.second.get_value<std::string>() << std::endl;
    str_rep(out, it.second, indent+1);
  }
}

inline std::string tolower_copy(std::string const& s_)
{
  std::string s(s_);
  std::transform(s.begin(), s.end(), s.begin(),
    [](unsigned char c){ return std::tolower(c); });
  return s;
}

inline std::string get_file_extension(const std::string &s)
{
  size_t i = s.rfind('.', s.length());
  if (i == std::string::npos) return "";
  return tolower_copy(s.substr(i+1, s.length() - i));
}

inline std::string to_string(ptree const& pt)
{  
  std::stringstream ss;
  str_rep(ss, pt);
  return ss.str();
}

/*
 * Accessors. A node that exists but can not be converted is an input error and throws
 * utils::validation_error naming the option, it is never replaced by the default.
 */
template<typename T>
inline T get_value(ptree const& pt, const std::string id, const std::string message="")
{
  auto node = pt.get_child_optional(id);
  utils::check<utils::validation_error>(bool(node), "io::get_value({}) - Missing node. {}", id, message);
  auto v = node->get_value_optional<T>();
  utils::check<utils::validation_error>(bool(v), "io::get_value({}) - Can not extract value from node: '{}'. {}",
                                        id, node->get_value<std::string>(), message);
  return *v;
};

template<typename T>
inline T get_value_with_default(ptree const& pt, const std::string id, const T def) 
{
  auto node = pt.get_child_optional(id);
  if(not node) return def;
  auto v = node->get_value_optional<T>();
  utils::check<utils::validation_error>(bool(v), "io::get_value({}) - Can not extract value from node: '{}'",
                                        id, node->get_value<std::string>());
  return *v;
};

template<typename T>
inline std::vector<T> get_array_with_default(ptree const& pt, const std::string id, std::vector<T> const def) 
{
  auto node = pt.get_child_optional(id);
  if(not node) return def;
  std::vector<T> arr;
  // all children must be nameless and convertible to T
  for(auto const& it : *node)
  { 
    utils::check<utils::validation_error>(it.first == "",
        "io::get_array_with_default({}) - Found named node ({}), this is not an array", id, it.first);
    auto v = it.second.get_value_optional<T>();
    utils::check<utils::validation_error>(bool(v),
        "io::get_array_with_default({}) - Problems converting value: '{}'", id, it.second.get_value<std::string>());
    arr.emplace_back(*v);
  }
  return arr;
};

} // io

inline std::ostream& operator<<(std::ostream &out, const ptree &pt)
{
  io::str_rep(out, pt);
  return out;
}

#endif
