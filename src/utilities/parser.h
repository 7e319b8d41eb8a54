#ifndef UTILITIES_PARSER_H
#define UTILITIES_PARSER_H

#include <string>
#include <vector>

namespace utils
{

std::vector<std::string> split(std::string const&, std::string const& delim = " \t\r\n");

// strips leading and trailing whitespace
std::string trim(std::string const&);

// all lines of a file, without the trailing newline. Throws missing_artifact_error if the file can not be opened.
std::vector<std::string> read_lines(std::string const& filename);

// writes lines, each terminated by a newline
void write_lines(std::string const& filename, std::vector<std::string> const& lines);

// removes lines whose first non-blank character is '#'
std::vector<std::string> drop_comments(std::vector<std::string> const& lines);

// true if every token of the line converts to a number
bool is_numeric_line(std::string const& line);

template<typename T>
std::vector<T> str2vec(std::string const& s);

}

#endif
