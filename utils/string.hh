// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef COLUMNAR_UTILS_STRING_HH
#define COLUMNAR_UTILS_STRING_HH

#include <defs.hh>

#include <optional>
#include <string>
#include <vector>

namespace columnar {

std::vector< std::string >
split(const std::string &s, const std::string &delims = " \t\r\n");

//
// The whole of the string must be a number, otherwise the result is empty:
//
std::optional< double > to_double(const std::string &s);
std::optional< long > to_long(const std::string &s);

std::optional< bool > to_bool(const std::string &s);

} // namespace columnar

#endif // COLUMNAR_UTILS_STRING_HH
