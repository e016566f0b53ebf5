// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cerrno>
#include <cstdlib>
#include <string>
#include <vector>

#include <utils/string.hh>

namespace columnar {

std::vector< std::string >
split(const std::string &s, const std::string &delims)
{
    std::vector< std::string > xs;

    for (size_t first = 0, second; first < s.size(); first = second + 1) {
        second = s.find_first_of(delims, first);

        if (first != second)
            xs.emplace_back(s.substr(first, second - first));

        if (second == std::string::npos)
            break;
    }

    return xs;
}

std::optional< double > to_double(const std::string &s)
{
    if (s.empty())
        return { };

    char *end = nullptr;

    errno = 0;
    const double d = std::strtod(s.c_str(), &end);

    if (errno || end != s.c_str() + s.size())
        return { };

    return d;
}

std::optional< long > to_long(const std::string &s)
{
    if (s.empty())
        return { };

    char *end = nullptr;

    errno = 0;
    const long n = std::strtol(s.c_str(), &end, 10);

    if (errno || end != s.c_str() + s.size())
        return { };

    return n;
}

std::optional< bool > to_bool(const std::string &s)
{
    if (s == "yes" || s == "true" || s == "1")
        return true;

    if (s == "no" || s == "false" || s == "0")
        return false;

    return { };
}

} // namespace columnar
