// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <columnar/Boundary.hh>

namespace columnar {

bool is_partition (const column_boundaries_t& xs, double width) {
    if (xs.empty () || xs.front ().x0 != 0 || xs.back ().x1 != width) {
        return false;
    }

    for (size_t i = 0; i < xs.size (); ++i) {
        if (!(xs [i].x0 < xs [i].x1)) {
            return false;
        }

        if (i + 1 < xs.size () && xs [i].x1 != xs [i + 1].x0) {
            return false;
        }
    }

    return true;
}

std::ostream& operator<< (std::ostream& ss, const column_boundaries_t& xs) {
    const char* sep = "";

    for (auto& x : xs) {
        ss << sep << x;
        sep = " ";
    }

    return ss;
}

} // namespace columnar
