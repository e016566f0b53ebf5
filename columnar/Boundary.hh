// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef COLUMNAR_COLUMNAR_BOUNDARY_HH
#define COLUMNAR_COLUMNAR_BOUNDARY_HH

#include <defs.hh>

#include <iostream>
#include <vector>

namespace columnar {

//
// Horizontal extent [x0, x1) of a column:
//
struct column_boundary_t {
    double x0, x1;
};

using column_boundaries_t = std::vector< column_boundary_t >;

inline bool
operator== (const column_boundary_t& lhs, const column_boundary_t& rhs) {
    return lhs.x0 == rhs.x0 && lhs.x1 == rhs.x1;
}

inline bool
operator!= (const column_boundary_t& lhs, const column_boundary_t& rhs) {
    return !(lhs == rhs);
}

inline std::ostream&
operator<< (std::ostream& ss, const column_boundary_t& x) {
    return ss << "[" << x.x0 << "," << x.x1 << ")";
}

inline double width_of (const column_boundary_t& x) { return x.x1 - x.x0; }

inline double center_of (const column_boundary_t& x) {
    return (x.x0 + x.x1) * .5;
}

inline column_boundaries_t whole_page (double width) {
    return { { 0., width } };
}

//
// True if the boundaries cover [0, width) left to right, without gaps,
// overlaps, or empty columns:
//
bool is_partition (const column_boundaries_t&, double width);

std::ostream& operator<< (std::ostream&, const column_boundaries_t&);

} // namespace columnar

#endif // COLUMNAR_COLUMNAR_BOUNDARY_HH
