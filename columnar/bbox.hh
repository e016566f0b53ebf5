// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef COLUMNAR_COLUMNAR_BBOX_HH
#define COLUMNAR_COLUMNAR_BBOX_HH

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <type_traits>

namespace columnar {
namespace detail {

//
// Bounding box, described by 4 coordinates of two corners, `top-left' and
// `bottom-right', with (0,0) at the top-left of the page and y growing
// downwards:
//
template< typename T >
struct bbox_t {
    using value_type = T;

    value_type arr [4];
};

template< typename T >
inline bool
operator== (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    return std::equal (
        lhs.arr, lhs.arr + sizeof lhs.arr / sizeof *lhs.arr, rhs.arr);
}

template< typename T >
inline bool
operator!= (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    return !(lhs == rhs);
}

template< typename T >
inline std::ostream&
operator<< (std::ostream& ss, const bbox_t< T >& box) {
    return ss
        << box.arr [0] << ","
        << box.arr [1] << ","
        << box.arr [2] << ","
        << box.arr [3];
}

////////////////////////////////////////////////////////////////////////

template< typename T >
inline bbox_t< T >
normalize (bbox_t< T > x) {
    if (x.arr [0] > x.arr [2]) { std::swap (x.arr [0], x.arr [2]); }
    if (x.arr [1] > x.arr [3]) { std::swap (x.arr [1], x.arr [3]); }
    return x;
}

template< typename T >
inline T width_of (const bbox_t< T >& x) { return x.arr [2] - x.arr [0]; }

template< typename T >
inline T height_of (const bbox_t< T >& x) { return x.arr [3] - x.arr [1]; }

template< typename T >
inline double x_center_of (const bbox_t< T >& x) {
    return (x.arr [0] + x.arr [2]) * .5;
}

template< typename T >
inline double y_center_of (const bbox_t< T >& x) {
    return (x.arr [1] + x.arr [3]) * .5;
}

template< typename T >
inline T
vertical_overlap (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    const auto dist =
        (std::min) (lhs.arr [3], rhs.arr [3]) -
        (std::max) (lhs.arr [1], rhs.arr [1]);
    return dist > 0 ? dist : 0;
}

template< typename T >
inline T
min_height_of (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    return (std::min) (height_of (lhs), height_of (rhs));
}

template< typename T >
inline bbox_t< T >
coalesce (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    return bbox_t< T >{
        (std::min) (lhs.arr [0], rhs.arr [0]),
        (std::min) (lhs.arr [1], rhs.arr [1]),
        (std::max) (lhs.arr [2], rhs.arr [2]),
        (std::max) (lhs.arr [3], rhs.arr [3])
    };
}

//
// Fraction of the shorter box height shared by both boxes; boxes without
// height share nothing:
//
template< typename T >
inline double
vertical_overlap_ratio (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    const double h = min_height_of (lhs, rhs);
    return h > 0 ? vertical_overlap (lhs, rhs) / h : 0.;
}

//
// Fraction of the box width that falls inside [x0, x1). A box of zero width
// is either wholly inside or wholly outside:
//
template< typename T >
inline double
horizontal_coverage (const bbox_t< T >& box, double x0, double x1) {
    const double w = width_of (box);

    if (w <= 0) {
        return x0 <= box.arr [0] && box.arr [0] < x1 ? 1. : 0.;
    }

    const double dist =
        (std::min) (double (box.arr [2]), x1) -
        (std::max) (double (box.arr [0]), x0);

    return dist > 0 ? dist / w : 0.;
}

} // namespace detail

////////////////////////////////////////////////////////////////////////

//
// The default bounding box type is the floating point specialization for
// double:
//
using bbox_t = detail::bbox_t< double >;

template< typename T >
using enable_if_floating_point = std::enable_if< std::is_floating_point_v< T > >;

template< typename T >
using enable_if_floating_point_t = typename enable_if_floating_point< T >::type;

template< typename T, enable_if_floating_point_t< T >* = nullptr >
inline bool
finite (const detail::bbox_t< T >& x) {
    const auto& [ a, b, c, d ] = x.arr;
    return
        std::isfinite (a) && std::isfinite (b) &&
        std::isfinite (c) && std::isfinite (d);
}

} // namespace columnar

#endif // COLUMNAR_COLUMNAR_BBOX_HH
