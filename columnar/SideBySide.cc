// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <limits>

#include <columnar/Error.hh>
#include <columnar/SideBySide.hh>

namespace columnar {

//
// Line classification relative to the middle of the page:
//
#define leftStartMax  0.6
#define leftEndMax    1.3
#define rightStartMin 0.7

//
// Minimum number of words and lines for a partition to be attempted, and of
// lines on either side for one to be reported:
//
#define sideMinWords 10
#define sideMinLines 3
#define sideMinSideLines 3

//
// Minimum overlap of the two sides, and the column ratio required for strong,
// moderate, and weak overlaps:
//
#define sideMinOverlap 0.2
#define sideStrongOverlap 0.6
#define sideModerateOverlap 0.4

#define sideStrongColumnRatio 0.35
#define sideModerateColumnRatio 0.40
#define sideWeakColumnRatio 0.45

//
// The split must fall strictly inside this margin of the page width:
//
#define sideSplitMargin 0.1

side_by_side_partitioner_t::side_by_side_partitioner_t (
    const line_control_t& arg) : ctl (arg) {
    validate (ctl);
}

line_side_t
side_by_side_partitioner_t::side_of (const line_t& line, double width) const {
    const auto mid = width / 2;

    if (line.span () > width * ctl.full_width_fraction) {
        return line_side_t::full;
    }

    if (line.x0 () < mid * leftStartMax) {
        return line.x1 () < mid * leftEndMax
            ? line_side_t::left : line_side_t::full;
    }

    if (line.x0 () > mid * rightStartMin) {
        return line_side_t::right;
    }

    return line_side_t::full;
}

side_by_side_t
side_by_side_partitioner_t::analyze (
    const lines_t& lines, size_t words, double width) const {
    side_by_side_t result;

    if (words < sideMinWords || lines.size () < sideMinLines) {
        return result;
    }

    constexpr auto inf = std::numeric_limits< double >::infinity ();

    double left_top = inf, left_bottom = -inf, left_x1 = -inf;
    double right_top = inf, right_bottom = -inf, right_x0 = inf;

    for (auto& line : lines) {
        switch (side_of (line, width)) {
        case line_side_t::left:
            ++result.left;
            left_top = (std::min) (left_top, line.center);
            left_bottom = (std::max) (left_bottom, line.center);
            left_x1 = (std::max) (left_x1, line.x1 ());
            break;

        case line_side_t::right:
            ++result.right;
            right_top = (std::min) (right_top, line.center);
            right_bottom = (std::max) (right_bottom, line.center);
            right_x0 = (std::min) (right_x0, line.x0 ());
            break;

        case line_side_t::full:
            ++result.full;
            break;
        }
    }

    if (result.left < sideMinSideLines || result.right < sideMinSideLines) {
        return result;
    }

    const auto shared =
        (std::min) (left_bottom, right_bottom) - (std::max) (left_top, right_top);

    const auto total =
        (std::max) (left_bottom, right_bottom) - (std::min) (left_top, right_top);

    result.overlap = shared >= 0 && total > 0 ? shared / total : 0.;

    result.column_ratio =
        double (result.left + result.right) / lines.size ();

    const auto required = result.overlap > sideStrongOverlap
        ? sideStrongColumnRatio
        : result.overlap > sideModerateOverlap
            ? sideModerateColumnRatio : sideWeakColumnRatio;

    if (result.overlap <= sideMinOverlap || result.column_ratio <= required) {
        error (errDebug,
               "side by side: overlap={:.2f}, column ratio={:.2f}, rejected",
               result.overlap, result.column_ratio);
        return result;
    }

    const auto split = (left_x1 + right_x0) / 2;

    if (split <= width * sideSplitMargin ||
        split >= width * (1 - sideSplitMargin)) {
        error (errDebug, "side by side: split at {:.1f} too close to the edge",
               split);
        return result;
    }

    result.split = split;

    return result;
}

std::optional< column_boundaries_t >
side_by_side_partitioner_t::operator() (
    const words_t& words, double width) const {
    const auto result = analyze (
        group_lines (words, ctl.y_tolerance), words.size (), width);

    if (!result.split) {
        return { };
    }

    return column_boundaries_t{ { 0., *result.split }, { *result.split, width } };
}

} // namespace columnar
