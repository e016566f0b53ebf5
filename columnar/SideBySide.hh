// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef COLUMNAR_COLUMNAR_SIDEBYSIDE_HH
#define COLUMNAR_COLUMNAR_SIDEBYSIDE_HH

#include <defs.hh>

#include <optional>

#include <columnar/Boundary.hh>
#include <columnar/Control.hh>
#include <columnar/Line.hh>

namespace columnar {

enum struct line_side_t { left, right, full };

struct side_by_side_t {
    size_t left = 0, right = 0, full = 0;

    //
    // Vertical overlap of the left and right line ranges, as a fraction of
    // their union, and the fraction of lines that belong to either column:
    //
    double overlap = 0, column_ratio = 0;

    //
    // Position of the split between the two columns, if any:
    //
    std::optional< double > split;
};

//
// Partition of the page into a left and a right column, found by sorting the
// lines into those that start left of the middle, those that start right of
// it, and those that run across it. Two columns are reported only when both
// sides hold enough lines running side by side.
//
struct side_by_side_partitioner_t {
    explicit side_by_side_partitioner_t (const line_control_t&);

    line_side_t side_of (const line_t&, double width) const;

    side_by_side_t analyze (const lines_t&, size_t words, double width) const;

    std::optional< column_boundaries_t >
    operator() (const words_t&, double width) const;

private:
    line_control_t ctl;
};

} // namespace columnar

#endif // COLUMNAR_COLUMNAR_SIDEBYSIDE_HH
