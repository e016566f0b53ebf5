// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef COLUMNAR_COLUMNAR_LAYOUT_HH
#define COLUMNAR_COLUMNAR_LAYOUT_HH

#include <defs.hh>

#include <iosfwd>
#include <vector>

#include <columnar/Boundary.hh>
#include <columnar/GapSeparator.hh>
#include <columnar/GutterScanner.hh>

namespace columnar {

enum struct layout_type_t {
    single = 1, multi = 2, hybrid = 3
};

const char* to_string (layout_type_t);

std::ostream& operator<< (std::ostream&, layout_type_t);

//
// Which signal settled the column boundaries:
//
enum struct detection_method_t {
    none, gap, gutter, side_by_side
};

const char* to_string (detection_method_t);

std::ostream& operator<< (std::ostream&, detection_method_t);

struct layout_diagnostics_t {
    size_t word_count = 0;

    detection_method_t method = detection_method_t::none;

    gutter_metrics_t gutter;

    double valley_depth_ratio = 1;
    std::vector< size_t > peaks, valleys;

    double y_overlap = 0;

    size_t full_width_lines = 0;
    bool has_horizontal = false;

    //
    // Weighted score of the fallback path, 0 when it was not taken:
    //
    double score = 0;

    gap_tier_t gap_tier = gap_tier_t::none;
};

struct layout_t {
    layout_type_t type = layout_type_t::single;

    column_boundaries_t boundaries;

    double confidence = 0;
    double page_width = 0;

    layout_diagnostics_t diagnostics;

    size_t num_columns () const { return boundaries.size (); }

    const char* type_name () const { return to_string (type); }
};

using layouts_t = std::vector< layout_t >;

std::ostream& operator<< (std::ostream&, const layout_diagnostics_t&);
std::ostream& operator<< (std::ostream&, const layout_t&);

} // namespace columnar

#endif // COLUMNAR_COLUMNAR_LAYOUT_HH
