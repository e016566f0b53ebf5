// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <iostream>

#include <columnar/Layout.hh>

namespace columnar {

const char* to_string (layout_type_t type) {
    switch (type) {
    case layout_type_t::single: return "single-column";
    case layout_type_t::multi:  return "multi-column";
    case layout_type_t::hybrid: return "hybrid/complex";
    }

    return "unknown";
}

std::ostream& operator<< (std::ostream& ss, layout_type_t type) {
    return ss << to_string (type);
}

const char* to_string (detection_method_t method) {
    switch (method) {
    case detection_method_t::none:         return "none";
    case detection_method_t::gap:          return "gap";
    case detection_method_t::gutter:       return "gutter";
    case detection_method_t::side_by_side: return "side-by-side";
    }

    return "unknown";
}

std::ostream& operator<< (std::ostream& ss, detection_method_t method) {
    return ss << to_string (method);
}

namespace {

std::ostream&
operator<< (std::ostream& ss, const std::vector< size_t >& xs) {
    ss << "[";

    for (size_t i = 0; i < xs.size (); ++i) {
        ss << (i ? "," : "") << xs [i];
    }

    return ss << "]";
}

} // anonymous namespace

std::ostream& operator<< (std::ostream& ss, const layout_diagnostics_t& x) {
    return ss
        << "words: " << x.word_count
        << ", method: " << x.method
        << ", gutter: " << x.gutter
        << ", valley depth: " << x.valley_depth_ratio
        << ", peaks: " << x.peaks
        << ", valleys: " << x.valleys
        << ", y-overlap: " << x.y_overlap
        << ", full-width lines: " << x.full_width_lines
        << ", score: " << x.score
        << ", gap tier: " << x.gap_tier;
}

std::ostream& operator<< (std::ostream& ss, const layout_t& x) {
    return ss
        << "type " << int (x.type) << " (" << x.type_name () << "), "
        << x.num_columns () << " column(s) " << x.boundaries
        << ", confidence " << x.confidence
        << ", width " << x.page_width;
}

} // namespace columnar
