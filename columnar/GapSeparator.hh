// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef COLUMNAR_COLUMNAR_GAPSEPARATOR_HH
#define COLUMNAR_COLUMNAR_GAPSEPARATOR_HH

#include <defs.hh>

#include <iosfwd>
#include <vector>

#include <columnar/Boundary.hh>
#include <columnar/Control.hh>
#include <columnar/Word.hh>

namespace columnar {

//
// Threshold tiers, in the order they are tried:
//
enum struct gap_tier_t {
    none,       // no gaps at all
    aggressive, // one dominant gap, narrow columns likely
    uniform,    // evenly spaced text, noise must be ignored
    standard,   // neither of the above
    fixed,      // non-adaptive, the configured minimum gap
    fallback    // retry after the tiers above found nothing
};

const char* to_string (gap_tier_t);

std::ostream& operator<< (std::ostream&, gap_tier_t);

struct gap_statistics_t {
    size_t count = 0;
    double median = 0, p60 = 0, p75 = 0, p90 = 0, max = 0;
};

struct gap_analysis_t {
    gap_statistics_t stats;

    //
    // The tier that produced the separators, or the last one tried if none
    // did, and its threshold:
    //
    gap_tier_t tier = gap_tier_t::none;
    double threshold = 0;

    //
    // Separator positions before and after merging, and the resulting
    // column boundaries:
    //
    std::vector< double > separators, merged;
    column_boundaries_t boundaries;
};

//
// Positive gaps between the word intervals, sorted by left edge:
//
std::vector< double > gaps_of (const words_t&);

gap_statistics_t statistics_of (std::vector< double >);

struct gap_separator_t {
    explicit gap_separator_t (const gap_control_t&);

    gap_analysis_t analyze (const words_t&, double width) const;

    column_boundaries_t operator() (const words_t& words, double width) const {
        return analyze (words, width).boundaries;
    }

    const gap_control_t& control () const { return ctl; }

private:
    std::vector< double > merge (const std::vector< double >&) const;

    column_boundaries_t
    build (const std::vector< double >&, double width) const;

    gap_control_t ctl;
};

} // namespace columnar

#endif // COLUMNAR_COLUMNAR_GAPSEPARATOR_HH
