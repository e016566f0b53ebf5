// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef COLUMNAR_COLUMNAR_YOVERLAP_HH
#define COLUMNAR_COLUMNAR_YOVERLAP_HH

#include <defs.hh>

#include <columnar/Control.hh>
#include <columnar/Word.hh>

namespace columnar {

//
// Mean vertical overlap over word pairs, each pair scored relative to the
// shorter of the two words. Words that sit side by side on the same baseline
// score high; a page of stacked lines scores low.
//
struct y_overlap_scorer_t {
    explicit y_overlap_scorer_t (const overlap_control_t&);

    double operator() (const words_t&) const;

    const overlap_control_t& control () const { return ctl; }

private:
    overlap_control_t ctl;
};

} // namespace columnar

#endif // COLUMNAR_COLUMNAR_YOVERLAP_HH
