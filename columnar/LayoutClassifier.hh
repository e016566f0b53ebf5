// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef COLUMNAR_COLUMNAR_LAYOUTCLASSIFIER_HH
#define COLUMNAR_COLUMNAR_LAYOUTCLASSIFIER_HH

#include <defs.hh>

#include <optional>

#include <columnar/Control.hh>
#include <columnar/DensityHistogram.hh>
#include <columnar/GapSeparator.hh>
#include <columnar/GutterScanner.hh>
#include <columnar/Layout.hh>
#include <columnar/Line.hh>
#include <columnar/Page.hh>
#include <columnar/SideBySide.hh>
#include <columnar/YOverlap.hh>

namespace columnar {

//
// Classification of a page as single-column, multi-column, or hybrid:
//
//   1. a page without column gaps is single-column;
//   2. a page with a gutter clear over most of its height is multi-column,
//      hybrid if full-width lines or a header interrupt it;
//   3. otherwise the density valleys, the vertical overlap of words, and the
//      full-width lines are weighed against each other, the columns being
//      those of a side by side partition of the lines. A page without such a
//      partition is single-column.
//
// The classifier holds no state besides its settings and may be shared
// between threads.
//
struct layout_classifier_t {
    explicit layout_classifier_t (const layout_control_t& = { });

    layout_t operator() (const page_t&) const;

    layout_t operator() (
        const words_t& words, std::optional< double > width = { },
        std::optional< double > height = { }) const {
        return (*this) (page_t{ words, width, height });
    }

    const layout_control_t& control () const { return ctl; }

private:
    layout_t default_layout (const page_t&, const char*) const;

    layout_t weigh_signals (
        const words_t&, const lines_t&, double width, layout_t) const;

    layout_control_t ctl;

    gap_separator_t gaps;
    density_analyzer_t density;
    gutter_scanner_t gutter;
    y_overlap_scorer_t overlap;
    full_width_detector_t full_width;
    side_by_side_partitioner_t side_by_side;
};

} // namespace columnar

#endif // COLUMNAR_COLUMNAR_LAYOUTCLASSIFIER_HH
