// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef COLUMNAR_COLUMNAR_LAYOUTFEATURES_HH
#define COLUMNAR_COLUMNAR_LAYOUTFEATURES_HH

#include <defs.hh>

#include <array>
#include <iosfwd>

#include <columnar/Control.hh>
#include <columnar/DensityHistogram.hh>
#include <columnar/GutterScanner.hh>
#include <columnar/Line.hh>
#include <columnar/Page.hh>
#include <columnar/YOverlap.hh>

namespace columnar {

//
// Numeric description of a page layout, for labeling and inspection:
//
struct layout_features_t {
    size_t num_columns = 1;

    double mean_y_overlap = 0;
    double coverage_gutter = 0;
    double full_width_line_ratio = 0;
    double valley_depth_ratio = 1;

    size_t horizontal_lines_count = 0;

    double header_fraction = 0;
    double avg_word_width_ratio = 0;
    double line_density_variance = 0;

    static constexpr size_t size = 9;

    //
    // Feature values, in declaration order, and their names:
    //
    std::array< double, size > values () const;
    static const std::array< const char*, size >& names ();
};

std::ostream& operator<< (std::ostream&, const layout_features_t&);

struct feature_extractor_t {
    explicit feature_extractor_t (const layout_control_t& = { });

    layout_features_t operator() (const page_t&) const;

private:
    layout_control_t ctl;

    density_analyzer_t density;
    gutter_scanner_t gutter;
    y_overlap_scorer_t overlap;
    full_width_detector_t full_width;
};

} // namespace columnar

#endif // COLUMNAR_COLUMNAR_LAYOUTFEATURES_HH
