// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef COLUMNAR_COLUMNAR_CONTROL_HH
#define COLUMNAR_COLUMNAR_CONTROL_HH

#include <defs.hh>

#include <cstddef>
#include <iosfwd>

#include <columnar/LayoutDefs.hh>

namespace columnar {

enum struct smoothing_t {
    moving_average, gaussian
};

struct gap_control_t {
    double min_gap_width = minGapWidth;
    double min_column_width = minColumnWidth;

    //
    // Derive the gap threshold from the gap statistics of the page; when
    // false, min_gap_width is the threshold:
    //
    bool adaptive = true;

    //
    // Width reported for pages without words or with an unusable width:
    //
    double default_page_width = COLUMNAR_PAPER_WIDTH;
};

struct histogram_control_t {
    //
    // Number of bins; 0 selects max{ minDensityBins, width / 2 }:
    //
    size_t bin_count = 0;

    smoothing_t smoothing = smoothing_t::moving_average;

    size_t smoothing_window = densitySmoothingWindow;
    double gaussian_sigma = densityGaussianSigma;

    double peak_threshold_multi = peakThresholdMulti;
    double peak_threshold_single = peakThresholdSingle;
};

struct gutter_control_t {
    size_t band_count = gutterBandCount;
    size_t density_bins = gutterDensityBins;
    size_t smoothing_window = gutterSmoothingWindow;

    double gutter_zero_max = gutterZeroMax;

    size_t probe_half_width = gutterProbeHalfWidth;

    //
    // Number of consecutive clear bands that mark the start of the columns;
    // 0 selects max{ 4, band_count / 12 }:
    //
    size_t stable_run = 0;
};

struct overlap_control_t {
    size_t max_pairs = overlapMaxPairs;
    size_t sample_size = overlapSampleSize;
    unsigned seed = overlapSampleSeed;
};

struct line_control_t {
    double y_tolerance = lineYTolerance;
    double full_width_fraction = fullWidthFraction;
    size_t horizontal_lines_min = horizontalLinesMin;
};

struct classifier_control_t {
    double coverage_min = coverageMin;

    //
    // A strong gutter that starts below this fraction of the page height sits
    // under a full-width header. The cutoff coincides with values that occur
    // often in practice and wants checking against labeled pages:
    //
    double header_frac_max = headerFracMax;

    double valley_threshold = valleyThreshold;

    double valley_weight = valleyWeight;
    double overlap_weight = overlapWeight;
    double horizontal_weight = horizontalWeight;

    double overlap_scale = overlapScale;
    double hybrid_score_min = hybridScoreMin;

    double single_confidence = singleConfidence;
    double gutter_confidence = gutterConfidence;
    double fallback_confidence = fallbackConfidence;
};

struct segment_control_t {
    double overlap_threshold = columnOverlapThreshold;
    size_t min_words_per_column = minWordsPerColumn;
};

struct layout_control_t {
    gap_control_t gap;
    histogram_control_t histogram;
    gutter_control_t gutter;
    overlap_control_t overlap;
    line_control_t line;
    classifier_control_t classifier;
    segment_control_t segment;

    double page_margin = pageExtentMargin;
};

//
// Range checks; each throws configuration_error naming the offending
// setting:
//
void validate (const gap_control_t&);
void validate (const histogram_control_t&);
void validate (const gutter_control_t&);
void validate (const overlap_control_t&);
void validate (const line_control_t&);
void validate (const classifier_control_t&);
void validate (const segment_control_t&);
void validate (const layout_control_t&);

//
// Read settings from a stream of `name value' lines, e.g.:
//
//   # narrow sidebars
//   minColumnWidth   60
//   smoothing        gaussian
//
// Unknown names and malformed values are reported and skipped. The settings
// read are validated as a whole once the stream is exhausted:
//
void parse_control (std::istream&, layout_control_t&);

} // namespace columnar

#endif // COLUMNAR_COLUMNAR_CONTROL_HH
