// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <optional>
#include <utility>

#include <columnar/Error.hh>
#include <columnar/LayoutClassifier.hh>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/transform.hpp>
using namespace ranges;

namespace columnar {
namespace {

const layout_control_t& validated (const layout_control_t& ctl) {
    validate (ctl);
    return ctl;
}

inline double clamped (double x) {
    return (std::min) (1., (std::max) (0., x));
}

std::vector< size_t > positions_of (const std::vector< valley_t >& xs) {
    std::vector< size_t > ys;
    ys.reserve (xs.size ());

    transform (xs, std::back_inserter (ys), &valley_t::pos);

    return ys;
}

//
// The gap separator closest to the gutter center, unless a word stands
// between the two; the center of the gutter bin otherwise:
//
double split_at (const words_t& words, const column_boundaries_t& xs,
                 double gutter_x, double width, const gutter_control_t& ctl) {
    const auto center = gutter_x + width / ctl.density_bins / 2;

    std::optional< double > split;

    for (size_t i = 1; i < xs.size (); ++i) {
        const auto x = xs [i].x0;

        if (!split || std::fabs (x - center) < std::fabs (*split - center)) {
            split = x;
        }
    }

    if (!split) {
        return center;
    }

    const auto lhs = (std::min) (*split, center);
    const auto rhs = (std::max) (*split, center);

    const bool blocked = any_of (words, [&](auto& word) {
        return word.x0 () < rhs && word.x1 () > lhs;
    });

    return blocked ? center : *split;
}

} // anonymous namespace

layout_classifier_t::layout_classifier_t (const layout_control_t& arg)
    : ctl (validated (arg)),
      gaps (ctl.gap),
      density (ctl.histogram),
      gutter (ctl.gutter),
      overlap (ctl.overlap),
      full_width (ctl.line),
      side_by_side (ctl.line)
{ }

//
// Layout of a page that cannot be analyzed, a single column over the page
// width if that is usable:
//
layout_t
layout_classifier_t::default_layout (const page_t& page, const char* why) const {
    auto width = page_width_of (page, ctl.page_margin);

    if (!usable_width (width)) {
        width = ctl.gap.default_page_width;
    }

    error (errInput, "{}, page of {} word(s) taken as single-column over {}",
           why, page.words.size (), width);

    layout_t layout;

    layout.type = layout_type_t::single;
    layout.boundaries = whole_page (width);
    layout.confidence = 0;
    layout.page_width = width;

    layout.diagnostics.word_count = page.words.size ();

    return layout;
}

layout_t
layout_classifier_t::weigh_signals (
    const words_t& words, const lines_t& lines, double width,
    layout_t layout) const {
    const auto& cc = ctl.classifier;
    auto& diag = layout.diagnostics;

    const auto histogram = density (words, width, layout.num_columns ());

    diag.valley_depth_ratio = histogram.valley_depth_ratio;
    diag.peaks = histogram.peaks;
    diag.valleys = positions_of (histogram.valleys);

    diag.y_overlap = overlap (words);

    diag.score =
        cc.valley_weight * clamped (diag.valley_depth_ratio / cc.valley_threshold) +
        cc.overlap_weight * clamped (diag.y_overlap * cc.overlap_scale) +
        cc.horizontal_weight * (diag.has_horizontal ? 1. : 0.);

    const auto partition = side_by_side.analyze (lines, words.size (), width);

    error (errDebug,
           "signals: valley={:.3f}, y-overlap={:.3f}, full-width={}, "
           "score={:.3f}, left={}, right={}, full={}",
           diag.valley_depth_ratio, diag.y_overlap, diag.full_width_lines,
           diag.score, partition.left, partition.right, partition.full);

    if (!partition.split) {
        layout.type = layout_type_t::single;
        layout.boundaries = whole_page (width);
        layout.confidence = cc.single_confidence;
        diag.method = detection_method_t::none;
        return layout;
    }

    layout.type = diag.score > cc.hybrid_score_min
        ? layout_type_t::hybrid : layout_type_t::multi;

    layout.boundaries = {
        { 0., *partition.split }, { *partition.split, width }
    };

    layout.confidence = cc.fallback_confidence + (std::min) (
        fallbackConfidenceSpan,
        fallbackConfidenceSlope * std::fabs (diag.score - .5));

    diag.method = detection_method_t::side_by_side;

    return layout;
}

layout_t layout_classifier_t::operator() (const page_t& page) const {
    const auto& words = page.words;

    if (words.empty ()) {
        return default_layout (page, "no words");
    }

    const auto width = page_width_of (page, ctl.page_margin);
    const auto height = page_height_of (page, ctl.page_margin);

    if (!usable_width (width)) {
        return default_layout (page, "unusable page width");
    }

    if (!usable_width (height)) {
        return default_layout (page, "unusable page height");
    }

    layout_t layout;

    layout.page_width = width;

    auto& diag = layout.diagnostics;
    diag.word_count = words.size ();

    const auto gap_analysis = gaps.analyze (words, width);
    diag.gap_tier = gap_analysis.tier;

    if (gap_analysis.boundaries.size () < 2) {
        layout.type = layout_type_t::single;
        layout.boundaries = gap_analysis.boundaries;
        layout.confidence = ctl.classifier.single_confidence;
        diag.method = detection_method_t::gap;
        return layout;
    }

    layout.boundaries = gap_analysis.boundaries;

    const auto lines = group_lines (words, ctl.line.y_tolerance);

    const auto horizontal = full_width (lines, width);
    diag.full_width_lines = horizontal.count;
    diag.has_horizontal = horizontal.has_horizontal;

    diag.gutter = gutter (words, width, height);

    if (diag.gutter.coverage >= ctl.classifier.coverage_min) {
        const bool interrupted = diag.has_horizontal ||
            diag.gutter.header_frac > ctl.classifier.header_frac_max;

        layout.type = interrupted ? layout_type_t::hybrid : layout_type_t::multi;
        layout.confidence = ctl.classifier.gutter_confidence;

        const auto split = split_at (
            words, gap_analysis.boundaries, diag.gutter.gutter_x, width,
            ctl.gutter);

        layout.boundaries = { { 0., split }, { split, width } };

        diag.method = detection_method_t::gutter;

        error (errDebug,
               "strong gutter: coverage={:.3f}, header={:.3f}, split={:.1f}, {}",
               diag.gutter.coverage, diag.gutter.header_frac, split,
               layout.type_name ());

        return layout;
    }

    return weigh_signals (words, lines, width, std::move (layout));
}

} // namespace columnar
