// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <cmath>
#include <functional>
#include <istream>
#include <map>
#include <string>
#include <vector>

#include <utils/string.hh>

#include <columnar/Control.hh>
#include <columnar/Error.hh>

#include <fmt/format.h>
using fmt::format;

namespace columnar {
namespace {

template< typename T >
inline void
check (bool ok, const char* name, T value, const std::string& requirement) {
    if (!ok) {
        throw configuration_error (
            format ("invalid {} ({}): must be {}", name, value, requirement));
    }
}

inline bool positive (double x) { return std::isfinite (x) && x > 0; }

inline bool fraction (double x) { return x >= 0 && x <= 1; }

} // anonymous namespace

void validate (const gap_control_t& ctl) {
    check (positive (ctl.min_gap_width), "min_gap_width", ctl.min_gap_width,
           "positive");
    check (positive (ctl.min_column_width), "min_column_width",
           ctl.min_column_width, "positive");
    check (positive (ctl.default_page_width), "default_page_width",
           ctl.default_page_width, "positive");
}

void validate (const histogram_control_t& ctl) {
    check (ctl.smoothing_window >= 1, "smoothing_window",
           ctl.smoothing_window, "at least 1");
    check (positive (ctl.gaussian_sigma), "gaussian_sigma",
           ctl.gaussian_sigma, "positive");
    check (ctl.peak_threshold_multi >= 0, "peak_threshold_multi",
           ctl.peak_threshold_multi, "non-negative");
    check (ctl.peak_threshold_single >= 0, "peak_threshold_single",
           ctl.peak_threshold_single, "non-negative");
}

void validate (const gutter_control_t& ctl) {
    check (ctl.band_count >= 1, "band_count", ctl.band_count, "at least 1");

    //
    // The gutter search window spans a quarter of the bins around the
    // middle, it must hold at least one bin on either side:
    //
    check (ctl.density_bins >= 2 * gutterSearchDiv, "density_bins",
           ctl.density_bins, format ("at least {}", 2 * gutterSearchDiv));

    check (ctl.smoothing_window >= 1, "smoothing_window",
           ctl.smoothing_window, "at least 1");
    check (fraction (ctl.gutter_zero_max), "gutter_zero_max",
           ctl.gutter_zero_max, "within [0, 1]");
    check (ctl.probe_half_width < ctl.density_bins, "probe_half_width",
           ctl.probe_half_width, "less than density_bins");
}

void validate (const overlap_control_t& ctl) {
    check (ctl.max_pairs >= 1, "max_pairs", ctl.max_pairs, "at least 1");
    check (ctl.sample_size >= 2, "sample_size", ctl.sample_size,
           "at least 2");
}

void validate (const line_control_t& ctl) {
    check (ctl.y_tolerance >= 0 && std::isfinite (ctl.y_tolerance),
           "y_tolerance", ctl.y_tolerance, "non-negative");
    check (ctl.full_width_fraction > 0 && ctl.full_width_fraction <= 1,
           "full_width_fraction", ctl.full_width_fraction, "within (0, 1]");
    check (ctl.horizontal_lines_min >= 1, "horizontal_lines_min",
           ctl.horizontal_lines_min, "at least 1");
}

void validate (const classifier_control_t& ctl) {
    check (fraction (ctl.coverage_min), "coverage_min", ctl.coverage_min,
           "within [0, 1]");
    check (fraction (ctl.header_frac_max), "header_frac_max",
           ctl.header_frac_max, "within [0, 1]");
    check (positive (ctl.valley_threshold), "valley_threshold",
           ctl.valley_threshold, "positive");

    check (ctl.valley_weight >= 0, "valley_weight", ctl.valley_weight,
           "non-negative");
    check (ctl.overlap_weight >= 0, "overlap_weight", ctl.overlap_weight,
           "non-negative");
    check (ctl.horizontal_weight >= 0, "horizontal_weight",
           ctl.horizontal_weight, "non-negative");

    check (positive (ctl.overlap_scale), "overlap_scale", ctl.overlap_scale,
           "positive");
    check (fraction (ctl.hybrid_score_min), "hybrid_score_min",
           ctl.hybrid_score_min, "within [0, 1]");

    check (fraction (ctl.single_confidence), "single_confidence",
           ctl.single_confidence, "within [0, 1]");
    check (fraction (ctl.gutter_confidence), "gutter_confidence",
           ctl.gutter_confidence, "within [0, 1]");
    check (ctl.fallback_confidence >= 0 &&
           ctl.fallback_confidence + fallbackConfidenceSpan <= 1,
           "fallback_confidence", ctl.fallback_confidence,
           format ("within [0, {}]", 1 - fallbackConfidenceSpan));
}

void validate (const segment_control_t& ctl) {
    check (ctl.overlap_threshold > 0 && ctl.overlap_threshold <= 1,
           "overlap_threshold", ctl.overlap_threshold, "within (0, 1]");
}

void validate (const layout_control_t& ctl) {
    validate (ctl.gap);
    validate (ctl.histogram);
    validate (ctl.gutter);
    validate (ctl.overlap);
    validate (ctl.line);
    validate (ctl.classifier);
    validate (ctl.segment);

    check (ctl.page_margin >= 0 && std::isfinite (ctl.page_margin),
           "page_margin", ctl.page_margin, "non-negative");
}

////////////////////////////////////////////////////////////////////////

namespace {

using setter_t = std::function< bool (layout_control_t&, const std::string&) >;

template< typename T >
setter_t real (T layout_control_t::*group, double T::*member) {
    return [=](auto& ctl, auto& s) {
        if (auto x = to_double (s)) {
            return (ctl.*group).*member = *x, true;
        }
        return false;
    };
}

template< typename T >
setter_t count (T layout_control_t::*group, size_t T::*member) {
    return [=](auto& ctl, auto& s) {
        if (auto x = to_long (s); x && *x >= 0) {
            return (ctl.*group).*member = size_t (*x), true;
        }
        return false;
    };
}

template< typename T >
setter_t yes_no (T layout_control_t::*group, bool T::*member) {
    return [=](auto& ctl, auto& s) {
        if (auto x = to_bool (s)) {
            return (ctl.*group).*member = *x, true;
        }
        return false;
    };
}

const std::map< std::string, setter_t >& setters () {
    using L = layout_control_t;

    static const std::map< std::string, setter_t > xs{
        { "minGapWidth", real (&L::gap, &gap_control_t::min_gap_width) },
        { "minColumnWidth", real (&L::gap, &gap_control_t::min_column_width) },
        { "adaptiveGaps", yes_no (&L::gap, &gap_control_t::adaptive) },
        { "defaultPageWidth",
          real (&L::gap, &gap_control_t::default_page_width) },

        { "densityBins", count (&L::histogram, &histogram_control_t::bin_count) },
        { "smoothing", [](auto& ctl, auto& s) {
            if (s == "movingAverage") {
                return ctl.histogram.smoothing = smoothing_t::moving_average, true;
            }
            if (s == "gaussian") {
                return ctl.histogram.smoothing = smoothing_t::gaussian, true;
            }
            return false;
        } },
        { "smoothingWindow",
          count (&L::histogram, &histogram_control_t::smoothing_window) },
        { "gaussianSigma",
          real (&L::histogram, &histogram_control_t::gaussian_sigma) },
        { "peakThresholdMulti",
          real (&L::histogram, &histogram_control_t::peak_threshold_multi) },
        { "peakThresholdSingle",
          real (&L::histogram, &histogram_control_t::peak_threshold_single) },

        { "bandCount", count (&L::gutter, &gutter_control_t::band_count) },
        { "gutterBins", count (&L::gutter, &gutter_control_t::density_bins) },
        { "gutterSmoothingWindow",
          count (&L::gutter, &gutter_control_t::smoothing_window) },
        { "gutterZeroMax", real (&L::gutter, &gutter_control_t::gutter_zero_max) },
        { "gutterProbeHalfWidth",
          count (&L::gutter, &gutter_control_t::probe_half_width) },
        { "gutterStableRun", count (&L::gutter, &gutter_control_t::stable_run) },

        { "overlapMaxPairs", count (&L::overlap, &overlap_control_t::max_pairs) },
        { "overlapSampleSize",
          count (&L::overlap, &overlap_control_t::sample_size) },
        { "overlapSeed", [](auto& ctl, auto& s) {
            if (auto x = to_long (s); x && *x >= 0) {
                return ctl.overlap.seed = unsigned (*x), true;
            }
            return false;
        } },

        { "lineYTolerance", real (&L::line, &line_control_t::y_tolerance) },
        { "fullWidthFraction",
          real (&L::line, &line_control_t::full_width_fraction) },
        { "horizontalLinesMin",
          count (&L::line, &line_control_t::horizontal_lines_min) },

        { "coverageMin", real (&L::classifier, &classifier_control_t::coverage_min) },
        { "headerFracMax",
          real (&L::classifier, &classifier_control_t::header_frac_max) },
        { "valleyThreshold",
          real (&L::classifier, &classifier_control_t::valley_threshold) },
        { "valleyWeight",
          real (&L::classifier, &classifier_control_t::valley_weight) },
        { "overlapWeight",
          real (&L::classifier, &classifier_control_t::overlap_weight) },
        { "horizontalWeight",
          real (&L::classifier, &classifier_control_t::horizontal_weight) },
        { "overlapScale",
          real (&L::classifier, &classifier_control_t::overlap_scale) },
        { "hybridScoreMin",
          real (&L::classifier, &classifier_control_t::hybrid_score_min) },

        { "columnOverlapThreshold",
          real (&L::segment, &segment_control_t::overlap_threshold) },
        { "minWordsPerColumn",
          count (&L::segment, &segment_control_t::min_words_per_column) },

        { "pageMargin", [](auto& ctl, auto& s) {
            if (auto x = to_double (s)) {
                return ctl.page_margin = *x, true;
            }
            return false;
        } }
    };

    return xs;
}

} // anonymous namespace

void parse_control (std::istream& in, layout_control_t& ctl) {
    const auto& xs = setters ();

    std::string buf;

    for (size_t line = 1; std::getline (in, buf); ++line) {
        const auto tokens = split (buf);

        if (tokens.empty () || tokens [0][0] == '#') {
            continue;
        }

        const auto& name = tokens [0];
        const auto iter = xs.find (name);

        if (iter == xs.end ()) {
            error (errConfig, "Unknown setting '{}' (line {})", name, line);
            continue;
        }

        if (tokens.size () != 2 || !iter->second (ctl, tokens [1])) {
            error (errConfig, "Bad '{}' setting (line {})", name, line);
        }
    }

    validate (ctl);
}

} // namespace columnar
