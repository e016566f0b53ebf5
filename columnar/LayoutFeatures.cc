// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <iostream>

#include <columnar/Error.hh>
#include <columnar/LayoutFeatures.hh>

#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/view/transform.hpp>
using namespace ranges;

namespace columnar {

std::array< double, layout_features_t::size >
layout_features_t::values () const {
    return {
        double (num_columns),
        mean_y_overlap,
        coverage_gutter,
        full_width_line_ratio,
        valley_depth_ratio,
        double (horizontal_lines_count),
        header_fraction,
        avg_word_width_ratio,
        line_density_variance
    };
}

const std::array< const char*, layout_features_t::size >&
layout_features_t::names () {
    static const std::array< const char*, size > xs{
        "num_columns",
        "mean_y_overlap",
        "coverage_gutter",
        "full_width_line_ratio",
        "valley_depth_ratio",
        "horizontal_lines_count",
        "header_fraction",
        "avg_word_width_ratio",
        "line_density_variance"
    };

    return xs;
}

std::ostream& operator<< (std::ostream& ss, const layout_features_t& x) {
    const auto& names = layout_features_t::names ();
    const auto values = x.values ();

    ss << "{";

    for (size_t i = 0; i < names.size (); ++i) {
        ss << (i ? ", " : " ") << names [i] << ": " << values [i];
    }

    return ss << " }";
}

feature_extractor_t::feature_extractor_t (const layout_control_t& arg)
    : ctl (arg),
      density (ctl.histogram),
      gutter (ctl.gutter),
      overlap (ctl.overlap),
      full_width (ctl.line)
{
    validate (ctl);
}

layout_features_t feature_extractor_t::operator() (const page_t& page) const {
    layout_features_t result;

    const auto& words = page.words;

    if (words.empty ()) {
        return result;
    }

    const auto width = page_width_of (page, ctl.page_margin);
    const auto height = page_height_of (page, ctl.page_margin);

    if (!usable_width (width) || !usable_width (height)) {
        error (errInput, "no features for a page of {}x{}", width, height);
        return result;
    }

    const auto metrics = gutter (words, width, height);

    result.coverage_gutter = metrics.coverage;
    result.header_fraction = metrics.header_frac;

    result.num_columns =
        metrics.coverage >= ctl.classifier.coverage_min ? 2 : 1;

    result.mean_y_overlap = overlap (words);

    const auto lines = group_lines (words, ctl.line.y_tolerance);
    const auto horizontal = full_width (lines, width);

    result.horizontal_lines_count = horizontal.count;
    result.full_width_line_ratio = lines.empty ()
        ? 0. : double (horizontal.count) / lines.size ();

    //
    // Lowest dip anywhere in the profile, not only between peaks:
    //
    result.valley_depth_ratio = lowest_valley_of (
        density (words, width, result.num_columns).density);

    result.avg_word_width_ratio = accumulate (
        words | views::transform (&word_t::width), 0.) / words.size () / width;

    //
    // Population variance of the number of words per line:
    //
    if (!lines.empty ()) {
        const double n = lines.size ();

        const auto mean = accumulate (
            lines | views::transform ([](auto& x) {
                return double (x.words.size ());
            }), 0.) / n;

        result.line_density_variance = accumulate (
            lines | views::transform ([=](auto& x) {
                const auto d = x.words.size () - mean;
                return d * d;
            }), 0.) / n;
    }

    return result;
}

} // namespace columnar
