// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <iostream>
#include <optional>

#include <columnar/DensityHistogram.hh>
#include <columnar/Error.hh>
#include <columnar/GutterScanner.hh>
#include <columnar/Page.hh>

#include <range/v3/algorithm/copy_if.hpp>
#include <range/v3/algorithm/min_element.hpp>
#include <iterator>
using namespace ranges;

namespace columnar {

std::ostream& operator<< (std::ostream& ss, const gutter_metrics_t& x) {
    return ss << "{ coverage: " << x.coverage
              << ", header_frac: " << x.header_frac
              << ", gutter_x: " << x.gutter_x << " }";
}

gutter_scanner_t::gutter_scanner_t (const gutter_control_t& arg) : ctl (arg) {
    validate (ctl);
    smoother = std::make_shared< moving_average_t > (ctl.smoothing_window);
}

size_t gutter_scanner_t::stable_run () const {
    if (ctl.stable_run) {
        return ctl.stable_run;
    }

    return (std::max) (
        size_t (gutterMinStableRun), ctl.band_count / gutterStableRunDiv);
}

std::vector< double >
gutter_scanner_t::density_of (const words_t& words, double width) const {
    return unit_scaled (
        (*smoother) (x_histogram (words, width, ctl.density_bins)));
}

size_t gutter_scanner_t::center_of (const std::vector< double >& xs) const {
    const size_t n = xs.size (), mid = n / 2;

    const size_t first = mid - n / gutterSearchDiv;
    const size_t last = mid + n / gutterSearchDiv;

    auto distance = [=](size_t i) { return i > mid ? i - mid : mid - i; };

    size_t pos = first;

    for (size_t i = first + 1; i < last; ++i) {
        if (xs [i] < xs [pos] ||
            (xs [i] == xs [pos] && distance (i) < distance (pos))) {
            pos = i;
        }
    }

    return pos;
}

gutter_metrics_t
gutter_scanner_t::operator() (
    const words_t& words, double width, double height) const {
    gutter_metrics_t result;

    if (words.empty ()) {
        return result;
    }

    if (!usable_width (width) || !usable_width (height)) {
        error (errInput, "gutter scan over unusable page {}x{}", width, height);
        return result;
    }

    const auto center = center_of (density_of (words, width));
    result.gutter_x = double (center) * width / ctl.density_bins;

    const size_t probe_first =
        center > ctl.probe_half_width ? center - ctl.probe_half_width : 0;
    const size_t probe_last = (std::min) (
        ctl.density_bins, center + ctl.probe_half_width + 1);

    const auto band_height = height / ctl.band_count;
    const auto K = stable_run ();

    std::optional< size_t > start;
    size_t run = 0;

    for (size_t i = 0; i < ctl.band_count; ++i) {
        const auto top = i * band_height;
        const auto bottom = (std::min) (height, top + band_height);

        words_t band;

        copy_if (words, std::back_inserter (band), [&](auto& word) {
            return word.y1 () > top && word.y0 () < bottom;
        });

        if (band.empty ()) {
            ++result.empty_bands;
            run = 0;
            continue;
        }

        const auto xs = density_of (band, width);

        const auto value = *min_element (
            xs.begin () + probe_first, xs.begin () + probe_last);

        if (value <= ctl.gutter_zero_max) {
            ++result.clear_bands;

            if (++run >= K && !start) {
                start = i + 1 - K;
            }
        }
        else {
            run = 0;
        }
    }

    result.coverage = double (result.clear_bands) / ctl.band_count;
    result.header_frac = start ? double (*start) / ctl.band_count : 0.;

    error (errDebug,
           "gutter: x={:.1f}, coverage={:.3f}, header={:.3f}, empty bands={}",
           result.gutter_x, result.coverage, result.header_frac,
           result.empty_bands);

    return result;
}

} // namespace columnar
