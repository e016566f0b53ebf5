// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <functional>
#include <numeric>

#include <columnar/DensityHistogram.hh>
#include <columnar/Error.hh>
#include <columnar/Page.hh>

#include <range/v3/algorithm/max.hpp>
#include <range/v3/algorithm/min_element.hpp>
#include <range/v3/algorithm/sort.hpp>
using namespace ranges;

namespace columnar {

std::vector< double >
x_histogram (const words_t& words, double width, size_t bins) {
    std::vector< double > xs (bins);

    if (bins == 0 || !(width > 0)) {
        return xs;
    }

    for (auto& word : words) {
        const auto x = std::floor (word.x_center () / width * bins);
        const auto i = x < 0 ? 0 : (std::min) (size_t (x), bins - 1);

        ++xs [i];
    }

    return xs;
}

std::vector< double > unit_scaled (std::vector< double > xs) {
    if (xs.empty ()) {
        return xs;
    }

    const auto scale = (std::max) (1., ranges::max (xs));

    for (auto& x : xs) {
        x /= scale;
    }

    return xs;
}

double lowest_valley_of (const std::vector< double >& xs) {
    double result = 1;

    for (size_t i = 1; i + 1 < xs.size (); ++i) {
        if (xs [i] < xs [i - 1] && xs [i] < xs [i + 1]) {
            result = (std::min) (result, xs [i]);
        }
    }

    return result;
}

////////////////////////////////////////////////////////////////////////

density_analyzer_t::density_analyzer_t (const histogram_control_t& arg)
    : ctl (arg) {
    validate (ctl);
    smoother = make_smoother (ctl);
}

size_t density_analyzer_t::bins_for (double width) const {
    if (ctl.bin_count) {
        return ctl.bin_count;
    }

    return (std::max) (
        size_t (minDensityBins), size_t (width / pointsPerDensityBin));
}

//
// Local maxima above a fraction of the mean density. A flat top counts once,
// at its middle, when it is strictly higher than both of its neighbors:
//
std::vector< size_t >
density_analyzer_t::peaks_of (
    const std::vector< double >& xs, size_t expected_columns) const {
    const auto n = xs.size ();

    if (n < 3) {
        return { };
    }

    const auto mean = std::accumulate (xs.begin (), xs.end (), 0.) / n;
    const auto threshold = mean * (expected_columns > 1
        ? ctl.peak_threshold_multi : ctl.peak_threshold_single);

    std::vector< size_t > candidates;

    for (size_t i = 1; i + 1 < n;) {
        size_t j = i;

        for (; j + 1 < n && xs [j + 1] == xs [i]; ++j) ;

        if (j + 1 < n &&
            xs [i] > xs [i - 1] && xs [i] > xs [j + 1] && xs [i] >= threshold) {
            candidates.push_back ((i + j) / 2);
        }

        i = j + 1;
    }

    //
    // Stronger peaks first; a peak too close to a stronger one is dropped:
    //
    const auto distance = (std::max) (
        size_t (1), size_t (n / (peakSpacingDivisor *
                                 (std::max) (size_t (1), expected_columns))));

    sort (candidates, [&](auto lhs, auto rhs) {
        return xs [lhs] > xs [rhs] || (xs [lhs] == xs [rhs] && lhs < rhs);
    });

    std::vector< size_t > peaks;

    for (auto i : candidates) {
        bool isolated = true;

        for (auto j : peaks) {
            if ((i > j ? i - j : j - i) < distance) {
                isolated = false;
                break;
            }
        }

        if (isolated) {
            peaks.push_back (i);
        }
    }

    sort (peaks);

    return peaks;
}

density_analysis_t
density_analyzer_t::operator() (
    const words_t& words, double width, size_t expected_columns) const {
    density_analysis_t result;

    if (!usable_width (width)) {
        error (errInput, "density histogram over unusable width {}", width);
        return result;
    }

    const auto bins = bins_for (width);

    result.bin_width = width / bins;
    result.density = unit_scaled ((*smoother) (x_histogram (words, width, bins)));

    result.peaks = peaks_of (result.density, expected_columns);

    const auto& xs = result.density;

    for (size_t i = 1; i < result.peaks.size (); ++i) {
        const auto first = xs.begin () + result.peaks [i - 1];
        const auto last = xs.begin () + result.peaks [i] + 1;

        const auto iter = min_element (first, last);
        result.valleys.push_back ({ size_t (iter - xs.begin ()), *iter });
    }

    if (!result.valleys.empty ()) {
        result.valley_depth_ratio = min_element (
            result.valleys, std::less<>{ }, &valley_t::value)->value;
    }

    error (errDebug, "density: bins={}, peaks={}, valley depth={:.3f}",
           bins, result.peaks.size (), result.valley_depth_ratio);

    return result;
}

} // namespace columnar
