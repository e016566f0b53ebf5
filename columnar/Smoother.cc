// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <cmath>

#include <columnar/Error.hh>
#include <columnar/Smoother.hh>

#include <fmt/format.h>
using fmt::format;

namespace columnar {

moving_average_t::moving_average_t (size_t arg) : window (arg) {
    if (window < 1) {
        throw configuration_error (
            format ("invalid smoothing window ({}): must be at least 1", arg));
    }
}

std::vector< double >
moving_average_t::operator() (const std::vector< double >& xs) const {
    const long n = long (xs.size ());

    //
    // Even windows lean to the right, like a `same' mode convolution:
    //
    const long lhs = (long (window) - 1) / 2, rhs = long (window) / 2;

    std::vector< double > ys (xs.size ());

    for (long i = 0; i < n; ++i) {
        double sum = 0;

        for (long j = (std::max) (0L, i - lhs),
                 last = (std::min) (n - 1, i + rhs); j <= last; ++j) {
            sum += xs [j];
        }

        ys [i] = sum / window;
    }

    return ys;
}

gaussian_t::gaussian_t (double sigma) {
    if (!(sigma > 0) || !std::isfinite (sigma)) {
        throw configuration_error (
            format ("invalid Gaussian sigma ({}): must be positive", sigma));
    }

    const long radius = (std::max) (1L, long (std::ceil (3 * sigma)));

    kernel.resize (2 * radius + 1);

    for (long i = -radius; i <= radius; ++i) {
        kernel [i + radius] = std::exp (-.5 * (i * i) / (sigma * sigma));
    }
}

std::vector< double >
gaussian_t::operator() (const std::vector< double >& xs) const {
    const long n = long (xs.size ());
    const long radius = long (kernel.size ()) / 2;

    std::vector< double > ys (xs.size ());

    for (long i = 0; i < n; ++i) {
        double sum = 0, weight = 0;

        for (long k = -radius; k <= radius; ++k) {
            if (i + k < 0 || i + k >= n) {
                continue;
            }

            sum += kernel [k + radius] * xs [i + k];
            weight += kernel [k + radius];
        }

        ys [i] = weight > 0 ? sum / weight : 0;
    }

    return ys;
}

smoother_ptr_t make_smoother (const histogram_control_t& ctl) {
    switch (ctl.smoothing) {
    case smoothing_t::gaussian:
        return std::make_shared< gaussian_t > (ctl.gaussian_sigma);

    case smoothing_t::moving_average:
        return std::make_shared< moving_average_t > (ctl.smoothing_window);
    }

    error (errInternal, "unknown smoothing kind {}", int (ctl.smoothing));
    return std::make_shared< moving_average_t > (ctl.smoothing_window);
}

} // namespace columnar
