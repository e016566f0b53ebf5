// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef COLUMNAR_COLUMNAR_SMOOTHER_HH
#define COLUMNAR_COLUMNAR_SMOOTHER_HH

#include <defs.hh>

#include <memory>
#include <vector>

#include <columnar/Control.hh>

namespace columnar {

//
// Smoothing of a density profile; the result has the size of the input:
//
struct smoother_t {
    virtual ~smoother_t () = default;

    virtual std::vector< double >
    operator() (const std::vector< double >&) const = 0;
};

using smoother_ptr_t = std::shared_ptr< const smoother_t >;

//
// Sliding window sum divided by the window size, the profile being zero
// outside of its bounds:
//
struct moving_average_t : smoother_t {
    explicit moving_average_t (size_t window);

    std::vector< double >
    operator() (const std::vector< double >&) const override;

private:
    size_t window;
};

//
// Convolution with a Gaussian kernel truncated at three standard deviations;
// near the ends of the profile the kernel is re-normalized over the taps that
// fall inside:
//
struct gaussian_t : smoother_t {
    explicit gaussian_t (double sigma);

    std::vector< double >
    operator() (const std::vector< double >&) const override;

private:
    std::vector< double > kernel;
};

smoother_ptr_t make_smoother (const histogram_control_t&);

} // namespace columnar

#endif // COLUMNAR_COLUMNAR_SMOOTHER_HH
