// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef COLUMNAR_COLUMNAR_DENSITYHISTOGRAM_HH
#define COLUMNAR_COLUMNAR_DENSITYHISTOGRAM_HH

#include <defs.hh>

#include <vector>

#include <columnar/Control.hh>
#include <columnar/Smoother.hh>
#include <columnar/Word.hh>

namespace columnar {

//
// Counts of word centers over `bins' equal slices of [0, width); centers
// outside of the page are counted in the first or the last bin:
//
std::vector< double >
x_histogram (const words_t&, double width, size_t bins);

//
// Divide by max{ 1, max{ xs } }, leaving an empty profile at zero:
//
std::vector< double > unit_scaled (std::vector< double >);

//
// Value of the lowest strict local minimum of a profile, or 1 if there is
// none; flat stretches are not minima:
//
double lowest_valley_of (const std::vector< double >&);

struct valley_t {
    size_t pos;
    double value;
};

struct density_analysis_t {
    //
    // Smoothed and scaled profile, and the width of a bin in points:
    //
    std::vector< double > density;
    double bin_width = 0;

    std::vector< size_t > peaks;
    std::vector< valley_t > valleys;

    //
    // Smallest valley, or 1 when there are fewer than two peaks:
    //
    double valley_depth_ratio = 1;
};

struct density_analyzer_t {
    explicit density_analyzer_t (const histogram_control_t&);

    density_analysis_t
    operator() (const words_t&, double width, size_t expected_columns) const;

    size_t bins_for (double width) const;

    const histogram_control_t& control () const { return ctl; }

private:
    std::vector< size_t >
    peaks_of (const std::vector< double >&, size_t expected_columns) const;

    histogram_control_t ctl;
    smoother_ptr_t smoother;
};

} // namespace columnar

#endif // COLUMNAR_COLUMNAR_DENSITYHISTOGRAM_HH
