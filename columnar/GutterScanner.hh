// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef COLUMNAR_COLUMNAR_GUTTERSCANNER_HH
#define COLUMNAR_COLUMNAR_GUTTERSCANNER_HH

#include <defs.hh>

#include <iosfwd>
#include <vector>

#include <columnar/Control.hh>
#include <columnar/Smoother.hh>
#include <columnar/Word.hh>

namespace columnar {

struct gutter_metrics_t {
    //
    // Fraction of the bands whose density at the gutter is (near) zero:
    //
    double coverage = 0;

    //
    // Top of the first long run of clear bands, as a fraction of the page
    // height; 0 when there is no such run:
    //
    double header_frac = 0;

    //
    // Left edge of the gutter bin, in page coordinates:
    //
    double gutter_x = 0;

    size_t clear_bands = 0, empty_bands = 0;
};

std::ostream& operator<< (std::ostream&, const gutter_metrics_t&);

struct gutter_scanner_t {
    explicit gutter_scanner_t (const gutter_control_t&);

    gutter_metrics_t
    operator() (const words_t&, double width, double height) const;

    //
    // Bin with the lowest density in the middle quarter of the profile, the
    // one closest to the middle among equals:
    //
    size_t center_of (const std::vector< double >&) const;

    size_t stable_run () const;

    const gutter_control_t& control () const { return ctl; }

private:
    std::vector< double > density_of (const words_t&, double width) const;

    gutter_control_t ctl;
    smoother_ptr_t smoother;
};

} // namespace columnar

#endif // COLUMNAR_COLUMNAR_GUTTERSCANNER_HH
