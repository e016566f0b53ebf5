// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef COLUMNAR_COLUMNAR_LINE_HH
#define COLUMNAR_COLUMNAR_LINE_HH

#include <defs.hh>

#include <iosfwd>
#include <vector>

#include <columnar/Control.hh>
#include <columnar/Word.hh>

namespace columnar {

//
// Words sharing a baseline, left to right. The center is the vertical center
// of the word that started the line; the box bounds all of its words:
//
struct line_t {
    double center;
    bbox_t box;
    words_t words;

    double x0 () const { return box.arr [0]; }
    double y0 () const { return box.arr [1]; }
    double x1 () const { return box.arr [2]; }
    double y1 () const { return box.arr [3]; }

    //
    // Horizontal span, from the leftmost left edge to the rightmost right
    // edge:
    //
    double span () const { return width_of (box); }
};

using lines_t = std::vector< line_t >;

std::ostream& operator<< (std::ostream&, const line_t&);

//
// A word joins the first line whose center is within `y_tolerance' of its own
// vertical center, or starts a new one. Lines come out top to bottom:
//
lines_t group_lines (const words_t&, double y_tolerance);

struct full_width_lines_t {
    size_t count = 0;
    bool has_horizontal = false;
};

struct full_width_detector_t {
    explicit full_width_detector_t (const line_control_t&);

    full_width_lines_t operator() (const lines_t&, double width) const;

    full_width_lines_t operator() (const words_t& words, double width) const {
        return (*this) (group_lines (words, ctl.y_tolerance), width);
    }

    bool is_full_width (const line_t& line, double width) const {
        return line.span () >= width * ctl.full_width_fraction;
    }

    const line_control_t& control () const { return ctl; }

private:
    line_control_t ctl;
};

} // namespace columnar

#endif // COLUMNAR_COLUMNAR_LINE_HH
