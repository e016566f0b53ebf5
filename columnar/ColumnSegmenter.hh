// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef COLUMNAR_COLUMNAR_COLUMNSEGMENTER_HH
#define COLUMNAR_COLUMNAR_COLUMNSEGMENTER_HH

#include <defs.hh>

#include <iosfwd>
#include <vector>

#include <columnar/Boundary.hh>
#include <columnar/Control.hh>
#include <columnar/Layout.hh>
#include <columnar/Word.hh>

namespace columnar {

struct column_t {
    size_t id;
    column_boundary_t boundary;

    //
    // Top to bottom, words at the same height in their input order:
    //
    words_t words;
};

using columns_t = std::vector< column_t >;

std::ostream& operator<< (std::ostream&, const column_t&);

//
// Column structure shared by the pages of a document:
//
struct document_structure_t {
    size_t num_columns = 1;
    column_boundaries_t boundaries;
};

struct column_segmenter_t {
    explicit column_segmenter_t (const segment_control_t&);

    //
    // Assign each word to exactly one of the columns. A word goes to the
    // first column holding enough of its width, or else to the column whose
    // center is nearest. Columns left with too few words are folded into
    // their nearest neighbor and the survivors numbered left to right:
    //
    columns_t operator() (const words_t&, const column_boundaries_t&) const;

    columns_t operator() (const words_t& words, const layout_t& layout) const {
        return (*this) (words, layout.boundaries);
    }

    const segment_control_t& control () const { return ctl; }

private:
    columns_t dissolve (columns_t) const;

    segment_control_t ctl;
};

//
// The most frequent column count among the layouts, the first one seen
// winning ties, and the mean boundaries of the layouts that have it. An
// empty document is one column over the default width:
//
document_structure_t
document_structure_of (const layouts_t&, double default_width);

} // namespace columnar

#endif // COLUMNAR_COLUMNAR_COLUMNSEGMENTER_HH
