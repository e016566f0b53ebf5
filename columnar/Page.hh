// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef COLUMNAR_COLUMNAR_PAGE_HH
#define COLUMNAR_COLUMNAR_PAGE_HH

#include <defs.hh>

#include <optional>
#include <vector>

#include <columnar/Word.hh>

namespace columnar {

//
// The words of one page, in extraction order, and the page extent when the
// extraction knows it:
//
struct page_t
{
    words_t words;

    std::optional< double > width, height;
};

using pages_t = std::vector< page_t >;

//
// Page extent, either as given or, when absent, inferred from the words as
// the largest coordinate plus a margin. The result may still be unusable (a
// page given a zero width, or a page without words and extent):
//
double page_width_of (const page_t&, double margin);
double page_height_of (const page_t&, double margin);

//
// True if the page width is positive and finite:
//
bool usable_width (double);

} // namespace columnar

#endif // COLUMNAR_COLUMNAR_PAGE_HH
