// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef COLUMNAR_COLUMNAR_DOCUMENT_HH
#define COLUMNAR_COLUMNAR_DOCUMENT_HH

#include <defs.hh>

#include <vector>

#include <columnar/ColumnSegmenter.hh>
#include <columnar/Layout.hh>
#include <columnar/LayoutClassifier.hh>
#include <columnar/Page.hh>

namespace columnar {

//
// Layout analysis of all pages of a document. Pages are classified
// independently of one another, on as many threads as requested; results
// come back in page order.
//
struct document_analyzer_t {
    explicit document_analyzer_t (
        const layout_control_t& = { }, size_t threads = 1);

    layouts_t classify (const pages_t&) const;

    document_structure_t structure (const layouts_t&) const;

    //
    // Columns of each page, following either the page's own layout or the
    // structure common to the document:
    //
    std::vector< columns_t > segment (
        const pages_t&, const layouts_t&, bool shared_structure = false) const;

    size_t threads () const { return nthreads; }

private:
    layout_t classify (const page_t&, size_t) const;

    layout_classifier_t classifier;
    column_segmenter_t segmenter;

    size_t nthreads;
};

} // namespace columnar

#endif // COLUMNAR_COLUMNAR_DOCUMENT_HH
