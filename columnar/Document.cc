// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <atomic>
#include <exception>
#include <stdexcept>
#include <thread>

#include <columnar/Document.hh>
#include <columnar/Error.hh>

#include <fmt/format.h>
using fmt::format;

namespace columnar {

document_analyzer_t::document_analyzer_t (
    const layout_control_t& ctl, size_t threads)
    : classifier (ctl), segmenter (ctl.segment), nthreads (threads) {
    if (nthreads < 1) {
        throw configuration_error (
            format ("invalid threads ({}): must be at least 1", threads));
    }
}

//
// A page that fails is reported and gets the layout of a page without words;
// the other pages are not affected:
//
layout_t
document_analyzer_t::classify (const page_t& page, size_t index) const {
    try {
        return classifier (page);
    }
    catch (const std::exception& e) {
        error (errInternal, "page {}: {}", index + 1, e.what ());
    }

    return classifier (page_t{ { }, page.width, page.height });
}

layouts_t document_analyzer_t::classify (const pages_t& pages) const {
    layouts_t layouts (pages.size ());

    const auto n = (std::min) (nthreads, pages.size ());

    if (n < 2) {
        for (size_t i = 0; i < pages.size (); ++i) {
            layouts [i] = classify (pages [i], i);
        }

        return layouts;
    }

    //
    // Workers pick the next unclassified page until none is left; each
    // writes only the slot of the page it took:
    //
    std::atomic< size_t > next{ 0 };

    auto worker = [&]() {
        for (size_t i; (i = next++) < pages.size ();) {
            layouts [i] = classify (pages [i], i);
        }
    };

    std::vector< std::thread > workers;
    workers.reserve (n);

    for (size_t i = 0; i < n; ++i) {
        workers.emplace_back (worker);
    }

    for (auto& t : workers) {
        t.join ();
    }

    return layouts;
}

document_structure_t
document_analyzer_t::structure (const layouts_t& layouts) const {
    return document_structure_of (
        layouts, classifier.control ().gap.default_page_width);
}

std::vector< columns_t > document_analyzer_t::segment (
    const pages_t& pages, const layouts_t& layouts,
    bool shared_structure) const {
    if (pages.size () != layouts.size ()) {
        throw std::invalid_argument (format (
            "{} page(s) but {} layout(s)", pages.size (), layouts.size ()));
    }

    std::vector< columns_t > result;
    result.reserve (pages.size ());

    if (shared_structure) {
        const auto common = structure (layouts);

        for (auto& page : pages) {
            result.push_back (segmenter (page.words, common.boundaries));
        }
    }
    else {
        for (size_t i = 0; i < pages.size (); ++i) {
            result.push_back (segmenter (pages [i].words, layouts [i]));
        }
    }

    return result;
}

} // namespace columnar
