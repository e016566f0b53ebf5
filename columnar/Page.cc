// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <cmath>

#include <columnar/Page.hh>

#include <range/v3/algorithm/max.hpp>
#include <range/v3/view/transform.hpp>
using namespace ranges;

namespace columnar {

double page_width_of (const page_t& page, double margin) {
    if (page.width) {
        return *page.width;
    }

    if (page.words.empty ()) {
        return 0;
    }

    return ranges::max (page.words | views::transform (&word_t::x1)) + margin;
}

double page_height_of (const page_t& page, double margin) {
    if (page.height) {
        return *page.height;
    }

    if (page.words.empty ()) {
        return 0;
    }

    return ranges::max (page.words | views::transform (&word_t::y1)) + margin;
}

bool usable_width (double x) {
    return std::isfinite (x) && x > 0;
}

} // namespace columnar
