// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <cmath>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <utility>

#include <columnar/ColumnSegmenter.hh>
#include <columnar/Error.hh>

#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/algorithm/none_of.hpp>
#include <range/v3/algorithm/stable_sort.hpp>
using namespace ranges;

namespace columnar {

std::ostream& operator<< (std::ostream& ss, const column_t& x) {
    return ss << "column " << x.id << " " << x.boundary << ", "
              << x.words.size () << " word(s)";
}

namespace {

//
// Index of the column whose center is nearest to x, the leftmost among
// equals:
//
std::optional< size_t > nearest_column (const columns_t& xs, double x) {
    std::optional< size_t > result;
    double best = std::numeric_limits< double >::infinity ();

    for (size_t i = 0; i < xs.size (); ++i) {
        const auto dist = std::fabs (center_of (xs [i].boundary) - x);

        if (dist < best) {
            best = dist;
            result = i;
        }
    }

    return result;
}

void sort_by_top (words_t& words) {
    stable_sort (words, lessY< word_t >);
}

} // anonymous namespace

column_segmenter_t::column_segmenter_t (const segment_control_t& arg)
    : ctl (arg) {
    validate (ctl);
}

columns_t column_segmenter_t::dissolve (columns_t columns) const {
    auto valid = [&](const column_t& x) {
        return x.words.size () >= ctl.min_words_per_column;
    };

    if (none_of (columns, valid)) {
        return columns;
    }

    columns_t result;

    for (auto& column : columns) {
        if (valid (column)) {
            result.push_back (std::move (column));
        }
    }

    for (auto& column : columns) {
        if (valid (column) || column.words.empty ()) {
            continue;
        }

        const auto i = nearest_column (result, center_of (column.boundary));

        ASSERT (i);

        error (errDebug, "column {} of {} word(s) merged into column {}",
               column.id, column.words.size (), result [*i].id);

        auto& words = result [*i].words;
        words.insert (words.end (), column.words.begin (), column.words.end ());
    }

    return result;
}

columns_t column_segmenter_t::operator() (
    const words_t& words, const column_boundaries_t& boundaries) const {
    if (boundaries.empty ()) {
        throw std::invalid_argument ("segmentation without column boundaries");
    }

    columns_t columns;

    for (size_t i = 0; i < boundaries.size (); ++i) {
        columns.push_back ({ i, boundaries [i], { } });
    }

    for (auto& word : words) {
        auto iter = find_if (columns, [&](auto& column) {
            const auto& [ x0, x1 ] = column.boundary;
            return horizontal_coverage (word.box (), x0, x1) >= ctl.overlap_threshold;
        });

        if (iter == columns.end ()) {
            const auto i = nearest_column (columns, word.x_center ());
            iter = columns.begin () + *i;
        }

        iter->words.push_back (word);
    }

    columns = dissolve (std::move (columns));

    stable_sort (columns, [](auto& lhs, auto& rhs) {
        return lhs.boundary.x0 < rhs.boundary.x0;
    });

    for (size_t i = 0; i < columns.size (); ++i) {
        columns [i].id = i;
        sort_by_top (columns [i].words);
    }

    return columns;
}

////////////////////////////////////////////////////////////////////////

document_structure_t
document_structure_of (const layouts_t& layouts, double default_width) {
    document_structure_t result;

    if (layouts.empty ()) {
        result.boundaries = whole_page (default_width);
        return result;
    }

    //
    // Count the column numbers, remembering the order they were first seen:
    //
    std::map< size_t, size_t > counts;
    std::vector< size_t > order;

    for (auto& layout : layouts) {
        if (0 == counts [layout.num_columns ()]++) {
            order.push_back (layout.num_columns ());
        }
    }

    size_t n = order.front ();

    for (auto k : order) {
        if (counts [k] > counts [n]) {
            n = k;
        }
    }

    result.num_columns = n;
    result.boundaries.assign (n, column_boundary_t{ 0., 0. });

    for (auto& layout : layouts) {
        if (layout.num_columns () != n) {
            continue;
        }

        for (size_t i = 0; i < n; ++i) {
            result.boundaries [i].x0 += layout.boundaries [i].x0 / counts [n];
            result.boundaries [i].x1 += layout.boundaries [i].x1 / counts [n];
        }
    }

    return result;
}

} // namespace columnar
