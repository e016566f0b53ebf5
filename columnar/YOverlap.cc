// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <iterator>
#include <random>
#include <utility>
#include <vector>

#include <columnar/Error.hh>
#include <columnar/YOverlap.hh>

namespace columnar {
namespace {

//
// Sum of the overlap ratios and the number of pairs scored; pairs where
// either word has no height are not scored:
//
template< typename Iterator >
std::pair< double, size_t > score (Iterator first, Iterator last) {
    double sum = 0;
    size_t count = 0;

    for (auto iter = first; iter != last; ++iter) {
        for (auto other = std::next (iter); other != last; ++other) {
            const auto& lhs = (*iter)->box ();
            const auto& rhs = (*other)->box ();

            if (min_height_of (lhs, rhs) <= 0) {
                continue;
            }

            sum += vertical_overlap_ratio (lhs, rhs);
            ++count;
        }
    }

    return { sum, count };
}

} // anonymous namespace

y_overlap_scorer_t::y_overlap_scorer_t (const overlap_control_t& arg)
    : ctl (arg) {
    validate (ctl);
}

double y_overlap_scorer_t::operator() (const words_t& words) const {
    const auto n = words.size ();

    if (n < 2) {
        return 0;
    }

    std::vector< const word_t* > xs;
    xs.reserve (n);

    for (auto& word : words) {
        xs.push_back (&word);
    }

    if (n * (n - 1) / 2 > ctl.max_pairs) {
        //
        // Fixed seed, the same page always scores the same:
        //
        std::vector< const word_t* > sample;
        sample.reserve (ctl.sample_size);

        std::mt19937 generator (ctl.seed);
        std::sample (xs.begin (), xs.end (), std::back_inserter (sample),
                     ctl.sample_size, generator);

        error (errDebug, "y-overlap: sampled {} of {} words", sample.size (), n);
        xs = std::move (sample);
    }

    const auto [ sum, count ] = score (xs.begin (), xs.end ());

    return count ? sum / count : 0.;
}

} // namespace columnar
