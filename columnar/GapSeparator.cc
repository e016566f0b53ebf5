// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <functional>
#include <iostream>
#include <optional>
#include <utility>
#include <vector>

#include <columnar/Error.hh>
#include <columnar/GapSeparator.hh>
#include <columnar/Page.hh>

#include <range/v3/algorithm/sort.hpp>
#include <range/v3/algorithm/transform.hpp>
#include <iterator>
using namespace ranges;

namespace columnar {

const char* to_string (gap_tier_t tier) {
    switch (tier) {
    case gap_tier_t::none:       return "none";
    case gap_tier_t::aggressive: return "aggressive";
    case gap_tier_t::uniform:    return "uniform";
    case gap_tier_t::standard:   return "standard";
    case gap_tier_t::fixed:      return "fixed";
    case gap_tier_t::fallback:   return "fallback";
    }

    return "unknown";
}

std::ostream& operator<< (std::ostream& ss, gap_tier_t tier) {
    return ss << to_string (tier);
}

namespace {

using interval_t = std::pair< double, double >;

std::vector< interval_t > intervals_of (const words_t& words) {
    std::vector< interval_t > xs;
    xs.reserve (words.size ());

    transform (words, std::back_inserter (xs), [](auto& x) {
        return interval_t{ x.x0 (), x.x1 () };
    });

    sort (xs);

    return xs;
}

//
// Visit the positive gaps between consecutive intervals:
//
template< typename Fn >
void for_each_gap (const std::vector< interval_t >& xs, Fn fn) {
    for (size_t i = 1; i < xs.size (); ++i) {
        const auto lhs = xs [i - 1].second, rhs = xs [i].first;

        if (rhs - lhs > 0) {
            fn (lhs, rhs);
        }
    }
}

std::vector< double >
separators_of (const std::vector< interval_t >& xs, double threshold) {
    std::vector< double > seps;

    for_each_gap (xs, [&](double lhs, double rhs) {
        if (rhs - lhs >= threshold) {
            seps.push_back ((lhs + rhs) * .5);
        }
    });

    return seps;
}

//
// A threshold strategy yields a gap threshold if it applies to a page with
// the given gap statistics:
//
using threshold_fn_t = std::function<
    std::optional< double > (const gap_statistics_t&, const gap_control_t&) >;

struct strategy_t {
    gap_tier_t tier;
    threshold_fn_t threshold;
};

const strategy_t aggressive_strategy{
    gap_tier_t::aggressive, [](auto& s, auto& ctl) -> std::optional< double > {
        if (s.max > aggressiveGapRatio * s.median) {
            return (std::max) (ctl.min_gap_width * aggressiveGapMul, s.p60);
        }
        return { };
    }
};

const strategy_t uniform_strategy{
    gap_tier_t::uniform, [](auto& s, auto& ctl) -> std::optional< double > {
        if (s.max < uniformGapRatio * s.median) {
            return (std::max) (ctl.min_gap_width * uniformGapMul, s.p90);
        }
        return { };
    }
};

const strategy_t standard_strategy{
    gap_tier_t::standard, [](auto& s, auto& ctl) -> std::optional< double > {
        if (s.max <= aggressiveGapRatio * s.median &&
            s.max >= uniformGapRatio * s.median) {
            return (std::max) (ctl.min_gap_width, s.p75);
        }
        return { };
    }
};

const strategy_t fixed_strategy{
    gap_tier_t::fixed, [](auto&, auto& ctl) -> std::optional< double > {
        return ctl.min_gap_width;
    }
};

const strategy_t fallback_strategy{
    gap_tier_t::fallback, [](auto& s, auto& ctl) -> std::optional< double > {
        if (s.max > ctl.min_gap_width * fallbackGapMul) {
            return (std::max) (ctl.min_gap_width * fallbackGapMul, s.p60);
        }
        return { };
    }
};

//
// The adaptive tiers are mutually exclusive, at most one of them applies to
// a page; the fallback is reached only if that one found nothing:
//
const std::vector< strategy_t >& strategies_for (const gap_control_t& ctl) {
    static const std::vector< strategy_t > adaptive{
        aggressive_strategy, uniform_strategy, standard_strategy,
        fallback_strategy
    };

    static const std::vector< strategy_t > fixed{
        fixed_strategy, fallback_strategy
    };

    return ctl.adaptive ? adaptive : fixed;
}

} // anonymous namespace

////////////////////////////////////////////////////////////////////////

std::vector< double > gaps_of (const words_t& words) {
    std::vector< double > xs;

    for_each_gap (intervals_of (words), [&](double lhs, double rhs) {
        xs.push_back (rhs - lhs);
    });

    return xs;
}

gap_statistics_t statistics_of (std::vector< double > xs) {
    gap_statistics_t s;

    if (xs.empty ()) {
        return s;
    }

    sort (xs);

    const auto n = xs.size ();

    auto percentile = [&](double q) {
        return xs [(std::min) (size_t (n * q), n - 1)];
    };

    s.count  = n;
    s.median = xs [n / 2];
    s.p60    = percentile (.60);
    s.p75    = percentile (.75);
    s.p90    = percentile (.90);
    s.max    = xs.back ();

    return s;
}

gap_separator_t::gap_separator_t (const gap_control_t& arg) : ctl (arg) {
    validate (ctl);
}

std::vector< double >
gap_separator_t::merge (const std::vector< double >& seps) const {
    std::vector< double > xs;

    for (auto sep : seps) {
        if (xs.empty () || sep - xs.back () >= ctl.min_column_width) {
            xs.push_back (sep);
        }
    }

    return xs;
}

column_boundaries_t
gap_separator_t::build (const std::vector< double >& seps, double width) const {
    column_boundaries_t xs;

    double x0 = 0;

    for (auto sep : seps) {
        if (sep <= 0 || sep >= width) {
            error (errGeometry, "separator at {} outside of page [0,{})",
                   sep, width);
            continue;
        }

        if (sep - x0 >= ctl.min_column_width) {
            xs.push_back ({ x0, sep });
            x0 = sep;
        }
    }

    if (width - x0 >= ctl.min_column_width) {
        xs.push_back ({ x0, width });
    }
    else if (!xs.empty ()) {
        //
        // The remainder is too narrow for a column of its own:
        //
        xs.back ().x1 = width;
    }
    else {
        xs = whole_page (width);
    }

    return xs;
}

gap_analysis_t
gap_separator_t::analyze (const words_t& words, double width) const {
    gap_analysis_t result;

    if (words.empty ()) {
        result.boundaries = whole_page (
            usable_width (width) ? width : ctl.default_page_width);
        return result;
    }

    const auto intervals = intervals_of (words);

    std::vector< double > gaps;
    for_each_gap (intervals, [&](double lhs, double rhs) {
        gaps.push_back (rhs - lhs);
    });

    if (gaps.empty ()) {
        result.boundaries = whole_page (width);
        return result;
    }

    const auto& s = result.stats = statistics_of (std::move (gaps));

    for (auto& strategy : strategies_for (ctl)) {
        const auto threshold = strategy.threshold (s, ctl);

        if (!threshold) {
            continue;
        }

        result.tier = strategy.tier;
        result.threshold = *threshold;

        result.separators = separators_of (intervals, *threshold);

        if (!result.separators.empty ()) {
            break;
        }
    }

    error (errDebug,
           "gaps: median={:.1f}, p60={:.1f}, p75={:.1f}, p90={:.1f}, "
           "max={:.1f}, tier={}, threshold={:.1f}, separators={}",
           s.median, s.p60, s.p75, s.p90, s.max, to_string (result.tier),
           result.threshold, result.separators.size ());

    if (result.separators.empty ()) {
        result.boundaries = whole_page (width);
        return result;
    }

    result.merged = merge (result.separators);
    result.boundaries = build (result.merged, width);

    return result;
}

} // namespace columnar
