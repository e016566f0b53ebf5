// -*- mode: c++ -*-
// Copyright 2020 Thinkoid, LLC.

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE gap_separator

#include <defs.hh>

#include <tuple>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <columnar/Error.hh>
#include <columnar/GapSeparator.hh>

#include "pages.hh"

BOOST_TEST_DONT_PRINT_LOG_VALUE (std::vector< double >)

BOOST_AUTO_TEST_SUITE(gap_separator)

static const std::vector<
    std::tuple< std::vector< double >, double, double, double, double, double >
    >
statistics_dataset = {
    { { 5 },                       5,  5,  5,  5,   5 },
    { { 15, 5 },                  15, 15, 15, 15,  15 },
    { { 5, 5, 5, 5, 200 },         5,  5,  5, 200, 200 },
    { { 1, 2, 3, 4, 5, 6, 7, 8, 9, 10 }, 6, 7, 8, 10, 10 }
};

BOOST_DATA_TEST_CASE(
    statistics_, data::make (statistics_dataset),
    gaps, median, p60, p75, p90, max) {

    using namespace columnar;

    {
        const auto s = statistics_of (gaps);

        BOOST_TEST (s.count == gaps.size ());
        BOOST_TEST (s.median == median);
        BOOST_TEST (s.p60 == p60);
        BOOST_TEST (s.p75 == p75);
        BOOST_TEST (s.p90 == p90);
        BOOST_TEST (s.max == max);
    }
}

BOOST_AUTO_TEST_CASE(gaps_of_) {
    using namespace columnar;

    {
        words_t words;

        test::add_word (words, 100, 0, 140, 10);
        test::add_word (words,  10, 0,  50, 10);
        test::add_word (words,  30, 0,  60, 10);
        test::add_word (words, 140, 0, 180, 10);

        //
        // (10,50) (30,60) (100,140) (140,180): the overlapping and the
        // touching pairs yield nothing:
        //
        const auto gaps = gaps_of (words);

        BOOST_TEST_REQUIRE (1U == gaps.size ());
        BOOST_TEST (40 == gaps [0]);
    }
}

BOOST_AUTO_TEST_CASE(no_words) {
    using namespace columnar;

    {
        gap_separator_t gaps{ gap_control_t{ } };

        BOOST_TEST (whole_page (500) == gaps ({ }, 500));
        BOOST_TEST (whole_page (612) == gaps ({ }, 0));
    }
}

BOOST_AUTO_TEST_CASE(no_gaps) {
    using namespace columnar;

    {
        words_t words;
        test::add_word (words, 50, 0, 550, 10);
        test::add_word (words, 60, 20, 540, 30);

        gap_separator_t gaps{ gap_control_t{ } };
        const auto result = gaps.analyze (words, 600);

        BOOST_TEST (result.tier == gap_tier_t::none);
        BOOST_TEST (result.separators.empty ());
        BOOST_TEST (whole_page (600) == result.boundaries);
    }
}

BOOST_AUTO_TEST_CASE(aggressive_tier) {
    using namespace columnar;

    {
        const auto page = test::wide_gap_page ();

        gap_separator_t gaps{ gap_control_t{ } };
        const auto result = gaps.analyze (page.words, *page.width);

        BOOST_TEST (result.stats.count == 49U);
        BOOST_TEST (result.stats.median == 5);
        BOOST_TEST (result.stats.max == 200);

        BOOST_TEST (result.tier == gap_tier_t::aggressive);
        BOOST_TEST (result.threshold == 12, boost::test_tools::tolerance (1e-9));

        BOOST_TEST_REQUIRE (result.separators.size () == 1U);
        BOOST_TEST (result.separators [0] == 300);

        const column_boundaries_t expected{ { 0, 300 }, { 300, 700 } };
        BOOST_TEST (expected == result.boundaries);
    }
}

BOOST_AUTO_TEST_CASE(uniform_tier) {
    using namespace columnar;

    {
        const auto page = test::two_column_page ();

        gap_separator_t gaps{ gap_control_t{ } };
        const auto result = gaps.analyze (page.words, *page.width);

        BOOST_TEST (result.tier == gap_tier_t::uniform);
        BOOST_TEST (result.threshold == 100);

        const column_boundaries_t expected{ { 0, 300 }, { 300, 600 } };
        BOOST_TEST (expected == result.boundaries);
    }
}

BOOST_AUTO_TEST_CASE(fallback_tier) {
    using namespace columnar;

    {
        //
        // Gaps of 5 and 15 are too uniform for the uniform tier threshold,
        // the retry splits at the wider one:
        //
        const auto page = test::header_page ();

        gap_separator_t gaps{ gap_control_t{ } };
        const auto result = gaps.analyze (page.words, *page.width);

        BOOST_TEST (result.tier == gap_tier_t::fallback);
        BOOST_TEST (result.threshold == 15);

        const column_boundaries_t expected{ { 0, 322.5 }, { 322.5, 600 } };
        BOOST_TEST (expected == result.boundaries);
    }
}

//
// Gaps between 20pt words on a 300pt line, minimum gap width, threshold and
// split; the largest gap is 2 or 3 times the median, both ends included:
//
static const std::vector<
    std::tuple< std::vector< double >, double, double, double >
    >
standard_dataset = {
    { { 10, 10, 10, 20, 30 }, 20, 20, 120 },
    { { 10, 10, 10, 20, 30 }, 15, 20, 120 },
    { { 10, 10, 10, 25, 30 }, 20, 25, 122.5 },
    { { 10, 10, 10, 10, 20 }, 20, 20, 150 }
};

BOOST_DATA_TEST_CASE(
    standard_tier, data::make (standard_dataset),
    gaps, min_gap_width, threshold, split) {

    using namespace columnar;

    {
        words_t words;

        double x = 0;
        test::add_word (words, x, 0, x + 20, 10);

        for (auto gap : gaps) {
            x += 20 + gap;
            test::add_word (words, x, 0, x + 20, 10);
        }

        gap_control_t ctl;
        ctl.min_gap_width = min_gap_width;

        gap_separator_t separator{ ctl };
        const auto result = separator.analyze (words, 300);

        BOOST_TEST (result.stats.median == 10);

        BOOST_TEST (result.tier == gap_tier_t::standard);
        BOOST_TEST (result.threshold == threshold);

        BOOST_TEST_REQUIRE (result.merged.size () == 1U);
        BOOST_TEST (result.merged [0] == split);

        const column_boundaries_t expected{ { 0, split }, { split, 300 } };
        BOOST_TEST (expected == result.boundaries);
    }
}

BOOST_AUTO_TEST_CASE(fixed_threshold) {
    using namespace columnar;

    {
        words_t words;

        test::add_word (words,  20, 0, 150, 10);
        test::add_word (words, 175, 0, 300, 10);
        test::add_word (words, 310, 0, 580, 10);

        gap_control_t ctl;
        ctl.adaptive = false;

        gap_separator_t gaps{ ctl };
        const auto result = gaps.analyze (words, 600);

        BOOST_TEST (result.tier == gap_tier_t::fixed);
        BOOST_TEST (result.threshold == 20);

        const column_boundaries_t expected{ { 0, 162.5 }, { 162.5, 600 } };
        BOOST_TEST (expected == result.boundaries);
    }
}

BOOST_AUTO_TEST_CASE(merge_close_separators) {
    using namespace columnar;

    {
        //
        // Separators at 100, 140 and 400; the one at 140 is too close to
        // the one at 100:
        //
        words_t words;

        test::add_word (words,   0, 0,  80, 10);
        test::add_word (words, 120, 0, 130, 10);
        test::add_word (words, 150, 0, 380, 10);
        test::add_word (words, 420, 0, 590, 10);

        gap_control_t ctl;
        ctl.adaptive = false;

        gap_separator_t gaps{ ctl };
        const auto result = gaps.analyze (words, 600);

        const std::vector< double > separators{ 100, 140, 400 };
        const std::vector< double > merged{ 100, 400 };

        BOOST_TEST (separators == result.separators);
        BOOST_TEST (merged == result.merged);

        const column_boundaries_t expected{
            { 0, 100 }, { 100, 400 }, { 400, 600 }
        };

        BOOST_TEST (expected == result.boundaries);
    }
}

BOOST_AUTO_TEST_CASE(narrow_remainder) {
    using namespace columnar;

    {
        //
        // A separator at 550 would leave a 50pt column:
        //
        words_t words;

        test::add_word (words,  10, 0, 290, 10);
        test::add_word (words, 310, 0, 540, 10);
        test::add_word (words, 560, 0, 590, 10);

        gap_control_t ctl;
        ctl.adaptive = false;

        gap_separator_t gaps{ ctl };
        const auto result = gaps.analyze (words, 600);

        const column_boundaries_t expected{ { 0, 300 }, { 300, 600 } };
        BOOST_TEST (expected == result.boundaries);
        BOOST_TEST (is_partition (result.boundaries, 600));
    }
}

BOOST_AUTO_TEST_CASE(invalid_control) {
    using namespace columnar;

    {
        gap_control_t ctl;
        ctl.min_column_width = 0;

        BOOST_CHECK_THROW (gap_separator_t{ ctl }, configuration_error);
    }

    {
        gap_control_t ctl;
        ctl.min_gap_width = -1;

        BOOST_CHECK_THROW (gap_separator_t{ ctl }, configuration_error);
    }
}

BOOST_AUTO_TEST_SUITE_END()
