// -*- mode: c++ -*-
// Copyright 2020 Thinkoid, LLC.

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE gutter_scanner

#include <defs.hh>

#include <tuple>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <columnar/Error.hh>
#include <columnar/GutterScanner.hh>

#include "pages.hh"

namespace tt = boost::test_tools;

BOOST_AUTO_TEST_SUITE(gutter)

static const std::vector< std::tuple< size_t, size_t, size_t > >
stable_run_dataset = {
    {  60, 0,  5 },
    {  24, 0,  4 },
    { 120, 0, 10 },
    {  60, 7,  7 }
};

BOOST_DATA_TEST_CASE(
    stable_run_, data::make (stable_run_dataset),
    band_count, stable_run, result) {

    using namespace columnar;

    {
        gutter_control_t ctl;

        ctl.band_count = band_count;
        ctl.stable_run = stable_run;

        BOOST_TEST (result == gutter_scanner_t (ctl).stable_run ());
    }
}

BOOST_AUTO_TEST_CASE(center_of_) {
    using namespace columnar;

    gutter_scanner_t scanner{ gutter_control_t{ } };

    {
        //
        // Anywhere in a clear middle, the middle bin wins:
        //
        const std::vector< double > xs (400, 0.);
        BOOST_TEST (200U == scanner.center_of (xs));
    }

    {
        std::vector< double > xs (400, 1.);
        xs [160] = .5;
        xs [240] = .2;

        BOOST_TEST (240U == scanner.center_of (xs));
    }

    {
        //
        // The minimum outside of the middle quarter is not considered:
        //
        std::vector< double > xs (400, 1.);
        xs [100] = 0;
        xs [170] = .5;

        BOOST_TEST (170U == scanner.center_of (xs));
    }
}

BOOST_AUTO_TEST_CASE(two_columns) {
    using namespace columnar;

    {
        const auto page = test::two_column_page ();

        gutter_scanner_t scanner{ gutter_control_t{ } };
        const auto result = scanner (page.words, *page.width, *page.height);

        BOOST_TEST (result.gutter_x == 300);
        BOOST_TEST (result.clear_bands == 60U);
        BOOST_TEST (result.empty_bands == 0U);
        BOOST_TEST (result.coverage == 1);
        BOOST_TEST (result.header_frac == 0);
    }
}

BOOST_AUTO_TEST_CASE(header) {
    using namespace columnar;

    {
        //
        // The header covers the first three bands, the fourth one is empty:
        //
        const auto page = test::header_page ();

        gutter_scanner_t scanner{ gutter_control_t{ } };
        const auto result = scanner (page.words, *page.width, *page.height);

        BOOST_TEST (result.gutter_x == 294);
        BOOST_TEST (result.clear_bands == 56U);
        BOOST_TEST (result.empty_bands == 1U);

        BOOST_TEST (result.coverage == 56. / 60, tt::tolerance (1e-9));
        BOOST_TEST (result.header_frac == 4. / 60, tt::tolerance (1e-9));
    }
}

BOOST_AUTO_TEST_CASE(cluttered_gutter) {
    using namespace columnar;

    {
        const auto page = test::cluttered_gutter_page ();

        gutter_scanner_t scanner{ gutter_control_t{ } };
        const auto result = scanner (page.words, *page.width, *page.height);

        BOOST_TEST (result.clear_bands == 29U);
        BOOST_TEST (result.coverage == 29. / 60, tt::tolerance (1e-9));
        BOOST_TEST (result.header_frac == 31. / 60, tt::tolerance (1e-9));
    }
}

BOOST_AUTO_TEST_CASE(empty_bands) {
    using namespace columnar;

    {
        //
        // Two columns in the top and bottom quarters of the page; the blank
        // middle counts for nothing and the first run is the top one:
        //
        page_t page;

        for (int i = 0; i < 10; ++i) {
            test::add_word (page.words,  50,   5 + 20 * i, 250,  15 + 20 * i);
            test::add_word (page.words, 350,   5 + 20 * i, 550,  15 + 20 * i);
            test::add_word (page.words,  50, 605 + 20 * i, 250, 615 + 20 * i);
            test::add_word (page.words, 350, 605 + 20 * i, 550, 615 + 20 * i);
        }

        gutter_scanner_t scanner{ gutter_control_t{ } };
        const auto result = scanner (page.words, 600, 800);

        BOOST_TEST (result.clear_bands == 30U);
        BOOST_TEST (result.empty_bands == 30U);
        BOOST_TEST (result.coverage == .5);
        BOOST_TEST (result.header_frac == 0);
    }
}

BOOST_AUTO_TEST_CASE(no_words) {
    using namespace columnar;

    {
        gutter_scanner_t scanner{ gutter_control_t{ } };
        const auto result = scanner ({ }, 600, 800);

        BOOST_TEST (result.coverage == 0);
        BOOST_TEST (result.header_frac == 0);
    }
}

BOOST_AUTO_TEST_CASE(invalid_control) {
    using namespace columnar;

    {
        gutter_control_t ctl;
        ctl.band_count = 0;

        BOOST_CHECK_THROW (gutter_scanner_t{ ctl }, configuration_error);
    }

    {
        gutter_control_t ctl;
        ctl.gutter_zero_max = 1.5;

        BOOST_CHECK_THROW (gutter_scanner_t{ ctl }, configuration_error);
    }
}

BOOST_AUTO_TEST_SUITE_END()
