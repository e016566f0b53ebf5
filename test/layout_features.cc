// -*- mode: c++ -*-
// Copyright 2020 Thinkoid, LLC.

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE layout_features

#include <defs.hh>

#include <sstream>
#include <string>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <columnar/Error.hh>
#include <columnar/LayoutFeatures.hh>

#include "pages.hh"

namespace tt = boost::test_tools;

BOOST_AUTO_TEST_SUITE(layout_features)

BOOST_AUTO_TEST_CASE(names) {
    using namespace columnar;

    {
        const auto& xs = layout_features_t::names ();

        BOOST_TEST (xs.size () == layout_features_t::size);
        BOOST_TEST (std::string (xs [0]) == "num_columns");
        BOOST_TEST (std::string (xs [8]) == "line_density_variance");
    }
}

BOOST_AUTO_TEST_CASE(empty_page) {
    using namespace columnar;

    {
        feature_extractor_t extract;
        const auto x = extract (page_t{ });

        BOOST_TEST (x.num_columns == 1U);
        BOOST_TEST (x.mean_y_overlap == 0);
        BOOST_TEST (x.coverage_gutter == 0);
        BOOST_TEST (x.valley_depth_ratio == 1);
        BOOST_TEST (x.horizontal_lines_count == 0U);

        const auto values = x.values ();
        BOOST_TEST (values [0] == 1);
        BOOST_TEST (values [4] == 1);
    }
}

BOOST_AUTO_TEST_CASE(two_columns) {
    using namespace columnar;

    {
        feature_extractor_t extract;
        const auto x = extract (test::two_column_page ());

        BOOST_TEST (x.num_columns == 2U);
        BOOST_TEST (x.coverage_gutter == 1);
        BOOST_TEST (x.header_fraction == 0);

        //
        // Flat empty stretches between the columns are no valleys:
        //
        BOOST_TEST (x.valley_depth_ratio == 1);

        BOOST_TEST (x.mean_y_overlap == 29. / 6 / 435, tt::tolerance (1e-9));
        BOOST_TEST (x.avg_word_width_ratio == 1. / 3, tt::tolerance (1e-9));

        //
        // Thirty lines of a single word each:
        //
        BOOST_TEST (x.horizontal_lines_count == 0U);
        BOOST_TEST (x.full_width_line_ratio == 0);
        BOOST_TEST (x.line_density_variance == 0);
    }
}

BOOST_AUTO_TEST_CASE(valley_depth) {
    using namespace columnar;

    {
        //
        // Word centers at 201 and 213, six 2pt bins apart; the smoothed
        // profile drops to zero halfway between them:
        //
        page_t page;

        for (int i = 0; i < 2; ++i) {
            test::add_word (page.words, 196, 20 * i, 206, 20 * i + 12);
            test::add_word (page.words, 208, 20 * i, 218, 20 * i + 12);
        }

        page.width = 600;
        page.height = 100;

        feature_extractor_t extract;
        BOOST_TEST (extract (page).valley_depth_ratio == 0);
    }
}

BOOST_AUTO_TEST_CASE(header) {
    using namespace columnar;

    {
        feature_extractor_t extract;
        const auto x = extract (test::header_page ());

        BOOST_TEST (x.horizontal_lines_count == 1U);
        BOOST_TEST (x.full_width_line_ratio == 1. / 31, tt::tolerance (1e-9));

        //
        // One line of four words among thirty single-word lines:
        //
        const double mean = 34. / 31;
        const double variance =
            ((4 - mean) * (4 - mean) + 30 * (1 - mean) * (1 - mean)) / 31;

        BOOST_TEST (x.line_density_variance == variance, tt::tolerance (1e-9));
    }
}

BOOST_AUTO_TEST_CASE(print) {
    using namespace columnar;

    {
        std::stringstream ss;
        ss << layout_features_t{ };

        const auto s = ss.str ();

        BOOST_TEST (s.find ("num_columns: 1") != std::string::npos);
        BOOST_TEST (s.find ("valley_depth_ratio: 1") != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(invalid_control) {
    using namespace columnar;

    {
        layout_control_t ctl;
        ctl.line.y_tolerance = -1;

        BOOST_CHECK_THROW (feature_extractor_t{ ctl }, configuration_error);
    }
}

BOOST_AUTO_TEST_SUITE_END()
