// -*- mode: c++ -*-
// Copyright 2020 Thinkoid, LLC.

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE document

#include <defs.hh>

#include <stdexcept>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <columnar/Document.hh>
#include <columnar/Error.hh>

#include "pages.hh"

namespace {

columnar::pages_t document () {
    using namespace columnar;

    return {
        test::two_column_page (),
        test::single_column_page (),
        test::header_page (),
        test::two_column_page (),
        page_t{ },
        test::cluttered_gutter_page (),
        test::wide_gap_page ()
    };
}

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(document_analyzer)

BOOST_DATA_TEST_CASE(
    page_order, data::make (std::vector< size_t >{ 1, 2, 3, 16 }), threads) {

    using namespace columnar;

    {
        const auto pages = document ();

        document_analyzer_t analyzer{ layout_control_t{ }, threads };
        const auto layouts = analyzer.classify (pages);

        BOOST_TEST_REQUIRE (layouts.size () == pages.size ());

        layout_classifier_t classify;

        for (size_t i = 0; i < pages.size (); ++i) {
            const auto layout = classify (pages [i]);

            BOOST_TEST (layouts [i].type == layout.type);
            BOOST_TEST (layouts [i].boundaries == layout.boundaries);
            BOOST_TEST (layouts [i].confidence == layout.confidence);
        }

        BOOST_TEST (layouts [0].type == layout_type_t::multi);
        BOOST_TEST (layouts [1].type == layout_type_t::single);
        BOOST_TEST (layouts [2].type == layout_type_t::hybrid);
        BOOST_TEST (layouts [4].confidence == 0);
    }
}

BOOST_AUTO_TEST_CASE(empty_document) {
    using namespace columnar;

    {
        document_analyzer_t analyzer{ layout_control_t{ }, 4 };
        const auto layouts = analyzer.classify ({ });

        BOOST_TEST (layouts.empty ());

        const auto structure = analyzer.structure (layouts);

        BOOST_TEST (structure.num_columns == 1U);
        BOOST_TEST (whole_page (612) == structure.boundaries);
    }
}

BOOST_AUTO_TEST_CASE(structure) {
    using namespace columnar;

    {
        const pages_t pages{
            test::two_column_page (),
            test::two_column_page (),
            test::single_column_page ()
        };

        document_analyzer_t analyzer;
        const auto structure = analyzer.structure (analyzer.classify (pages));

        BOOST_TEST (structure.num_columns == 2U);

        const column_boundaries_t expected{ { 0, 300 }, { 300, 600 } };
        BOOST_TEST (expected == structure.boundaries);
    }
}

BOOST_AUTO_TEST_CASE(segment) {
    using namespace columnar;

    {
        const pages_t pages{
            test::two_column_page (),
            test::two_column_page (),
            test::single_column_page ()
        };

        document_analyzer_t analyzer{ layout_control_t{ }, 2 };
        const auto layouts = analyzer.classify (pages);

        {
            const auto xs = analyzer.segment (pages, layouts);

            BOOST_TEST_REQUIRE (xs.size () == 3U);

            BOOST_TEST (xs [0].size () == 2U);
            BOOST_TEST (xs [1].size () == 2U);
            BOOST_TEST (xs [2].size () == 1U);
        }

        {
            //
            // The single-column page is split like the others; all of its
            // words fall left of the split and the empty column is dropped:
            //
            const auto xs = analyzer.segment (pages, layouts, true);

            BOOST_TEST_REQUIRE (xs.size () == 3U);
            BOOST_TEST_REQUIRE (xs [2].size () == 1U);

            BOOST_TEST (xs [2][0].words.size () == 40U);
            BOOST_TEST (xs [2][0].boundary == (column_boundary_t{ 0, 300 }));
        }
    }
}

BOOST_AUTO_TEST_CASE(mismatch) {
    using namespace columnar;

    {
        document_analyzer_t analyzer;

        const pages_t pages{ test::two_column_page () };
        BOOST_CHECK_THROW (analyzer.segment (pages, { }), std::invalid_argument);
    }
}

BOOST_AUTO_TEST_CASE(invalid_control) {
    using namespace columnar;

    {
        BOOST_CHECK_THROW (
            document_analyzer_t (layout_control_t{ }, 0), configuration_error);
    }

    {
        layout_control_t ctl;
        ctl.segment.overlap_threshold = 2;

        BOOST_CHECK_THROW (document_analyzer_t{ ctl }, configuration_error);
    }
}

BOOST_AUTO_TEST_SUITE_END()
