// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <cmath>
#include <iostream>

#include <columnar/Line.hh>

#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/algorithm/stable_sort.hpp>
using namespace ranges;

namespace columnar {

std::ostream& operator<< (std::ostream& ss, const line_t& line) {
    ss << "line at " << line.center << " " << line.box << ":";

    for (auto& word : line.words) {
        ss << " " << word.text ();
    }

    return ss;
}

lines_t group_lines (const words_t& words, double y_tolerance) {
    lines_t lines;

    for (auto& word : words) {
        const auto y = word.y_center ();

        auto iter = find_if (lines, [&](auto& line) {
            return std::fabs (y - line.center) <= y_tolerance;
        });

        if (iter == lines.end ()) {
            lines.push_back ({ y, word.box (), { word } });
        }
        else {
            iter->box = coalesce (iter->box, word.box ());
            iter->words.push_back (word);
        }
    }

    for (auto& line : lines) {
        stable_sort (line.words, lessX< word_t >);
    }

    stable_sort (lines, [](auto& lhs, auto& rhs) {
        return lhs.center < rhs.center;
    });

    return lines;
}

full_width_detector_t::full_width_detector_t (const line_control_t& arg)
    : ctl (arg) {
    validate (ctl);
}

full_width_lines_t
full_width_detector_t::operator() (const lines_t& lines, double width) const {
    full_width_lines_t result;

    result.count = size_t (count_if (lines, [&](auto& line) {
        return is_full_width (line, width);
    }));

    result.has_horizontal = result.count >= ctl.horizontal_lines_min;

    return result;
}

} // namespace columnar
