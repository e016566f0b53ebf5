// -*- mode: c++; -*-
// Copyright 1997-2014 Glyph & Cog, LLC
// Copyright 2020 Thinkoid, LLC

#ifndef COLUMNAR_COLUMNAR_WORD_HH
#define COLUMNAR_COLUMNAR_WORD_HH

#include <defs.hh>

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <columnar/bbox.hh>

namespace columnar {

//
// A word as delivered by the text extraction: its text is carried along but
// never looked at, font attributes are optional.
//
struct word_t
{
    word_t (std::string textA, const bbox_t& boxA,
            std::optional< double > fontSizeA = { }, bool boldA = false)
        : text_ (std::move (textA)), box_ (normalize (boxA)),
          fontSize_ (fontSizeA), bold_ (boldA)
    { }

    word_t (std::string textA, double x0, double y0, double x1, double y1)
        : word_t (std::move (textA), bbox_t{ x0, y0, x1, y1 })
    { }

    const std::string& text () const { return text_; }

    const bbox_t& box () const { return box_; }

    double x0 () const { return box_.arr [0]; }
    double y0 () const { return box_.arr [1]; }
    double x1 () const { return box_.arr [2]; }
    double y1 () const { return box_.arr [3]; }

    double width () const { return width_of (box_); }
    double height () const { return height_of (box_); }

    double x_center () const { return x_center_of (box_); }
    double y_center () const { return y_center_of (box_); }

    const std::optional< double >& font_size () const { return fontSize_; }
    bool bold () const { return bold_; }

private:
    std::string text_;

    //
    // Normalized on construction, x0 <= x1 and y0 <= y1:
    //
    bbox_t box_;

    std::optional< double > fontSize_;
    bool bold_;
};

inline bool operator== (const word_t& lhs, const word_t& rhs) {
    return
        lhs.text () == rhs.text () &&
        lhs.box () == rhs.box () &&
        lhs.font_size () == rhs.font_size () &&
        lhs.bold () == rhs.bold ();
}

inline bool operator!= (const word_t& lhs, const word_t& rhs) {
    return !(lhs == rhs);
}

using words_t = std::vector< word_t >;

template< typename T >
inline bool lessX (const T& lhs, const T& rhs) {
    return lhs.x0 () < rhs.x0 ();
}

template< typename T >
inline bool lessY (const T& lhs, const T& rhs) {
    return lhs.y0 () < rhs.y0 ();
}

} // namespace columnar

#endif // COLUMNAR_COLUMNAR_WORD_HH
