// -*- mode: c++; -*-
// Copyright 1996-2013 Glyph & Cog, LLC
// Copyright 2020 Thinkoid, LLC

#ifndef COLUMNAR_COLUMNAR_ERROR_HH
#define COLUMNAR_COLUMNAR_ERROR_HH

#include <defs.hh>

#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace columnar {

enum ErrorCategory {
    errInput, // page input violates the word/page contract; a default
              //   layout was produced instead
    errConfig, // error in a control setting or a control stream
    errGeometry, // degenerate boundaries were repaired
    errInternal, // internal error, malfunction within the library
    errDebug // trace of the analysis, off unless enabled
};

extern const char* const errorCategoryNames [];

//
// Thrown when a control structure fails validation, i.e., before any page is
// looked at:
//
struct configuration_error : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

using ErrorCallback = void (*) (void*, ErrorCategory, const char*);

//
// Install a callback receiving every formatted message; a null callback
// restores the default, which prints to stderr:
//
void setErrorCallback (ErrorCallback cbk, void* data);

//
// Enable or disable the delivery of errDebug messages:
//
void setDebugOutput (bool);
bool getDebugOutput ();

void do_error (ErrorCategory, const std::string&);

template< typename... Args >
inline void
error (ErrorCategory category, fmt::format_string< Args... > msg,
       Args&&... args) {
    if (category == errDebug && !getDebugOutput ()) {
        return;
    }

    do_error (category, fmt::format (msg, std::forward< Args > (args)...));
}

} // namespace columnar

#endif // COLUMNAR_COLUMNAR_ERROR_HH
