// -*- mode: c++; -*-
// Copyright 1996-2013 Glyph & Cog, LLC
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <atomic>
#include <cstdio>
#include <mutex>

#include <columnar/Error.hh>

namespace columnar {

const char* const errorCategoryNames [] = {
    "Input Warning", "Config Error", "Geometry Warning", "Internal Error",
    "Debug"
};

namespace {

std::mutex error_mutex;

ErrorCallback error_callback = nullptr;
void* error_callback_data = nullptr;

std::atomic< bool > debug_output{ false };

} // anonymous namespace

void setErrorCallback (ErrorCallback cbk, void* data) {
    std::lock_guard< std::mutex > lock (error_mutex);
    error_callback = cbk;
    error_callback_data = data;
}

void setDebugOutput (bool b) { debug_output = b; }
bool getDebugOutput () { return debug_output; }

void do_error (ErrorCategory category, const std::string& msg) {
    //
    // Pages may be analyzed concurrently; serialize the delivery so that
    // messages never interleave:
    //
    std::lock_guard< std::mutex > lock (error_mutex);

    if (error_callback) {
        (*error_callback) (error_callback_data, category, msg.c_str ());
    }
    else {
        fmt::print (stderr, "{}: {}\n", errorCategoryNames [category], msg);
        fflush (stderr);
    }
}

} // namespace columnar
