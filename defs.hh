// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef COLUMNAR_DEFS_HH
#define COLUMNAR_DEFS_HH

#include <config.hh>

#include <boost/assert.hpp>

#define COLUMNAR_ASSERT BOOST_ASSERT
#define ASSERT COLUMNAR_ASSERT

#endif // COLUMNAR_DEFS_HH
