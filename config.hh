// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef COLUMNAR_CONFIG_HH
#define COLUMNAR_CONFIG_HH

//------------------------------------------------------------------------
// paper size
//------------------------------------------------------------------------

// default paper width (in points), used when a page carries no words to
// infer its extent from
#ifdef A4_PAPER
#define COLUMNAR_PAPER_WIDTH 595 // ISO A4 (210x297 mm)
#else
#define COLUMNAR_PAPER_WIDTH 612 // American letter (8.5x11")
#endif

#endif // COLUMNAR_CONFIG_HH
