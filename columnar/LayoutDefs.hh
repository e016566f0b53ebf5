// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef COLUMNAR_COLUMNAR_LAYOUTDEFS_HH
#define COLUMNAR_COLUMNAR_LAYOUTDEFS_HH

#include <defs.hh>

////////////////////////////////////////////////////////////////////////
//
// Default values of the layout analysis settings. These were tuned on resume
// samples and are kept as found; see Control.hh for the settings they feed.
//

// Margin added to the largest word coordinate when a page comes without a
// width or height.
#define pageExtentMargin 10.

////////////////////////////////////////////////////////////////////////
// gap separators

// Minimum horizontal gap, in points, for a gap to separate columns.
#define minGapWidth 20.

// Minimum width, in points, of a column.
#define minColumnWidth 80.

// A page with max{ gap } > aggressiveGapRatio * median{ gap } has one
// dominant gutter; its threshold is lowered to
// max{ minGapWidth * aggressiveGapMul, p60 }.
#define aggressiveGapRatio 3.
#define aggressiveGapMul 0.6

// A page with max{ gap } < uniformGapRatio * median{ gap } is uniformly
// spaced; its threshold is raised to max{ minGapWidth * uniformGapMul, p90 }.
#define uniformGapRatio 2.
#define uniformGapMul 1.5

// Retry threshold, max{ minGapWidth * fallbackGapMul, p60 }, used only when
// no separator was found but max{ gap } > minGapWidth * fallbackGapMul.
#define fallbackGapMul 0.5

////////////////////////////////////////////////////////////////////////
// density histogram

// Minimum number of histogram bins when the bin count follows the page
// width, and points per bin for wider pages.
#define minDensityBins 200
#define pointsPerDensityBin 2.

// Moving-average window and Gaussian standard deviation (in bins).
#define densitySmoothingWindow 5
#define densityGaussianSigma 2.

// Peaks must reach this fraction of the mean density, for pages expected to
// have several columns and for single-column pages, respectively.
#define peakThresholdMulti 0.5
#define peakThresholdSingle 0.8

// Peaks closer than bins / (peakSpacingDivisor * columns) are merged.
#define peakSpacingDivisor 4.

////////////////////////////////////////////////////////////////////////
// gutter bands

#define gutterBandCount 60
#define gutterDensityBins 400
#define gutterSmoothingWindow 7

// Normalized density at or below which the gutter counts as clear.
#define gutterZeroMax 0.05

// Half-width, in bins, of the probe around the gutter center.
#define gutterProbeHalfWidth 10

// The gutter center is searched within bins / 2 +/- bins / gutterSearchDiv.
#define gutterSearchDiv 8

// Length of the run of clear bands that starts the column region is
// max{ gutterMinStableRun, bands / gutterStableRunDiv }.
#define gutterMinStableRun 4
#define gutterStableRunDiv 12

////////////////////////////////////////////////////////////////////////
// y-overlap

// Pair budget for exhaustive scoring, and the size of the word sample used
// beyond it.
#define overlapMaxPairs 10000
#define overlapSampleSize 200
#define overlapSampleSeed 5489U

////////////////////////////////////////////////////////////////////////
// lines

// Words whose vertical centers are within lineYTolerance points share a
// line.
#define lineYTolerance 5.

// A line spanning fullWidthFraction of the page is full-width, and a page
// with horizontalLinesMin such lines has horizontal sections.
#define fullWidthFraction 0.75
#define horizontalLinesMin 3

////////////////////////////////////////////////////////////////////////
// classification

#define coverageMin 0.7
#define headerFracMax 0.05
#define valleyThreshold 0.3

#define valleyWeight 0.40
#define overlapWeight 0.35
#define horizontalWeight 0.25

#define overlapScale 5.
#define hybridScoreMin 0.35

#define singleConfidence 0.9
#define gutterConfidence 0.92
#define fallbackConfidence 0.7
#define fallbackConfidenceSpan 0.25
#define fallbackConfidenceSlope 0.4

////////////////////////////////////////////////////////////////////////
// segmentation

// Minimum fraction of a word's width inside a column for the word to be
// assigned to it.
#define columnOverlapThreshold 0.5

// Columns with fewer words are merged into their nearest neighbor.
#define minWordsPerColumn 10

#endif // COLUMNAR_COLUMNAR_LAYOUTDEFS_HH
