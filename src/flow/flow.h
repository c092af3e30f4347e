#pragma once

// Private definitions for the flow module.

//#define FOLIO_DBG_LAYOUT
//#define FOLIO_DBG_SPACING
//#define FOLIO_DBG_FRAGMENTS

#include <algorithm>
#include <cmath>
#include <limits>

#include <folio/main.hpp>
#include <folio/log.h>
#include <folio/strings.hpp>
#include <folio/flow.h>

#ifdef FOLIO_DBG_LAYOUT
 #define DLAYOUT(...)   log.msg(__VA_ARGS__)
#else
 #define DLAYOUT(...)
#endif

#ifdef FOLIO_DBG_SPACING
 #define DSPACING(...)   log.msg(__VA_ARGS__)
#else
 #define DSPACING(...)
#endif

namespace folio {

// Upper bound on page/column advances within a single flow call.  A cursor that never makes progress will trip
// this limit rather than hang the layout.

constexpr int MAXLOOP = 1000;

// Fixed lower bound for image resizing in the metadata envelope.

constexpr double MIN_OBJECT_WIDTH = 20;

// Positions the anchored objects in Anchors that are not yet placed, relative to the cursor's current state.
// FirstLineHeight is the height of the host paragraph's first line, or zero if there is no host paragraph.

extern void place_anchored_objects(page_cursor &Cursor, float_query &Floats, anchors_context &Anchors, double FirstLineHeight);

inline double finite_or(double Value, double Default = 0) { return std::isfinite(Value) ? Value : Default; }

} // namespace folio
