#pragma once

#include "interfaces.h"

// ─────────────────────────────────────────────────────────────────────────────
// Viewport mapping
//
// The viewport places the scaled source with its top-left corner at `pan`
// inside the output frame:
//
//   display = source * zoom/100 + pan
//   source  = (display - pan) / (zoom/100)
//
// Pan is never clamped here. A frame that only partly overlaps the source,
// or misses it entirely, is valid and is resolved by the rasterizer.
// ─────────────────────────────────────────────────────────────────────────────

// Clamp to [ZOOM_MIN_PERCENT, ZOOM_MAX_PERCENT]. Idempotent.
int          clamp_zoom(int zoom_percent);

double       zoom_scale(const ViewportTransform& transform);

cv::Point2d  to_output(const ViewportTransform& transform, cv::Point2d source_pt);
cv::Point2d  to_source(const ViewportTransform& transform, cv::Point2d output_pt);

// Apply an editor update and return the new transform with zoom clamped.
ViewportTransform apply_update(ViewportTransform     transform,
                               const ViewportUpdate& update);

// Visible / clamped / destination rectangles for a source of src_w × src_h
// seen through `transform` in a frame of out_w × out_h.
CropPlan     plan_crop(const ViewportTransform& transform,
                       int src_w, int src_h,
                       int out_w = OUTPUT_WIDTH,
                       int out_h = OUTPUT_HEIGHT);
