#include "Viewport/ViewportTransform.h"

#include <algorithm>
#include <cmath>

int clamp_zoom(int zoom_percent)
{
    return std::max(ZOOM_MIN_PERCENT, std::min(zoom_percent, ZOOM_MAX_PERCENT));
}

double zoom_scale(const ViewportTransform& transform)
{
    return clamp_zoom(transform.zoom_percent) / 100.0;
}

cv::Point2d to_output(const ViewportTransform& transform, cv::Point2d source_pt)
{
    const double z = zoom_scale(transform);
    return { source_pt.x * z + transform.pan.x,
             source_pt.y * z + transform.pan.y };
}

cv::Point2d to_source(const ViewportTransform& transform, cv::Point2d output_pt)
{
    const double z = zoom_scale(transform);
    return { (output_pt.x - transform.pan.x) / z,
             (output_pt.y - transform.pan.y) / z };
}

ViewportTransform apply_update(ViewportTransform     transform,
                               const ViewportUpdate& update)
{
    if (update.zoom_percent) transform.zoom_percent = *update.zoom_percent;
    if (update.zoom_delta) {
        // Summed in 64 bits so an extreme delta still saturates at the bound.
        const long long zoom = static_cast<long long>(clamp_zoom(transform.zoom_percent))
                             + *update.zoom_delta;
        transform.zoom_percent = static_cast<int>(
            std::clamp<long long>(zoom, ZOOM_MIN_PERCENT, ZOOM_MAX_PERCENT));
    }
    transform.zoom_percent = clamp_zoom(transform.zoom_percent);

    if (update.pan)          transform.pan  = *update.pan;
    if (update.pan_delta)    transform.pan += *update.pan_delta;

    if (update.greyscale)        transform.is_greyscale = *update.greyscale;
    if (update.toggle_greyscale) transform.is_greyscale = !transform.is_greyscale;

    return transform;
}

CropPlan plan_crop(const ViewportTransform& transform,
                   int src_w, int src_h,
                   int out_w, int out_h)
{
    const double z = zoom_scale(transform);

    CropPlan plan;

    // ── Frame corners back in source space ───────────────────────────────────
    const cv::Point2d top_left     = to_source(transform, { 0.0, 0.0 });
    const cv::Point2d bottom_right = to_source(transform, { static_cast<double>(out_w),
                                                            static_cast<double>(out_h) });
    plan.visible_src = cv::Rect2d(top_left, bottom_right);

    // ── Clamp to the source bounds ───────────────────────────────────────────
    const double left   = std::max(0.0, top_left.x);
    const double top    = std::max(0.0, top_left.y);
    const double right  = std::min(static_cast<double>(src_w), bottom_right.x);
    const double bottom = std::min(static_cast<double>(src_h), bottom_right.y);

    if (right <= left || bottom <= top) {
        // Viewport entirely off-image: pure background.
        return plan;
    }

    plan.clamped_src = cv::Rect2d(left, top, right - left, bottom - top);

    // ── Same relative shrink on the output side ──────────────────────────────
    plan.dest = cv::Rect2d((left - top_left.x) * z,
                           (top  - top_left.y) * z,
                           plan.clamped_src.width  * z,
                           plan.clamped_src.height * z);

    const int x0 = std::max(0, std::min(static_cast<int>(std::lround(plan.dest.x)), out_w));
    const int y0 = std::max(0, std::min(static_cast<int>(std::lround(plan.dest.y)), out_h));
    const int x1 = std::max(0, std::min(static_cast<int>(std::lround(plan.dest.x + plan.dest.width)),  out_w));
    const int y1 = std::max(0, std::min(static_cast<int>(std::lround(plan.dest.y + plan.dest.height)), out_h));

    if (x1 > x0 && y1 > y0) {
        plan.dest_px = cv::Rect(x0, y0, x1 - x0, y1 - y0);
    }
    return plan;
}
