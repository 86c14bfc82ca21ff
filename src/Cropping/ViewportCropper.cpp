#include "Cropping/ViewportCropper.h"
#include "Viewport/ViewportTransform.h"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>

namespace {

const cv::Scalar BACKGROUND_WHITE{ 255, 255, 255 };

// Maps source pixel (x, y) to ROI pixel (scale_x * x + shift_x, scale_y * y + shift_y).
// BORDER_REPLICATE keeps the white fill from bleeding in along the clamped
// edges.
void warp_scaled(const cv::Mat& src, double scale_x, double scale_y,
                 double shift_x, double shift_y, cv::Mat& dst_roi, int interp)
{
    const cv::Mat M = (cv::Mat_<double>(2, 3) <<
                       scale_x, 0.0,     shift_x,
                       0.0,     scale_y, shift_y);
    cv::warpAffine(src, dst_roi, M, dst_roi.size(), interp, cv::BORDER_REPLICATE);
}

} // namespace

CropPlan ViewportCropper::plan(const ViewportTransform& transform,
                               int src_w, int src_h) const
{
    return plan_crop(transform, src_w, src_h, OUTPUT_WIDTH, OUTPUT_HEIGHT);
}

cv::Mat ViewportCropper::rasterize(const SourceImage&       source,
                                   const ViewportTransform& transform) const
{
    // 1. Opaque white frame, fully defined even if nothing gets drawn.
    cv::Mat out(OUTPUT_HEIGHT, OUTPUT_WIDTH, CV_8UC3, BACKGROUND_WHITE);

    if (source.data.empty() || source.data.type() != CV_8UC3) {
        std::cerr << "[ViewportCropper] Source is empty or not 8-bit BGR, "
                     "returning background.\n";
        return out;
    }

    // 2-3. Visible rectangle, clamped, and where it lands in the frame.
    const CropPlan p = plan(transform, source.width(), source.height());
    if (p.empty()) {
        return out;
    }

    // 4. Resample into the destination; the rest keeps the fill.
    cv::Mat dst_roi = out(p.dest_px);
    if (resampling_ == Resampling::Area) {
        resample_area(source.data, transform, p.dest_px, dst_roi);
    } else {
        resample_affine(source.data, transform, p.dest_px, dst_roi);
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
// resample_area
//
// Enlarging is plain bilinear. Shrinking first averages a whole-pixel block
// with INTER_AREA to roughly the target density, then places that
// intermediate with a bilinear warp so fractional pans land exactly where
// the other modes put them.
// ─────────────────────────────────────────────────────────────────────────────

void ViewportCropper::resample_area(const cv::Mat&           src,
                                    const ViewportTransform& transform,
                                    const cv::Rect&          dest_px,
                                    cv::Mat&                 dst_roi) const
{
    const double z = zoom_scale(transform);
    if (z >= 1.0) {
        warp_scaled(src, z, z,
                    transform.pan.x - dest_px.x, transform.pan.y - dest_px.y,
                    dst_roi, cv::INTER_LINEAR);
        return;
    }

    const cv::Point2d a = to_source(transform, { static_cast<double>(dest_px.x),
                                                 static_cast<double>(dest_px.y) });
    const cv::Point2d b = to_source(transform, { static_cast<double>(dest_px.x + dest_px.width),
                                                 static_cast<double>(dest_px.y + dest_px.height) });

    // One pixel of margin so the final bilinear pass never samples a
    // replicated border inside the visible area.
    int sx0 = static_cast<int>(std::floor(a.x)) - 1;
    int sy0 = static_cast<int>(std::floor(a.y)) - 1;
    int sx1 = static_cast<int>(std::ceil(b.x)) + 1;
    int sy1 = static_cast<int>(std::ceil(b.y)) + 1;

    sx0 = std::max(0, std::min(sx0, src.cols - 1));
    sy0 = std::max(0, std::min(sy0, src.rows - 1));
    sx1 = std::max(sx0 + 1, std::min(sx1, src.cols));
    sy1 = std::max(sy0 + 1, std::min(sy1, src.rows));

    const cv::Rect block(sx0, sy0, sx1 - sx0, sy1 - sy0);
    const int iw = std::max(1, static_cast<int>(std::lround(block.width  * z)));
    const int ih = std::max(1, static_cast<int>(std::lround(block.height * z)));

    cv::Mat reduced;
    cv::resize(src(block), reduced, cv::Size(iw, ih), 0.0, 0.0, cv::INTER_AREA);

    // Reduced pixel u has its centre at source x = sx0 + (u + 0.5) / s - 0.5.
    const double s_x = static_cast<double>(iw) / block.width;
    const double s_y = static_cast<double>(ih) / block.height;

    warp_scaled(reduced, z / s_x, z / s_y,
                z * sx0 + z * (0.5 / s_x - 0.5) + transform.pan.x - dest_px.x,
                z * sy0 + z * (0.5 / s_y - 0.5) + transform.pan.y - dest_px.y,
                dst_roi, cv::INTER_LINEAR);
}

// ─────────────────────────────────────────────────────────────────────────────
// resample_affine
//
// Exact forward transform, shifted so dest_px's corner is the ROI origin.
// ─────────────────────────────────────────────────────────────────────────────

void ViewportCropper::resample_affine(const cv::Mat&           src,
                                      const ViewportTransform& transform,
                                      const cv::Rect&          dest_px,
                                      cv::Mat&                 dst_roi) const
{
    const double z = zoom_scale(transform);
    const int interp = (resampling_ == Resampling::Nearest) ? cv::INTER_NEAREST
                                                             : cv::INTER_LINEAR;

    warp_scaled(src, z, z,
                transform.pan.x - dest_px.x, transform.pan.y - dest_px.y,
                dst_roi, interp);
}
