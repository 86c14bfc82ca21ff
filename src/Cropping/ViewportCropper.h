#pragma once

#include "interfaces.h"

// ─────────────────────────────────────────────────────────────────────────────
// ViewportCropper
//
// Buffer-to-buffer implementation of ICropRasterizer. No display surface is
// involved, so it runs headless and gives identical output for identical
// inputs.
// ─────────────────────────────────────────────────────────────────────────────

class ViewportCropper : public ICropRasterizer {
public:
    explicit ViewportCropper(Resampling resampling = Resampling::Area)
        : resampling_(resampling) {}

    CropPlan plan(const ViewportTransform& transform,
                  int src_w, int src_h) const override;

    cv::Mat  rasterize(const SourceImage&       source,
                       const ViewportTransform& transform) const override;

    Resampling resampling() const { return resampling_; }

private:
    Resampling resampling_;

    void resample_area(const cv::Mat&           src,
                       const ViewportTransform& transform,
                       const cv::Rect&          dest_px,
                       cv::Mat&                 dst_roi) const;

    void resample_affine(const cv::Mat&           src,
                         const ViewportTransform& transform,
                         const cv::Rect&          dest_px,
                         cv::Mat&                 dst_roi) const;
};
