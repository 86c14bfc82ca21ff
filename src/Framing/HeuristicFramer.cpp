#include "Framing/HeuristicFramer.h"
#include "Viewport/ViewportTransform.h"

#include <algorithm>
#include <cmath>
#include <iostream>

cv::Rect2d HeuristicFramer::subject_rect(int src_w, int src_h)
{
    if (src_w <= 0 || src_h <= 0) {
        return {};
    }

    const double W = src_w;
    const double H = src_h;
    const double r = W / H;

    double face_w = 0.0;
    double face_h = 0.0;
    double face_x = 0.0;
    double face_y = 0.0;

    if (r >= 0.6 && r < 1.5) {
        // Near-square / portrait: head and shoulders in the upper centre.
        face_w = std::min(W * 0.4, H * 0.3);
        face_h = face_w * 1.2;
        face_x = (W - face_w) / 2.0;
        face_y = H * 0.15;
    } else if (r >= 1.5) {
        // Landscape: subject usually sits left of centre.
        face_w = std::min(W * 0.25, H * 0.6);
        face_h = face_w * 1.2;
        face_x = W * 0.3;
        face_y = (H - face_h) / 2.0;
    } else {
        // Very tall.
        face_w = std::min(W * 0.6, H * 0.45);
        face_h = face_w * 1.33;
        face_x = (W - face_w) / 2.0;
        face_y = H * 0.1;
    }

    // Shrink first, then translate, so the rect always fits.
    face_w = std::min(face_w, W);
    face_h = std::min(face_h, H);
    face_x = std::max(0.0, std::min(face_x, W - face_w));
    face_y = std::max(0.0, std::min(face_y, H - face_h));

    return { face_x, face_y, face_w, face_h };
}

ViewportTransform HeuristicFramer::estimate(int src_w, int src_h) const
{
    ViewportTransform t;
    t.is_greyscale = default_greyscale_;

    const cv::Rect2d face = subject_rect(src_w, src_h);
    if (face.width <= 0.0 || face.height <= 0.0) {
        std::cerr << "[HeuristicFramer] Degenerate source " << src_w << "x" << src_h
                  << ", falling back to 100% at (0,0).\n";
        return t;
    }

    // ── Zoom: limiting side of the subject fills the frame ───────────────────
    const double frame_aspect = static_cast<double>(OUTPUT_WIDTH) / OUTPUT_HEIGHT;
    const double face_aspect  = face.width / face.height;

    const double zoom = (face_aspect > frame_aspect)
        ? (OUTPUT_HEIGHT / face.height) * 100.0    // relatively wider: fit height
        : (OUTPUT_WIDTH  / face.width)  * 100.0;   // relatively taller: fit width

    t.zoom_percent = clamp_zoom(static_cast<int>(std::lround(zoom)));

    // ── Pan: subject centre onto frame centre at the final integer zoom ──────
    const double z = zoom_scale(t);
    const cv::Point2d centre(face.x + face.width / 2.0, face.y + face.height / 2.0);

    t.pan = { OUTPUT_WIDTH  / 2.0 - centre.x * z,
              OUTPUT_HEIGHT / 2.0 - centre.y * z };
    return t;
}

ViewportTransform estimate_initial_framing(int src_w, int src_h)
{
    return HeuristicFramer().estimate(src_w, src_h);
}
