#pragma once

#include "interfaces.h"

// ─────────────────────────────────────────────────────────────────────────────
// HeuristicFramer
//
// Geometric guess at where the subject of a portrait sits, based only on the
// source aspect ratio r = W/H:
//
//   0.6 <= r < 1.5   w = min(0.4W, 0.3H),  h = 1.2w,   centred,       top 0.15H
//   r >= 1.5         w = min(0.25W, 0.6H), h = 1.2w,   left 0.3W,     v-centred
//   r <  0.6         w = min(0.6W, 0.45H), h = 1.33w,  centred,       top 0.1H
//
// The zoom makes the subject's limiting side fill the frame; the pan puts its
// centre on the frame centre. Pixels are never inspected.
// ─────────────────────────────────────────────────────────────────────────────

class HeuristicFramer : public IFramingEstimator {
public:
    explicit HeuristicFramer(bool default_greyscale = true)
        : default_greyscale_(default_greyscale) {}

    ViewportTransform estimate(int src_w, int src_h) const override;

    // Candidate subject rectangle, already fitted inside [0,W]×[0,H].
    // Empty for degenerate dimensions.
    static cv::Rect2d subject_rect(int src_w, int src_h);

private:
    bool default_greyscale_;
};

// Convenience wrapper using the default greyscale setting.
ViewportTransform estimate_initial_framing(int src_w, int src_h);
