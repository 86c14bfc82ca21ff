#pragma once

#include "interfaces.h"

// ─────────────────────────────────────────────────────────────────────────────
// OpenCVPngEncoder
//
// Implementation of IImageEncoder using cv::imencode(".png").
//
// Config format: "png:[compression]"
//   Example: "png:6"   (compression 0-9, default 6)
// ─────────────────────────────────────────────────────────────────────────────

class OpenCVPngEncoder : public IImageEncoder {
public:
    bool                        init(const std::string& config) override;
    std::optional<EncodedImage> encode(const cv::Mat& image) const override;
    std::string                 name() const override { return "opencv-png"; }

    int compression() const { return compression_; }

private:
    int compression_ = 6;
};
