#pragma once

#include "interfaces.h"

#include <string>

// ─────────────────────────────────────────────────────────────────────────────
// OpenCVWindowPreview
//
// Implementation of ICropPreview using OpenCV's cv::imshow(). Shows each
// committed crop in a named window and waits for a key.
//
// Config format: "[window name]:[wait_ms]"
//   Example: "Crop preview:0"   (0 waits for a key press)
// ─────────────────────────────────────────────────────────────────────────────

class OpenCVWindowPreview : public ICropPreview {
public:
    OpenCVWindowPreview() = default;
    ~OpenCVWindowPreview() override { close(); }

    // ── ICropPreview ─────────────────────────────────────────────────────────

    bool init(const std::string& config) override;
    bool show(const CropResult& crop) override;
    void close() override;
    bool is_open() const override;

private:
    std::string window_name_;
    int         wait_ms_ = 0;
    bool        is_open_ = false;
};
