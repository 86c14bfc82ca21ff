#pragma once

#include "interfaces.h"

#include <gst/gst.h>
#include <gst/app/gstappsrc.h>
#include <gst/app/gstappsink.h>

#include <string>

// ─────────────────────────────────────────────────────────────────────────────
// GstreamerPngEncoder
//
// Implementation of IImageEncoder using GStreamer. Each encode() pushes one
// frame through its own short-lived pipeline:
//
//   appsrc ! videoconvert ! pngenc snapshot=true ! appsink
//
// Config format: "[compression]:[timeout_ms]"
//   Example: "6:5000"
//
// If compression is empty, defaults to 6; if timeout is empty, 5000 ms.
// ─────────────────────────────────────────────────────────────────────────────

class GstreamerPngEncoder : public IImageEncoder {
public:
    bool                        init(const std::string& config) override;
    std::optional<EncodedImage> encode(const cv::Mat& image) const override;
    std::string                 name() const override { return "gstreamer-png"; }

private:
    int          compression_ = 6;
    GstClockTime timeout_     = 5 * GST_SECOND;
    bool         initialized_ = false;

    // ── Helpers ──────────────────────────────────────────────────────────────
    std::string build_pipeline(int width, int height) const;
    GstBuffer*  mat_to_buffer(const cv::Mat& bgr) const;
    void        report_bus_error(GstBus* bus) const;
};
