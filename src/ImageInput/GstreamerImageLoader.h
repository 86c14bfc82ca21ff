#pragma once

#include "interfaces.h"

#include <gst/gst.h>
#include <gst/app/gstappsink.h>

#include <string>

// ─────────────────────────────────────────────────────────────────────────────
// GstreamerImageLoader
//
// Implementation of ISourceLoader using a one-shot GStreamer pipeline:
//
//   filesrc ! decodebin ! videoconvert ! videoflip video-direction=auto
//         ! videoconvert ! video/x-raw,format=BGR ! appsink
//
// decodebin picks jpegdec / pngdec; videoflip rotates according to the
// image-orientation tag when the decoder publishes one. A still image yields
// exactly one sample followed by EOS. A fresh pipeline is built per load() so
// nothing is shared between calls.
//
// Config format: "[timeout_ms]" (e.g. "5000"). Empty → 5000 ms.
// ─────────────────────────────────────────────────────────────────────────────

class GstreamerImageLoader : public ISourceLoader {
public:
    bool                       init(const std::string& config) override;
    std::optional<SourceImage> load(const std::string& path) override;

private:
    GstClockTime timeout_ = 5 * GST_SECOND;
    bool         initialized_ = false;

    // ── Helpers ──────────────────────────────────────────────────────────────
    static std::string pipeline_description();
    cv::Mat            sample_to_mat(GstSample* sample) const;
    void               report_bus_error(GstBus* bus, const std::string& path) const;
};
