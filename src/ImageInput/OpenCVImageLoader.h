#pragma once

#include "interfaces.h"

// ─────────────────────────────────────────────────────────────────────────────
// OpenCVImageLoader
//
// Implementation of ISourceLoader using cv::imread. PNGs are read with
// IMREAD_UNCHANGED so alpha and 16-bit data reach SourceImage::from_mat
// intact. JPEGs are read with IMREAD_COLOR, which applies EXIF orientation.
//
// Config format: unused, pass "".
// ─────────────────────────────────────────────────────────────────────────────

class OpenCVImageLoader : public ISourceLoader {
public:
    bool                       init(const std::string& config) override;
    std::optional<SourceImage> load(const std::string& path) override;
};
