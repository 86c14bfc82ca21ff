#pragma once

#include <opencv2/core.hpp>

// ─────────────────────────────────────────────────────────────────────────────
// Luma greyscale
//
//   grey = 0.299·R + 0.587·G + 0.114·B,   R = G = B = grey
//
// Works on 8-bit BGR and BGRA buffers; alpha is left untouched. The result
// is rounded, so converting an already-grey buffer changes nothing.
// ─────────────────────────────────────────────────────────────────────────────

// Returns false (and leaves the buffer alone) for unsupported types.
bool    to_greyscale_inplace(cv::Mat& image);

// Copying variant; returns an empty Mat for unsupported types.
cv::Mat to_greyscale(const cv::Mat& image);

bool    is_greyscale(const cv::Mat& image);
