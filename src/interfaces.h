#pragma once

#include <opencv2/core.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// ─────────────────────────────────────────────
// Output frame
// ─────────────────────────────────────────────

// Every commit produces a buffer of exactly this size (3:4 portrait).
constexpr int OUTPUT_WIDTH  = 300;
constexpr int OUTPUT_HEIGHT = 400;

constexpr int ZOOM_MIN_PERCENT     = 10;
constexpr int ZOOM_MAX_PERCENT     = 200;
constexpr int ZOOM_DEFAULT_PERCENT = 100;

// ─────────────────────────────────────────────
// Types & Aliases
// ─────────────────────────────────────────────

// Decoded source photograph: 8-bit BGR, never mutated once built.
struct SourceImage {
    cv::Mat               data;        // CV_8UC3
    std::string           name;        // original file name, used for export naming

    int width()  const { return data.cols; }
    int height() const { return data.rows; }

    // Normalizes any 8/16-bit, 1/3/4-channel Mat into an owned BGR copy.
    // Alpha is composited onto white. Returns nullopt for empty input.
    static std::optional<SourceImage> from_mat(const cv::Mat& image,
                                               std::string    name);
};

// Per-image framing: how the source is scaled and placed inside the frame.
struct ViewportTransform {
    int                   zoom_percent = ZOOM_DEFAULT_PERCENT;  // always within [10, 200]
    cv::Point2d           pan          { 0.0, 0.0 };             // output-frame pixels, unbounded
    bool                  is_greyscale = true;
};

// A change requested by the editor. Absolute values are applied before deltas.
struct ViewportUpdate {
    std::optional<int>          zoom_percent;
    std::optional<int>          zoom_delta;
    std::optional<cv::Point2d>  pan;
    std::optional<cv::Point2d>  pan_delta;
    std::optional<bool>         greyscale;
    bool                        toggle_greyscale = false;
};

// Geometry of one commit, all in double precision except dest_px.
struct CropPlan {
    cv::Rect2d            visible_src;   // source region projecting onto the frame
    cv::Rect2d            clamped_src;   // visible_src ∩ [0,W]×[0,H]
    cv::Rect2d            dest;          // where clamped_src lands in the frame
    cv::Rect              dest_px;       // dest snapped to whole pixels, clipped to the frame

    bool empty() const { return dest_px.area() <= 0; }
};

enum class Resampling {
    Nearest,
    Bilinear,
    Area,      // INTER_AREA when shrinking, bilinear when enlarging
};

// Compressed byte stream handed back by an encoder.
struct EncodedImage {
    std::vector<std::uint8_t> bytes;
    std::string               format    = "png";
    std::string               mime_type = "image/png";
};

// Committed output of one rasterization, replaced wholesale on each save.
struct CropResult {
    cv::Mat                               data;       // OUTPUT_WIDTH × OUTPUT_HEIGHT, CV_8UC3
    ViewportTransform                     transform;  // frozen at commit time
    std::uint64_t                         version = 0;
    std::chrono::system_clock::time_point committed_at;
    EncodedImage                          encoded;
    std::string                           handle;     // "<record-id>#v<version>"
};

// ─────────────────────────────────────────────
// I. Source Loader Interface
// ─────────────────────────────────────────────

// Decodes one file from disk into a SourceImage:
// - Still images through GStreamer (decodebin)
// - Still images through OpenCV (imread)

class ISourceLoader {
public:
    virtual ~ISourceLoader() = default;

    // Configure the loader. The config string format depends on the
    // implementation. Returns false on failure.
    virtual bool                       init(const std::string& config) = 0;

    // Decode the file at path. Returns nullopt if it cannot be read or
    // decoded.
    virtual std::optional<SourceImage> load(const std::string& path) = 0;
};

// ─────────────────────────────────────────────
// II. Framing Estimator Interface
// ─────────────────────────────────────────────

// Proposes an initial zoom/pan for a source of the given dimensions.
// Implementations must be deterministic and must not inspect pixels.

class IFramingEstimator {
public:
    virtual ~IFramingEstimator() = default;

    virtual ViewportTransform estimate(int src_w, int src_h) const = 0;
};

// ─────────────────────────────────────────────
// III. Crop Rasterizer Interface
// ─────────────────────────────────────────────

// Turns a source image and a viewport into the fixed-size output frame.
//
// Clipping rule: the part of the viewport that falls outside the source is
// left as white background; the source is never stretched to cover it.

class ICropRasterizer {
public:
    virtual ~ICropRasterizer() = default;

    // Compute the visible, clamped and destination rectangles.
    // Pure utility, owns no state.
    virtual CropPlan        plan(const ViewportTransform& transform,
                                 int src_w,
                                 int src_h) const = 0;

    // Produce an OUTPUT_WIDTH × OUTPUT_HEIGHT BGR buffer. Does not apply the
    // colour transform.
    virtual cv::Mat         rasterize(const SourceImage&       source,
                                      const ViewportTransform& transform) const = 0;
};

// ─────────────────────────────────────────────
// IV. Image Encoder Interface
// ─────────────────────────────────────────────

// Serializes a finished crop into a compressed byte stream. encode() may be
// called from several commit workers at once.

class IImageEncoder {
public:
    virtual ~IImageEncoder() = default;

    // Configure the encoder. The config string format depends on the
    // implementation. Returns false on failure.
    virtual bool                        init(const std::string& config) = 0;

    // Returns nullopt if the encoder could not produce a stream.
    virtual std::optional<EncodedImage> encode(const cv::Mat& image) const = 0;

    virtual std::string                 name() const = 0;
};

// ─────────────────────────────────────────────
// V. Crop Preview Interface
// ─────────────────────────────────────────────

// Displays committed crops in an OpenCV window (cv::imshow). Batch runs
// simply go without one.

class ICropPreview {
public:
    virtual ~ICropPreview() = default;

    virtual bool            init(const std::string& config) = 0;

    // Show one crop. Returns false once the user has closed the preview.
    virtual bool            show(const CropResult& crop) = 0;

    virtual void            close() = 0;

    virtual bool            is_open() const = 0;
};
