#include "Encoding/GstreamerPngEncoder.h"

#include <cstring>
#include <iostream>
#include <stdexcept>
#include <sstream>

// ─────────────────────────────────────────────────────────────────────────────
// Helper: Build GStreamer pipeline string
// ─────────────────────────────────────────────────────────────────────────────

std::string GstreamerPngEncoder::build_pipeline(int width, int height) const
{
    std::ostringstream oss;

    // appsrc configuration: a single still frame
    oss << "appsrc name=src format=time is-live=false "
        << "caps=video/x-raw,format=BGR,width=" << width
        << ",height=" << height
        << ",framerate=0/1 ! ";

    // Color conversion
    oss << "videoconvert ! ";

    // Encoder
    oss << "pngenc compression-level=" << compression_ << " snapshot=true ! ";

    // Encoded bytes come back to us
    oss << "appsink name=sink sync=false";

    return oss.str();
}

// ─────────────────────────────────────────────────────────────────────────────
// Helper: Copy a BGR Mat into a GstBuffer with 4-byte aligned rows
// ─────────────────────────────────────────────────────────────────────────────

GstBuffer* GstreamerPngEncoder::mat_to_buffer(const cv::Mat& bgr) const
{
    const std::size_t row_bytes = static_cast<std::size_t>(bgr.cols) * 3;
    const std::size_t stride    = GST_ROUND_UP_4(row_bytes);
    const std::size_t size      = stride * static_cast<std::size_t>(bgr.rows);

    GstBuffer* buffer = gst_buffer_new_allocate(nullptr, size, nullptr);
    if (!buffer) return nullptr;

    GstMapInfo map;
    if (!gst_buffer_map(buffer, &map, GST_MAP_WRITE)) {
        gst_buffer_unref(buffer);
        return nullptr;
    }

    for (int y = 0; y < bgr.rows; ++y) {
        std::memcpy(map.data + stride * y, bgr.ptr<uchar>(y), row_bytes);
    }
    gst_buffer_unmap(buffer, &map);

    GST_BUFFER_PTS(buffer)      = 0;
    GST_BUFFER_DURATION(buffer) = GST_CLOCK_TIME_NONE;
    return buffer;
}

// ─────────────────────────────────────────────────────────────────────────────
// Helper: Report why the pipeline produced nothing
// ─────────────────────────────────────────────────────────────────────────────

void GstreamerPngEncoder::report_bus_error(GstBus* bus) const
{
    GstMessage* msg = gst_bus_pop_filtered(
        bus, static_cast<GstMessageType>(GST_MESSAGE_ERROR | GST_MESSAGE_WARNING));

    if (!msg) {
        std::cerr << "[GstreamerPngEncoder] No encoded sample (timeout).\n";
        return;
    }

    GError* err = nullptr;
    gchar*  debug_info = nullptr;
    if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR) {
        gst_message_parse_error(msg, &err, &debug_info);
        std::cerr << "[GstreamerPngEncoder] Error: " << err->message << "\n";
    } else {
        gst_message_parse_warning(msg, &err, &debug_info);
        std::cerr << "[GstreamerPngEncoder] Warning: " << err->message << "\n";
    }
    if (debug_info) {
        std::cerr << "[GstreamerPngEncoder] Debug: " << debug_info << "\n";
    }
    g_clear_error(&err);
    g_free(debug_info);
    gst_message_unref(msg);
}

// ─────────────────────────────────────────────────────────────────────────────
// Public API
// ─────────────────────────────────────────────────────────────────────────────

bool GstreamerPngEncoder::init(const std::string& config)
{
    GError* error = nullptr;
    if (!gst_init_check(nullptr, nullptr, &error)) {
        std::cerr << "[GstreamerPngEncoder] gst_init failed: "
                  << (error ? error->message : "unknown") << "\n";
        g_clear_error(&error);
        return false;
    }

    // Parse config: "6:5000"
    std::istringstream iss(config);
    std::string level, timeout;
    std::getline(iss, level, ':');
    std::getline(iss, timeout, ':');

    try {
        if (!level.empty())   compression_ = std::stoi(level);
        if (!timeout.empty()) timeout_     = static_cast<GstClockTime>(std::stol(timeout)) * GST_MSECOND;
    } catch (const std::exception&) {
        std::cerr << "[GstreamerPngEncoder] Invalid config: " << config << "\n";
        return false;
    }

    if (compression_ < 0 || compression_ > 9) {
        std::cerr << "[GstreamerPngEncoder] Compression must be 0-9, got "
                  << compression_ << "\n";
        return false;
    }

    initialized_ = true;
    std::cout << "[GstreamerPngEncoder] PNG, compression " << compression_ << "\n";
    return true;
}

std::optional<EncodedImage> GstreamerPngEncoder::encode(const cv::Mat& image) const
{
    if (!initialized_) {
        std::cerr << "[GstreamerPngEncoder] encode() before init().\n";
        return std::nullopt;
    }
    if (image.empty() || image.type() != CV_8UC3) {
        std::cerr << "[GstreamerPngEncoder] Expected a non-empty 8-bit BGR image.\n";
        return std::nullopt;
    }

    // ── Create pipeline ──────────────────────────────────────────────────────
    const std::string pipeline_str = build_pipeline(image.cols, image.rows);

    GError* error = nullptr;
    GstElement* pipeline = gst_parse_launch(pipeline_str.c_str(), &error);
    if (error) {
        std::cerr << "[GstreamerPngEncoder] Pipeline parse error: "
                  << error->message << "\n";
        g_error_free(error);
        if (pipeline) gst_object_unref(pipeline);
        return std::nullopt;
    }

    GstElement* appsrc  = gst_bin_get_by_name(GST_BIN(pipeline), "src");
    GstElement* appsink = gst_bin_get_by_name(GST_BIN(pipeline), "sink");
    if (!appsrc || !appsink) {
        std::cerr << "[GstreamerPngEncoder] Could not find appsrc / appsink.\n";
        if (appsrc)  gst_object_unref(appsrc);
        if (appsink) gst_object_unref(appsink);
        gst_object_unref(pipeline);
        return std::nullopt;
    }

    GstBus* bus = gst_element_get_bus(pipeline);
    std::optional<EncodedImage> result;

    if (gst_element_set_state(pipeline, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
        std::cerr << "[GstreamerPngEncoder] Failed to set pipeline to PLAYING.\n";
        report_bus_error(bus);
    } else {
        // ── Push the frame, then EOS ─────────────────────────────────────────
        GstBuffer* buffer = mat_to_buffer(image);
        GstFlowReturn ret = buffer
            ? gst_app_src_push_buffer(GST_APP_SRC(appsrc), buffer)   // takes ownership
            : GST_FLOW_ERROR;
        gst_app_src_end_of_stream(GST_APP_SRC(appsrc));

        if (ret != GST_FLOW_OK) {
            std::cerr << "[GstreamerPngEncoder] Failed to push buffer: " << ret << "\n";
        } else {
            // ── Collect the encoded PNG ──────────────────────────────────────
            GstSample* sample = gst_app_sink_try_pull_sample(GST_APP_SINK(appsink), timeout_);
            if (!sample) {
                report_bus_error(bus);
            } else {
                GstBuffer* out = gst_sample_get_buffer(sample);
                GstMapInfo map;
                if (out && gst_buffer_map(out, &map, GST_MAP_READ)) {
                    EncodedImage encoded;
                    encoded.bytes.assign(map.data, map.data + map.size);
                    gst_buffer_unmap(out, &map);
                    result = std::move(encoded);
                } else {
                    std::cerr << "[GstreamerPngEncoder] Failed to map encoded buffer.\n";
                }
                gst_sample_unref(sample);
            }
        }
    }

    // ── Cleanup ──────────────────────────────────────────────────────────────
    gst_element_set_state(pipeline, GST_STATE_NULL);
    gst_object_unref(bus);
    gst_object_unref(appsink);
    gst_object_unref(appsrc);
    gst_object_unref(pipeline);

    return result;
}
