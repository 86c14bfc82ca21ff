#include "ImageInput/GstreamerImageLoader.h"

#include <filesystem>
#include <iostream>
#include <stdexcept>

// ─────────────────────────────────────────────────────────────────────────────
// Public API
// ─────────────────────────────────────────────────────────────────────────────

bool GstreamerImageLoader::init(const std::string& config)
{
    GError* error = nullptr;
    if (!gst_init_check(nullptr, nullptr, &error)) {
        std::cerr << "[GstreamerImageLoader] gst_init failed: "
                  << (error ? error->message : "unknown") << "\n";
        g_clear_error(&error);
        return false;
    }

    if (!config.empty()) {
        try {
            const long ms = std::stol(config);
            if (ms <= 0) {
                std::cerr << "[GstreamerImageLoader] Timeout must be positive: " << config << "\n";
                return false;
            }
            timeout_ = static_cast<GstClockTime>(ms) * GST_MSECOND;
        } catch (const std::exception&) {
            std::cerr << "[GstreamerImageLoader] Invalid timeout: " << config << "\n";
            return false;
        }
    }

    initialized_ = true;
    std::cout << "[GstreamerImageLoader] Initialized (timeout "
              << timeout_ / GST_MSECOND << " ms).\n";
    return true;
}

std::optional<SourceImage> GstreamerImageLoader::load(const std::string& path)
{
    if (!initialized_) {
        std::cerr << "[GstreamerImageLoader] load() before init().\n";
        return std::nullopt;
    }

    // ── Build pipeline ───────────────────────────────────────────────────────
    GError* error = nullptr;
    GstElement* pipeline = gst_parse_launch(pipeline_description().c_str(), &error);

    if (error) {
        std::cerr << "[GstreamerImageLoader] Pipeline parse error: "
                  << error->message << "\n";
        g_error_free(error);
        if (pipeline) gst_object_unref(pipeline);
        return std::nullopt;
    }

    GstElement* filesrc = gst_bin_get_by_name(GST_BIN(pipeline), "src");
    GstElement* appsink = gst_bin_get_by_name(GST_BIN(pipeline), "sink");
    if (!filesrc || !appsink) {
        std::cerr << "[GstreamerImageLoader] Could not find 'src' / 'sink' elements.\n";
        if (filesrc) gst_object_unref(filesrc);
        if (appsink) gst_object_unref(appsink);
        gst_object_unref(pipeline);
        return std::nullopt;
    }

    // Set the location as a property so paths never need quoting.
    g_object_set(G_OBJECT(filesrc), "location", path.c_str(), nullptr);
    g_object_set(G_OBJECT(appsink),
                 "emit-signals", FALSE,
                 "sync",         FALSE,
                 nullptr);

    GstBus* bus = gst_element_get_bus(pipeline);

    std::optional<SourceImage> result;

    // ── Run until the single decoded sample arrives ──────────────────────────
    if (gst_element_set_state(pipeline, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
        std::cerr << "[GstreamerImageLoader] Failed to set pipeline to PLAYING.\n";
        report_bus_error(bus, path);
    } else {
        GstSample* sample = gst_app_sink_try_pull_sample(GST_APP_SINK(appsink), timeout_);
        if (!sample) {
            report_bus_error(bus, path);
        } else {
            try {
                cv::Mat image = sample_to_mat(sample);
                result = SourceImage::from_mat(image,
                                               std::filesystem::path(path).filename().string());
            } catch (const std::exception& e) {
                std::cerr << "[GstreamerImageLoader] Frame decode error: " << e.what() << "\n";
            }
            gst_sample_unref(sample);
        }
    }

    // ── Teardown ─────────────────────────────────────────────────────────────
    gst_element_set_state(pipeline, GST_STATE_NULL);
    gst_object_unref(bus);
    gst_object_unref(appsink);
    gst_object_unref(filesrc);
    gst_object_unref(pipeline);

    return result;
}

// ─────────────────────────────────────────────────────────────────────────────
// Private helpers
// ─────────────────────────────────────────────────────────────────────────────

std::string GstreamerImageLoader::pipeline_description()
{
    return
        "filesrc name=src ! "
        "decodebin ! "
        "videoconvert ! "
        "videoflip video-direction=auto ! "     // honours the image-orientation tag
        "videoconvert ! "
        "video/x-raw,format=BGR ! "
        "appsink name=sink";
}

cv::Mat GstreamerImageLoader::sample_to_mat(GstSample* sample) const
{
    GstBuffer*    buffer    = gst_sample_get_buffer(sample);
    GstCaps*      caps      = gst_sample_get_caps(sample);
    if (!buffer || !caps) {
        throw std::runtime_error("Sample without buffer or caps.");
    }
    GstStructure* structure = gst_caps_get_structure(caps, 0);

    int width  = 0;
    int height = 0;
    gst_structure_get_int(structure, "width",  &width);
    gst_structure_get_int(structure, "height", &height);

    if (width <= 0 || height <= 0) {
        throw std::runtime_error("Invalid frame dimensions from caps.");
    }

    GstMapInfo map{};
    if (!gst_buffer_map(buffer, &map, GST_MAP_READ)) {
        throw std::runtime_error("Failed to map GstBuffer.");
    }

    // Raw BGR rows are padded to a multiple of 4 bytes.
    const std::size_t stride = map.size / static_cast<std::size_t>(height);
    if (stride < static_cast<std::size_t>(width) * 3) {
        gst_buffer_unmap(buffer, &map);
        throw std::runtime_error("Buffer smaller than caps imply.");
    }

    cv::Mat view(height, width, CV_8UC3, map.data, stride);
    cv::Mat image = view.clone();           // deep copy before we unmap

    gst_buffer_unmap(buffer, &map);
    return image;
}

void GstreamerImageLoader::report_bus_error(GstBus* bus, const std::string& path) const
{
    GstMessage* msg = gst_bus_pop_filtered(
        bus, static_cast<GstMessageType>(GST_MESSAGE_ERROR | GST_MESSAGE_EOS));

    if (!msg) {
        std::cerr << "[GstreamerImageLoader] Timed out decoding " << path << "\n";
        return;
    }

    if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR) {
        GError* err       = nullptr;
        gchar*  debug_str = nullptr;
        gst_message_parse_error(msg, &err, &debug_str);
        std::cerr << "[GstreamerImageLoader] Bus error on " << path << ": " << err->message
                  << "\n  Debug: " << (debug_str ? debug_str : "none") << "\n";
        g_error_free(err);
        g_free(debug_str);
    } else {
        std::cerr << "[GstreamerImageLoader] EOS before any frame: " << path << "\n";
    }
    gst_message_unref(msg);
}
