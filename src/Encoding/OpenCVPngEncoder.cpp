#include "Encoding/OpenCVPngEncoder.h"

#include <opencv2/imgcodecs.hpp>

#include <iostream>
#include <stdexcept>
#include <sstream>

bool OpenCVPngEncoder::init(const std::string& config)
{
    // Parse config: "png:6"
    std::istringstream iss(config);
    std::string format, level;
    std::getline(iss, format, ':');
    std::getline(iss, level, ':');

    if (!format.empty() && format != "png") {
        std::cerr << "[OpenCVPngEncoder] Unsupported format: " << format << "\n";
        return false;
    }

    if (!level.empty()) {
        try {
            compression_ = std::stoi(level);
        } catch (const std::exception&) {
            std::cerr << "[OpenCVPngEncoder] Invalid compression level: " << level << "\n";
            return false;
        }
        if (compression_ < 0 || compression_ > 9) {
            std::cerr << "[OpenCVPngEncoder] Compression must be 0-9, got "
                      << compression_ << "\n";
            return false;
        }
    }

    std::cout << "[OpenCVPngEncoder] PNG, compression " << compression_ << "\n";
    return true;
}

std::optional<EncodedImage> OpenCVPngEncoder::encode(const cv::Mat& image) const
{
    if (image.empty()) {
        std::cerr << "[OpenCVPngEncoder] Received empty image.\n";
        return std::nullopt;
    }

    EncodedImage out;
    const std::vector<int> params{ cv::IMWRITE_PNG_COMPRESSION, compression_ };

    try {
        if (!cv::imencode(".png", image, out.bytes, params)) {
            std::cerr << "[OpenCVPngEncoder] imencode returned false.\n";
            return std::nullopt;
        }
    } catch (const cv::Exception& e) {
        std::cerr << "[OpenCVPngEncoder] imencode failed: " << e.what() << "\n";
        return std::nullopt;
    }

    return out;
}
