#include "ImageInput/OpenCVImageLoader.h"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace {

// JPEGs go through IMREAD_COLOR so the EXIF orientation tag is applied.
// Everything else keeps its alpha channel, which IMREAD_COLOR would drop.
int read_flags(const std::string& path)
{
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".jpg" || ext == ".jpeg") return cv::IMREAD_COLOR;
    return cv::IMREAD_UNCHANGED;
}

} // namespace

bool OpenCVImageLoader::init(const std::string& /*config*/)
{
    std::cout << "[OpenCVImageLoader] init()\n";
    return true;
}

std::optional<SourceImage> OpenCVImageLoader::load(const std::string& path)
{
    cv::Mat image;
    try {
        image = cv::imread(path, read_flags(path));
    } catch (const cv::Exception& e) {
        std::cerr << "[OpenCVImageLoader] imread failed for " << path
                  << ": " << e.what() << "\n";
        return std::nullopt;
    }

    if (image.empty()) {
        std::cerr << "[OpenCVImageLoader] Could not decode: " << path << "\n";
        return std::nullopt;
    }

    return SourceImage::from_mat(image, std::filesystem::path(path).filename().string());
}
