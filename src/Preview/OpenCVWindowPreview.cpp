#include "Preview/OpenCVWindowPreview.h"

#include <opencv2/highgui.hpp>

#include <iostream>
#include <sstream>
#include <stdexcept>

bool OpenCVWindowPreview::init(const std::string& config)
{
    if (is_open_) {
        std::cerr << "[OpenCVWindowPreview] Already initialized.\n";
        return false;
    }

    // Parse config: "Crop preview:0"
    std::istringstream iss(config);
    std::string name, wait;
    std::getline(iss, name, ':');
    std::getline(iss, wait, ':');

    window_name_ = name.empty() ? "Crop preview" : name;
    if (!wait.empty()) {
        try {
            wait_ms_ = std::stoi(wait);
        } catch (const std::exception&) {
            std::cerr << "[OpenCVWindowPreview] Invalid wait: " << wait << "\n";
            return false;
        }
    }

    try {
        cv::namedWindow(window_name_, cv::WINDOW_AUTOSIZE);
    } catch (const cv::Exception& e) {
        std::cerr << "[OpenCVWindowPreview] Cannot open window: " << e.what() << "\n";
        return false;
    }

    is_open_ = true;
    std::cout << "[OpenCVWindowPreview] Window created: " << window_name_ << "\n";
    return true;
}

bool OpenCVWindowPreview::show(const CropResult& crop)
{
    if (!is_open_) {
        return false;
    }

    if (crop.data.empty()) {
        std::cerr << "[OpenCVWindowPreview] Received empty crop.\n";
        return false;
    }

    cv::setWindowTitle(window_name_, window_name_ + " - " + crop.handle);
    cv::imshow(window_name_, crop.data);

    const int key = cv::waitKey(wait_ms_);

    // 'q' ends the preview; the batch keeps going without it.
    if (key == 'q' || key == 'Q') {
        close();
        return false;
    }

    // Check if the window still exists
    try {
        if (cv::getWindowProperty(window_name_, cv::WND_PROP_VISIBLE) < 1) {
            is_open_ = false;
            return false;
        }
    } catch (const cv::Exception& e) {
        std::cerr << "[OpenCVWindowPreview] Window query failed: " << e.what() << "\n";
        is_open_ = false;
        return false;
    }

    return true;
}

void OpenCVWindowPreview::close()
{
    if (is_open_) {
        cv::destroyWindow(window_name_);
        is_open_ = false;
        std::cout << "[OpenCVWindowPreview] Window closed: " << window_name_ << "\n";
    }
}

bool OpenCVWindowPreview::is_open() const
{
    return is_open_;
}
