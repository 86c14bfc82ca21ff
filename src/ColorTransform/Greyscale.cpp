#include "ColorTransform/Greyscale.h"

#include <iostream>

namespace {

bool supported(const cv::Mat& image)
{
    return !image.empty()
        && image.depth() == CV_8U
        && (image.channels() == 3 || image.channels() == 4);
}

} // namespace

bool to_greyscale_inplace(cv::Mat& image)
{
    if (!supported(image)) {
        std::cerr << "[Greyscale] Unsupported buffer (channels="
                  << image.channels() << ", depth=" << image.depth() << ").\n";
        return false;
    }

    const int cn = image.channels();
    for (int y = 0; y < image.rows; ++y) {
        uchar* px = image.ptr<uchar>(y);
        for (int x = 0; x < image.cols; ++x, px += cn) {
            // OpenCV order: B, G, R[, A]
            const uchar grey = cv::saturate_cast<uchar>(
                0.299 * px[2] + 0.587 * px[1] + 0.114 * px[0]);
            px[0] = grey;
            px[1] = grey;
            px[2] = grey;
        }
    }
    return true;
}

cv::Mat to_greyscale(const cv::Mat& image)
{
    cv::Mat copy = image.clone();
    if (!to_greyscale_inplace(copy)) {
        return {};
    }
    return copy;
}

bool is_greyscale(const cv::Mat& image)
{
    if (!supported(image)) return false;

    const int cn = image.channels();
    for (int y = 0; y < image.rows; ++y) {
        const uchar* px = image.ptr<uchar>(y);
        for (int x = 0; x < image.cols; ++x, px += cn) {
            if (px[0] != px[1] || px[1] != px[2]) return false;
        }
    }
    return true;
}
