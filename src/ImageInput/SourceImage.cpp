#include "interfaces.h"

#include <opencv2/imgproc.hpp>

#include <iostream>

// ─────────────────────────────────────────────────────────────────────────────
// SourceImage::from_mat
//
// Everything downstream works on 8-bit BGR. Transparent pixels are blended
// onto white, the same background the rasterizer fills with.
// ─────────────────────────────────────────────────────────────────────────────

std::optional<SourceImage> SourceImage::from_mat(const cv::Mat& image,
                                                 std::string    name)
{
    if (image.empty() || image.cols <= 0 || image.rows <= 0) {
        std::cerr << "[SourceImage] Empty image: " << name << "\n";
        return std::nullopt;
    }

    cv::Mat eight_bit;
    switch (image.depth()) {
        case CV_8U:
            eight_bit = image;
            break;
        case CV_16U:
            image.convertTo(eight_bit, CV_8U, 1.0 / 257.0);
            break;
        default:
            std::cerr << "[SourceImage] Unsupported depth " << image.depth()
                      << " in " << name << "\n";
            return std::nullopt;
    }

    cv::Mat bgr;
    switch (eight_bit.channels()) {
        case 1:
            cv::cvtColor(eight_bit, bgr, cv::COLOR_GRAY2BGR);
            break;
        case 3:
            bgr = eight_bit.clone();
            break;
        case 4: {
            bgr.create(eight_bit.rows, eight_bit.cols, CV_8UC3);
            for (int y = 0; y < eight_bit.rows; ++y) {
                const cv::Vec4b* in  = eight_bit.ptr<cv::Vec4b>(y);
                cv::Vec3b*       out = bgr.ptr<cv::Vec3b>(y);
                for (int x = 0; x < eight_bit.cols; ++x) {
                    const double a = in[x][3] / 255.0;
                    for (int c = 0; c < 3; ++c) {
                        out[x][c] = cv::saturate_cast<uchar>(a * in[x][c] + (1.0 - a) * 255.0);
                    }
                }
            }
            break;
        }
        default:
            std::cerr << "[SourceImage] Unsupported channel count "
                      << eight_bit.channels() << " in " << name << "\n";
            return std::nullopt;
    }

    SourceImage source;
    source.data = bgr;
    source.name = std::move(name);
    return source;
}
