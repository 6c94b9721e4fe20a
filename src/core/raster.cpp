/**
 * @file raster.cpp
 * @brief BGRA raster helpers shared by the compositing stages
 */

#include "kickqr/core/raster.hpp"

#include <opencv2/imgproc.hpp>

namespace kickqr {

namespace {

// Intersection of src placed at origin with dst, in dst coordinates
cv::Rect clip_to(const cv::Mat& dst, const cv::Mat& src, cv::Point origin) {
    cv::Rect placed(origin, src.size());
    return placed & cv::Rect(0, 0, dst.cols, dst.rows);
}

}  // namespace

cv::Mat to_bgra_raster(const cv::Mat& image) {
    if (image.empty()) {
        return cv::Mat();
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
            return cv::Mat();
    }

    cv::Mat bgra;
    switch (eight_bit.channels()) {
        case 1:
            cv::cvtColor(eight_bit, bgra, cv::COLOR_GRAY2BGRA);
            break;
        case 3:
            cv::cvtColor(eight_bit, bgra, cv::COLOR_BGR2BGRA);
            break;
        case 4:
            bgra = eight_bit.clone();
            break;
        default:
            return cv::Mat();
    }
    return bgra;
}

void alpha_blend(cv::Mat& dst, const cv::Mat& src, cv::Point origin) {
    CV_Assert(dst.type() == CV_8UC4 && src.type() == CV_8UC4);

    cv::Rect area = clip_to(dst, src, origin);
    if (area.empty()) {
        return;
    }

    const int src_x0 = area.x - origin.x;
    const int src_y0 = area.y - origin.y;

    for (int row = 0; row < area.height; ++row) {
        const auto* s = src.ptr<cv::Vec4b>(src_y0 + row) + src_x0;
        auto* d = dst.ptr<cv::Vec4b>(area.y + row) + area.x;

        for (int col = 0; col < area.width; ++col) {
            const int a = s[col][3];
            if (a == 0) {
                continue;
            }
            if (a == 255) {
                d[col] = s[col];
                continue;
            }
            for (int c = 0; c < 4; ++c) {
                // Rounded integer blend: (s*a + d*(255-a)) / 255
                const int blended = s[col][c] * a + d[col][c] * (255 - a);
                d[col][c] = static_cast<uchar>((blended + 127) / 255);
            }
        }
    }
}

void paste(cv::Mat& dst, const cv::Mat& src, cv::Point origin) {
    CV_Assert(dst.type() == src.type());

    cv::Rect area = clip_to(dst, src, origin);
    if (area.empty()) {
        return;
    }

    cv::Rect src_area(area.x - origin.x, area.y - origin.y, area.width, area.height);
    src(src_area).copyTo(dst(area));
}

}  // namespace kickqr
