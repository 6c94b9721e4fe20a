#pragma once

#include "kickqr/core/types.hpp"

#include <opencv2/core.hpp>

namespace kickqr {

/**
 * @brief Opaque BGRA drawing color for an RGB triple
 */
inline cv::Scalar to_bgra(const Color& color) {
    return cv::Scalar(color.b, color.g, color.r, 255);
}

/**
 * @brief Read one pixel of a BGRA raster as an RGB color (alpha ignored)
 */
inline Color color_at(const cv::Mat& bgra, int x, int y) {
    const auto& px = bgra.at<cv::Vec4b>(y, x);
    return Color{px[2], px[1], px[0]};
}

/**
 * @brief Convert any 8/16-bit, 1/3/4-channel image to CV_8UC4
 *
 * Sources without alpha become fully opaque.
 *
 * @return Converted copy, or empty Mat for unsupported layouts
 */
cv::Mat to_bgra_raster(const cv::Mat& image);

/**
 * @brief Alpha-composite src onto dst at origin, in place
 *
 * Uses src's alpha channel as the blend mask for all four channels.
 * Parts of src falling outside dst are clipped. Both images must be
 * CV_8UC4.
 */
void alpha_blend(cv::Mat& dst, const cv::Mat& src, cv::Point origin);

/**
 * @brief Copy src into dst at origin without blending (clipped)
 */
void paste(cv::Mat& dst, const cv::Mat& src, cv::Point origin);

}  // namespace kickqr
