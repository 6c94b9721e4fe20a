#pragma once

#include "kickqr/core/error.hpp"
#include "kickqr/core/logger.hpp"
#include "kickqr/core/types.hpp"

#include <string>

namespace kickqr {

/**
 * @brief Logo placement settings
 */
struct LogoStyle {
    double relative_size = 0.7;     // Logo longer side / emblem diameter
    double contrast = 1.1;          // 1.0 = unchanged
};

/**
 * @brief Load a logo file as a BGRA raster
 *
 * @return Logo raster, ResourceNotFound if the file does not exist, or
 *         DecodeError if it cannot be decoded as an image
 */
Result<cv::Mat> load_logo(const std::string& path, const DiagnosticSink& log);

/**
 * @brief Scales, enhances and blends a logo onto the emblem
 */
class LogoCompositor {
public:
    LogoCompositor(const LogoStyle& style, DiagnosticSink log);

    /**
     * @brief Composite the logo at the emblem center
     *
     * The logo keeps its aspect ratio and its longer side becomes
     * int(diameter * relative_size). Transparent logo pixels leave the
     * emblem pattern visible.
     *
     * @param emblem Emblem raster, moved in
     * @param logo BGRA logo raster
     * @return Emblem with logo, or InvalidConfig for empty inputs
     */
    Result<cv::Mat> composite(cv::Mat emblem, const cv::Mat& logo) const;

    /**
     * @brief Resize preserving aspect ratio to fit a square of target_side
     */
    static cv::Mat scale_to_fit(const cv::Mat& logo, int target_side);

    /**
     * @brief Contrast stretch around the mean luminance
     *
     * Each color channel becomes mean + factor * (value - mean); alpha is
     * kept as is.
     */
    static cv::Mat enhance_contrast(const cv::Mat& logo, double factor);

private:
    LogoStyle style_;
    DiagnosticSink log_;
};

}  // namespace kickqr
