#pragma once

#include "kickqr/core/error.hpp"
#include "kickqr/core/logger.hpp"
#include "kickqr/core/types.hpp"

namespace kickqr {

/**
 * @brief QR raster with the emblem applied, plus its coverage estimate
 */
struct OverlayResult {
    QRMatrix matrix;
    CoverageReport coverage;
};

/**
 * @brief Places the emblem at the QR center and estimates obscured area
 *
 * Coverage is the emblem's bounding square measured in modules, relative
 * to the data area (quiet zone excluded). It is advisory: exceeding the
 * threshold logs a warning and generation continues.
 */
class OverlayCompositor {
public:
    OverlayCompositor(double warn_threshold_percent, DiagnosticSink log);

    /**
     * @brief Blend the emblem onto the QR raster
     *
     * @param matrix Styled QR matrix, moved in
     * @param emblem Square BGRA emblem (with logo)
     * @return Matrix with emblem and coverage report, or InvalidConfig if
     *         the emblem is empty, not square or larger than the raster
     */
    Result<OverlayResult> overlay(QRMatrix matrix, const cv::Mat& emblem) const;

    /**
     * @brief Percentage of data modules under the emblem's bounding square
     *
     * (ball_size / module_pixel_size)^2 / module_count^2 * 100
     */
    static double coverage_percent(int ball_size_px, int module_pixel_size, int module_count);

    /**
     * @brief Top-left corner that centers an emblem on the raster
     */
    static cv::Point centered_position(const cv::Size& raster, int ball_size_px);

private:
    double warn_threshold_percent_;
    DiagnosticSink log_;
};

}  // namespace kickqr
