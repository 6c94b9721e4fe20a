#include "kickqr/compose/overlay_compositor.hpp"
#include "kickqr/core/raster.hpp"

namespace kickqr {

OverlayCompositor::OverlayCompositor(double warn_threshold_percent, DiagnosticSink log)
    : warn_threshold_percent_(warn_threshold_percent)
    , log_(std::move(log))
{
}

double OverlayCompositor::coverage_percent(int ball_size_px, int module_pixel_size, int module_count) {
    if (module_pixel_size <= 0 || module_count <= 0) {
        return 0.0;
    }
    const double ball_modules = static_cast<double>(ball_size_px) / module_pixel_size;
    const double data_modules = static_cast<double>(module_count) * module_count;
    return ball_modules * ball_modules / data_modules * 100.0;
}

cv::Point OverlayCompositor::centered_position(const cv::Size& raster, int ball_size_px) {
    return cv::Point((raster.width - ball_size_px) / 2, (raster.height - ball_size_px) / 2);
}

Result<OverlayResult> OverlayCompositor::overlay(QRMatrix matrix, const cv::Mat& emblem) const {
    if (emblem.empty() || emblem.type() != CV_8UC4 || emblem.cols != emblem.rows) {
        log_->error("Emblem must be a non-empty square BGRA raster");
        return make_error(ErrorCode::INVALID_CONFIG, "emblem must be a non-empty square BGRA raster");
    }
    if (emblem.cols > matrix.raster.cols || emblem.rows > matrix.raster.rows) {
        log_->error("Emblem ({}px) is larger than the QR raster ({}x{})",
                    emblem.cols, matrix.raster.cols, matrix.raster.rows);
        return make_error(ErrorCode::INVALID_CONFIG, "emblem is larger than the QR raster");
    }

    CoverageReport report;
    report.ball_size_px = emblem.cols;
    report.position = centered_position(matrix.raster.size(), emblem.cols);
    report.coverage_percent =
        coverage_percent(emblem.cols, matrix.module_pixel_size, matrix.module_count);
    report.threshold_percent = warn_threshold_percent_;
    report.exceeds_threshold = report.coverage_percent > warn_threshold_percent_;

    log_->info("Soccer ball covers {:.1f}% of QR data area", report.coverage_percent);
    if (report.exceeds_threshold) {
        log_->warn("Coverage exceeds {:.0f}%. QR code may be difficult to scan. "
                   "Consider reducing emblem.relative_size.", warn_threshold_percent_);
    } else {
        log_->info("Coverage is within the {:.0f}% scanning margin", warn_threshold_percent_);
    }

    alpha_blend(matrix.raster, emblem, report.position);

    return OverlayResult{std::move(matrix), report};
}

}  // namespace kickqr
