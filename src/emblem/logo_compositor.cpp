#include "kickqr/emblem/logo_compositor.hpp"
#include "kickqr/core/raster.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace kickqr {

// ============================================================================
// Loading
// ============================================================================

Result<cv::Mat> load_logo(const std::string& path, const DiagnosticSink& log) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        log->error("Logo file not found: '{}'", path);
        return make_error(ErrorCode::RESOURCE_NOT_FOUND, "logo file not found: " + path);
    }

    cv::Mat raw;
    try {
        raw = cv::imread(path, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        log->error("Failed to read logo '{}': {}", path, e.what());
        return make_error(ErrorCode::DECODE_ERROR, "failed to read logo " + path + ": " + e.what());
    }

    cv::Mat logo = to_bgra_raster(raw);
    if (logo.empty()) {
        log->error("Failed to read logo. The file '{}' may be corrupted or not a valid image.", path);
        return make_error(ErrorCode::DECODE_ERROR, "logo is not a readable image: " + path);
    }

    log->info("Logo loaded successfully: {} ({}x{})", path, logo.cols, logo.rows);
    return logo;
}

// ============================================================================
// LogoCompositor
// ============================================================================

LogoCompositor::LogoCompositor(const LogoStyle& style, DiagnosticSink log)
    : style_(style)
    , log_(std::move(log))
{
}

cv::Mat LogoCompositor::scale_to_fit(const cv::Mat& logo, int target_side) {
    // Longer side lands exactly on target_side
    const int longer = std::max(logo.cols, logo.rows);
    const int shorter_scaled = std::max(
        1, static_cast<int>(std::lround(static_cast<double>(std::min(logo.cols, logo.rows)) *
                                        target_side / longer)));
    const int width = logo.cols >= logo.rows ? target_side : shorter_scaled;
    const int height = logo.cols >= logo.rows ? shorter_scaled : target_side;

    if (width == logo.cols && height == logo.rows) {
        return logo.clone();
    }

    cv::Mat resized;
    cv::resize(logo, resized, cv::Size(width, height), 0, 0, cv::INTER_LANCZOS4);
    return resized;
}

cv::Mat LogoCompositor::enhance_contrast(const cv::Mat& logo, double factor) {
    cv::Mat gray;
    cv::cvtColor(logo, gray, cv::COLOR_BGRA2GRAY);
    const double mean = cv::mean(gray)[0];

    std::vector<cv::Mat> channels;
    cv::split(logo, channels);
    for (int c = 0; c < 3; ++c) {
        // saturate_cast clamps to 0..255
        channels[c].convertTo(channels[c], CV_8U, factor, mean * (1.0 - factor));
    }

    cv::Mat enhanced;
    cv::merge(channels, enhanced);
    return enhanced;
}

Result<cv::Mat> LogoCompositor::composite(cv::Mat emblem, const cv::Mat& logo) const {
    if (emblem.empty() || logo.empty()) {
        log_->error("Cannot composite logo: emblem or logo raster is empty");
        return make_error(ErrorCode::INVALID_CONFIG, "empty emblem or logo raster");
    }

    const int target_side = static_cast<int>(emblem.rows * style_.relative_size);
    if (target_side < 1) {
        log_->error("Logo target size collapses to zero for a {}px emblem", emblem.rows);
        return make_error(ErrorCode::INVALID_CONFIG, "logo target size is zero");
    }

    cv::Mat scaled = scale_to_fit(logo, target_side);
    if (std::abs(style_.contrast - 1.0) > 1e-9) {
        scaled = enhance_contrast(scaled, style_.contrast);
    }

    const cv::Point origin((emblem.cols - scaled.cols) / 2, (emblem.rows - scaled.rows) / 2);
    alpha_blend(emblem, scaled, origin);

    log_->info("Pasted logo onto soccer ball ({}x{} at {},{})",
               scaled.cols, scaled.rows, origin.x, origin.y);
    return emblem;
}

}  // namespace kickqr
