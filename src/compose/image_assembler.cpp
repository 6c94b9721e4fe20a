#include "kickqr/compose/image_assembler.hpp"
#include "kickqr/core/raster.hpp"

#include <opencv2/imgcodecs.hpp>

#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace kickqr {

namespace {

// Same directory and extension as the target so rename stays atomic and
// imwrite still picks the right encoder
fs::path temporary_sibling(const fs::path& target) {
    fs::path tmp = target;
    tmp.replace_filename("." + target.stem().string() + ".partial-" +
                         std::to_string(::getpid()) + target.extension().string());
    return tmp;
}

void discard(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

}  // namespace

ImageAssembler::ImageAssembler(int outer_border_px, const Color& background, DiagnosticSink log)
    : outer_border_px_(outer_border_px)
    , background_(background)
    , log_(std::move(log))
{
}

cv::Mat ImageAssembler::assemble(cv::Mat qr_raster) const {
    cv::Mat canvas(qr_raster.rows + outer_border_px_, qr_raster.cols + outer_border_px_,
                   CV_8UC4, to_bgra(background_));
    paste(canvas, qr_raster, cv::Point(outer_border_px_ / 2, outer_border_px_ / 2));

    log_->debug("Final canvas {}x{} with {}px border", canvas.cols, canvas.rows, outer_border_px_);
    return canvas;
}

Status ImageAssembler::save(const cv::Mat& image, const std::string& path) const {
    const fs::path target(path);
    const fs::path dir = target.has_parent_path() ? target.parent_path() : fs::path(".");

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        log_->error("Output directory does not exist: '{}'", dir.string());
        return make_error(ErrorCode::RESOURCE_NOT_FOUND,
                          "output directory does not exist: " + dir.string());
    }
    if (fs::is_directory(target, ec)) {
        log_->error("Output path '{}' is a directory", path);
        return make_error(ErrorCode::IO_WRITE_ERROR, "output path is a directory: " + path);
    }

    const fs::path tmp = temporary_sibling(target);

    bool written = false;
    try {
        written = cv::imwrite(tmp.string(), image);
    } catch (const cv::Exception& e) {
        discard(tmp);
        log_->error("Failed to save image to '{}'. An I/O error occurred: {}", path, e.what());
        return make_error(ErrorCode::IO_WRITE_ERROR,
                          "failed to encode image for " + path + ": " + e.what());
    }

    if (!written) {
        discard(tmp);
        log_->error("Permission denied or disk full. Could not save file to '{}'.", path);
        return make_error(ErrorCode::IO_WRITE_ERROR, "could not write " + path);
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        discard(tmp);
        log_->error("Failed to move image into place at '{}': {}", path, ec.message());
        return make_error(ErrorCode::IO_WRITE_ERROR,
                          "could not replace " + path + ": " + ec.message());
    }

    log_->info("QR code saved successfully to: {} ({}x{})", path, image.cols, image.rows);
    return Status::success();
}

}  // namespace kickqr
