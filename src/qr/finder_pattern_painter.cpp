#include "kickqr/qr/finder_pattern_painter.hpp"
#include "kickqr/core/raster.hpp"

namespace kickqr {

FinderPatternPainter::FinderPatternPainter(const Color& accent,
                                           const Color& background,
                                           DiagnosticSink log)
    : accent_(accent)
    , background_(background)
    , log_(std::move(log))
{
}

FinderPatternSpec FinderPatternPainter::spec_for(FinderPosition position) const {
    FinderPatternSpec spec;
    spec.position = position;
    spec.outer_color = accent_;
    spec.inner_color = background_;
    spec.center_color = accent_;
    return spec;
}

cv::Rect FinderPatternPainter::finder_bounds(const QRMatrix& matrix, FinderPosition position) {
    const int s = matrix.module_pixel_size;
    const int finder_size = FinderPatternSpec::outer_side_modules * s;
    const int near_edge = matrix.quiet_zone_px();
    const int far_edge = matrix.quiet_zone_px() + matrix.module_count * s - finder_size;

    switch (position) {
        case FinderPosition::TOP_RIGHT:
            return cv::Rect(far_edge, near_edge, finder_size, finder_size);
        case FinderPosition::BOTTOM_LEFT:
            return cv::Rect(near_edge, far_edge, finder_size, finder_size);
        case FinderPosition::TOP_LEFT:
        default:
            return cv::Rect(near_edge, near_edge, finder_size, finder_size);
    }
}

Result<QRMatrix> FinderPatternPainter::paint(QRMatrix matrix) const {
    if (!matrix.consistent()) {
        log_->error("Refusing to paint finder patterns on an inconsistent matrix ({}x{} raster, {} modules)",
                    matrix.raster.cols, matrix.raster.rows, matrix.module_count);
        return make_error(ErrorCode::ENCODING_ERROR, "matrix raster does not match its geometry");
    }

    for (auto position : positions) {
        draw_finder(matrix.raster, finder_bounds(matrix, position), spec_for(position),
                    matrix.module_pixel_size);
    }

    log_->info("Added custom hollow finder patterns");
    return matrix;
}

void FinderPatternPainter::draw_finder(cv::Mat& raster, const cv::Rect& outer,
                                       const FinderPatternSpec& spec, int module_px) const {
    const int inner_offset =
        (FinderPatternSpec::outer_side_modules - FinderPatternSpec::inner_side_modules) / 2 * module_px;
    const int center_offset =
        (FinderPatternSpec::outer_side_modules - FinderPatternSpec::center_side_modules) / 2 * module_px;
    const int inner_side = FinderPatternSpec::inner_side_modules * module_px;
    const int center_side = FinderPatternSpec::center_side_modules * module_px;

    raster(outer).setTo(to_bgra(spec.outer_color));
    raster(cv::Rect(outer.x + inner_offset, outer.y + inner_offset, inner_side, inner_side))
        .setTo(to_bgra(spec.inner_color));
    raster(cv::Rect(outer.x + center_offset, outer.y + center_offset, center_side, center_side))
        .setTo(to_bgra(spec.center_color));

    log_->debug("Finder {} drawn at ({}, {}) side {}px",
                to_string(spec.position), outer.x, outer.y, outer.width);
}

}  // namespace kickqr
