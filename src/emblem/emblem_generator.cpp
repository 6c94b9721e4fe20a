/**
 * @file emblem_generator.cpp
 * @brief Soccer-ball emblem drawing with OpenCV primitives
 */

#include "kickqr/emblem/emblem_generator.hpp"
#include "kickqr/core/raster.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace kickqr {

namespace {

// Sub-pixel precision for OpenCV drawing calls (1/16 px)
constexpr int kShift = 4;
constexpr double kScale = 1 << kShift;

constexpr int kPentagonSides = 5;
constexpr int kHexagonSides = 6;
constexpr int kHexagonCount = 5;
constexpr double kHexagonStepDegrees = 360.0 / kHexagonCount;

cv::Point to_fixed(cv::Point2d p) {
    return cv::Point(static_cast<int>(std::lround(p.x * kScale)),
                     static_cast<int>(std::lround(p.y * kScale)));
}

int to_fixed(double v) {
    return static_cast<int>(std::lround(v * kScale));
}

bool in_open_unit_interval(double v) {
    return v > 0.0 && v < 1.0;
}

}  // namespace

EmblemGenerator::EmblemGenerator(const EmblemColors& colors, DiagnosticSink log)
    : colors_(colors)
    , log_(std::move(log))
{
}

int EmblemGenerator::stroke_width(int ball_diameter_px) {
    return std::max(1, ball_diameter_px / 200);
}

std::vector<cv::Point2d> EmblemGenerator::regular_polygon(cv::Point2d center, double radius,
                                                          int sides, double rotation_degrees) {
    std::vector<cv::Point2d> vertices;
    vertices.reserve(sides);
    for (int i = 0; i < sides; ++i) {
        const double angle = (i * 360.0 / sides + rotation_degrees) * CV_PI / 180.0;
        vertices.emplace_back(center.x + radius * std::cos(angle),
                              center.y + radius * std::sin(angle));
    }
    return vertices;
}

Result<cv::Mat> EmblemGenerator::generate(const EmblemGeometry& geometry) const {
    if (geometry.ball_diameter_px < 1) {
        log_->error("Emblem diameter must be positive, got {}px", geometry.ball_diameter_px);
        return make_error(ErrorCode::INVALID_CONFIG, "emblem diameter must be positive");
    }
    if (!in_open_unit_interval(geometry.pentagon_radius_factor) ||
        !in_open_unit_interval(geometry.hexagon_radius_factor) ||
        !in_open_unit_interval(geometry.hexagon_distance_factor)) {
        log_->error("Emblem factors must lie in (0, 1): pentagon={} hexagon={} distance={}",
                    geometry.pentagon_radius_factor, geometry.hexagon_radius_factor,
                    geometry.hexagon_distance_factor);
        return make_error(ErrorCode::INVALID_CONFIG, "emblem geometry factors must lie in (0, 1)");
    }

    const int d = geometry.ball_diameter_px;
    const int line_width = stroke_width(d);
    const double ball_radius = geometry.ball_radius();
    const double edge = (d - 1) / 2.0;    // Inscribed disc spans pixels 0..d-1
    const cv::Point2d center(edge, edge);

    cv::Mat canvas(d, d, CV_8UC4, cv::Scalar(0, 0, 0, 0));

    // Base disc
    cv::circle(canvas, to_fixed(center), to_fixed(edge), to_bgra(colors_.background),
               cv::FILLED, cv::LINE_8, kShift);

    // Central pentagon, first vertex at the rotation offset
    draw_polygon(canvas,
                 regular_polygon(center, ball_radius * geometry.pentagon_radius_factor,
                                 kPentagonSides, geometry.rotation_offset_degrees),
                 line_width);

    // Surrounding hexagons
    const double hex_radius = ball_radius * geometry.hexagon_radius_factor;
    const double hex_distance = ball_radius * geometry.hexagon_distance_factor;
    for (int i = 0; i < kHexagonCount; ++i) {
        const double angle = i * kHexagonStepDegrees * CV_PI / 180.0;
        const cv::Point2d hex_center(center.x + hex_distance * std::cos(angle),
                                     center.y + hex_distance * std::sin(angle));
        draw_polygon(canvas, regular_polygon(hex_center, hex_radius, kHexagonSides, 0.0),
                     line_width);
    }

    // Boundary outline, kept inside the canvas
    const double outline_radius = std::max(0.0, edge - (line_width - 1) / 2.0);
    cv::circle(canvas, to_fixed(center), to_fixed(outline_radius), to_bgra(colors_.pattern),
               line_width, cv::LINE_8, kShift);

    log_->info("Created soccer ball pattern: {}px diameter, {}px strokes", d, line_width);
    return canvas;
}

void EmblemGenerator::draw_polygon(cv::Mat& canvas, const std::vector<cv::Point2d>& vertices,
                                   int thickness) const {
    std::vector<cv::Point> fixed;
    fixed.reserve(vertices.size());
    for (const auto& v : vertices) {
        fixed.push_back(to_fixed(v));
    }

    std::vector<std::vector<cv::Point>> contours{fixed};
    cv::polylines(canvas, contours, true, to_bgra(colors_.pattern), thickness, cv::LINE_AA, kShift);
}

}  // namespace kickqr
