#pragma once

#include "kickqr/core/error.hpp"
#include "kickqr/core/logger.hpp"
#include "kickqr/core/types.hpp"

#include <vector>

namespace kickqr {

/**
 * @brief Procedural soccer-ball emblem renderer
 *
 * Draws, on a transparent square canvas of side ball_diameter_px:
 * - a filled background-colored disc inscribed in the canvas
 * - a central regular pentagon
 * - five regular hexagons spaced 72 degrees apart around it
 * - a thin outline at the disc boundary
 *
 * Output depends only on the geometry and colors, so two calls with the
 * same inputs produce identical pixels.
 */
class EmblemGenerator {
public:
    EmblemGenerator(const EmblemColors& colors, DiagnosticSink log);

    /**
     * @brief Render the emblem
     *
     * @param geometry Diameter and pattern proportions
     * @return CV_8UC4 raster with transparent corners, or InvalidConfig
     *         for a non-positive diameter or factors outside (0, 1)
     */
    Result<cv::Mat> generate(const EmblemGeometry& geometry) const;

    /**
     * @brief Stroke width used for a given diameter (at least 1px)
     */
    static int stroke_width(int ball_diameter_px);

    /**
     * @brief Vertices of a regular polygon
     *
     * @param center Polygon center in pixels
     * @param radius Circumradius in pixels
     * @param sides Number of vertices
     * @param rotation_degrees Angle of the first vertex (0 = +x, clockwise in image space)
     */
    static std::vector<cv::Point2d> regular_polygon(cv::Point2d center, double radius,
                                                    int sides, double rotation_degrees);

private:
    void draw_polygon(cv::Mat& canvas, const std::vector<cv::Point2d>& vertices,
                      int thickness) const;

    EmblemColors colors_;
    DiagnosticSink log_;
};

}  // namespace kickqr
