#pragma once

#include "kickqr/core/error.hpp"
#include "kickqr/core/logger.hpp"
#include "kickqr/core/types.hpp"

#include <array>

namespace kickqr {

/**
 * @brief Restyles the three QR finder patterns
 *
 * Each finder is redrawn as concentric squares of 7, 5 and 3 modules:
 * accent, background, accent. The outer bounding box and the concentric
 * structure match the standard marker, so decoders still lock on; only
 * the color changes. Pixels outside the 7x7 finder squares are never
 * touched.
 */
class FinderPatternPainter {
public:
    FinderPatternPainter(const Color& accent, const Color& background, DiagnosticSink log);

    /**
     * @brief Paint all three finder patterns
     *
     * @param matrix Encoded matrix, moved in
     * @return The same matrix with restyled finders, or EncodingError if
     *         the raster does not match the matrix geometry
     */
    Result<QRMatrix> paint(QRMatrix matrix) const;

    /**
     * @brief Pattern spec for one corner with this painter's colors
     */
    FinderPatternSpec spec_for(FinderPosition position) const;

    /**
     * @brief Pixel rectangle covered by the outer finder square
     */
    static cv::Rect finder_bounds(const QRMatrix& matrix, FinderPosition position);

    static constexpr std::array<FinderPosition, 3> positions = {
        FinderPosition::TOP_LEFT,
        FinderPosition::TOP_RIGHT,
        FinderPosition::BOTTOM_LEFT
    };

private:
    void draw_finder(cv::Mat& raster, const cv::Rect& outer,
                     const FinderPatternSpec& spec, int module_px) const;

    Color accent_;
    Color background_;
    DiagnosticSink log_;
};

}  // namespace kickqr
