#pragma once

#include "kickqr/core/error.hpp"
#include "kickqr/core/logger.hpp"
#include "kickqr/core/types.hpp"

#include <string>

namespace kickqr {

/**
 * @brief Adds the outer print border and writes the final image
 */
class ImageAssembler {
public:
    ImageAssembler(int outer_border_px, const Color& background, DiagnosticSink log);

    /**
     * @brief Frame the QR raster with a uniform border
     *
     * The canvas is (width + outer_border) x (height + outer_border) and
     * the raster is pasted at (outer_border / 2, outer_border / 2).
     *
     * @param qr_raster Composited QR raster, moved in
     */
    cv::Mat assemble(cv::Mat qr_raster) const;

    /**
     * @brief Persist an image losslessly
     *
     * Writes to a temporary sibling and renames it into place, so a
     * failure never leaves a partial file or clobbers a previous output.
     *
     * @return ResourceNotFound if the output directory is missing,
     *         IOWriteError for any other write failure
     */
    Status save(const cv::Mat& image, const std::string& path) const;

private:
    int outer_border_px_;
    Color background_;
    DiagnosticSink log_;
};

}  // namespace kickqr
