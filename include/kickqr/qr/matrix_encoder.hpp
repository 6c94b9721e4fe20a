#pragma once

#include "kickqr/core/error.hpp"
#include "kickqr/core/logger.hpp"
#include "kickqr/core/types.hpp"

#include <memory>

namespace kickqr {

/**
 * @brief Colors used when rasterizing QR modules
 */
struct MatrixStyle {
    Color module{0, 0, 102};
    Color background{255, 255, 255};
};

/**
 * @brief QR encoder interface
 *
 * Turns a QRSpecification into a rasterized QRMatrix. The encoder picks
 * the smallest symbol version that holds the data at the requested
 * error-correction level.
 */
class IMatrixEncoder {
public:
    virtual ~IMatrixEncoder() = default;

    /**
     * @brief Encode data into a QR raster
     *
     * @param spec Data, error-correction level and pixel geometry
     * @return Consistent QRMatrix, or EncodingError when the request is
     *         invalid or the data exceeds the largest version's capacity
     */
    virtual Result<QRMatrix> encode(const QRSpecification& spec) = 0;

    /**
     * @brief Backend name for logging
     */
    virtual std::string name() const = 0;
};

/**
 * @brief libqrencode-backed encoder
 */
class QrencodeMatrixEncoder : public IMatrixEncoder {
public:
    QrencodeMatrixEncoder(const MatrixStyle& style, DiagnosticSink log);

    Result<QRMatrix> encode(const QRSpecification& spec) override;
    std::string name() const override { return "libqrencode"; }

private:
    // Scale the module grid and surround it with the quiet zone
    cv::Mat rasterize(const cv::Mat& modules, const QRSpecification& spec) const;

    MatrixStyle style_;
    DiagnosticSink log_;
};

/**
 * @brief Create the default matrix encoder
 */
std::unique_ptr<IMatrixEncoder> create_matrix_encoder(const MatrixStyle& style,
                                                      DiagnosticSink log);

}  // namespace kickqr
