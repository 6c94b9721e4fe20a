/**
 * @file matrix_encoder.cpp
 * @brief QR module matrix generation using libqrencode
 */

#include "kickqr/qr/matrix_encoder.hpp"
#include "kickqr/core/raster.hpp"

#include <qrencode.h>

#include <cerrno>
#include <cstdint>
#include <cstring>

namespace kickqr {

namespace {

QRecLevel to_qrencode_level(ErrorCorrectionLevel level) {
    switch (level) {
        case ErrorCorrectionLevel::L: return QR_ECLEVEL_L;
        case ErrorCorrectionLevel::M: return QR_ECLEVEL_M;
        case ErrorCorrectionLevel::Q: return QR_ECLEVEL_Q;
        case ErrorCorrectionLevel::H: return QR_ECLEVEL_H;
        default: return QR_ECLEVEL_H;
    }
}

// Owns a QRcode returned by libqrencode
struct QRcodeDeleter {
    void operator()(QRcode* code) const { QRcode_free(code); }
};
using QRcodePtr = std::unique_ptr<QRcode, QRcodeDeleter>;

}  // namespace

QrencodeMatrixEncoder::QrencodeMatrixEncoder(const MatrixStyle& style, DiagnosticSink log)
    : style_(style)
    , log_(std::move(log))
{
}

Result<QRMatrix> QrencodeMatrixEncoder::encode(const QRSpecification& spec) {
    if (spec.data.empty()) {
        log_->error("Cannot encode an empty payload");
        return make_error(ErrorCode::ENCODING_ERROR, "data is empty");
    }
    if (spec.data.find('\0') != std::string::npos) {
        log_->error("Payload contains a NUL byte");
        return make_error(ErrorCode::ENCODING_ERROR, "data contains a NUL byte");
    }
    if (spec.module_pixel_size <= 0 || spec.border_modules < 0) {
        log_->error("Invalid module geometry: size={}px border={}",
                    spec.module_pixel_size, spec.border_modules);
        return make_error(ErrorCode::ENCODING_ERROR, "invalid module size or border");
    }

    // Version 0 lets libqrencode pick the smallest version that fits
    errno = 0;
    QRcodePtr code(QRcode_encodeString(spec.data.c_str(), 0,
                                       to_qrencode_level(spec.error_correction_level),
                                       QR_MODE_8, 1));
    if (!code) {
        const int err = errno;
        if (err == ERANGE) {
            log_->error("Data ({} bytes) exceeds QR capacity at level {}",
                        spec.data.size(), to_string(spec.error_correction_level));
            return make_error(ErrorCode::ENCODING_ERROR,
                              "data of " + std::to_string(spec.data.size()) +
                              " bytes exceeds QR capacity at level " +
                              to_string(spec.error_correction_level));
        }
        log_->error("QR encoding failed: {}", std::strerror(err));
        return make_error(ErrorCode::ENCODING_ERROR,
                          std::string("QR encoding failed: ") + std::strerror(err));
    }

    const int width = code->width;

    // Bit 0 of each byte marks a dark module
    cv::Mat modules(width, width, CV_8UC1, cv::Scalar(0));
    for (int y = 0; y < width; ++y) {
        auto* row = modules.ptr<uchar>(y);
        const unsigned char* src = code->data + static_cast<size_t>(y) * width;
        for (int x = 0; x < width; ++x) {
            row[x] = (src[x] & 0x01) ? 255 : 0;
        }
    }

    QRMatrix matrix;
    matrix.version = code->version;
    matrix.module_count = width;
    matrix.module_pixel_size = spec.module_pixel_size;
    matrix.border_modules = spec.border_modules;

    const int64_t side =
        (static_cast<int64_t>(width) + 2 * static_cast<int64_t>(spec.border_modules)) *
        spec.module_pixel_size;
    if (side > QRMatrix::max_pixel_side) {
        log_->error("QR raster would be {}x{}px, above the {}px limit",
                    side, side, QRMatrix::max_pixel_side);
        return make_error(ErrorCode::ENCODING_ERROR,
                          "QR raster side of " + std::to_string(side) + "px is too large");
    }

    try {
        matrix.raster = rasterize(modules, spec);
    } catch (const cv::Exception& e) {
        log_->error("Failed to allocate the QR raster: {}", e.what());
        return make_error(ErrorCode::ENCODING_ERROR,
                          std::string("failed to allocate QR raster: ") + e.what());
    }

    if (!matrix.consistent()) {
        log_->error("Encoded matrix is inconsistent: version={} modules={} raster={}x{}",
                    matrix.version, matrix.module_count, matrix.raster.cols, matrix.raster.rows);
        return make_error(ErrorCode::ENCODING_ERROR, "encoded matrix has inconsistent geometry");
    }

    log_->info("QR code created with version {} ({}x{} modules), error correction {}",
               matrix.version, matrix.module_count, matrix.module_count,
               to_string(spec.error_correction_level));
    return matrix;
}

cv::Mat QrencodeMatrixEncoder::rasterize(const cv::Mat& modules, const QRSpecification& spec) const {
    const int scale = spec.module_pixel_size;
    const int offset = spec.border_modules * scale;
    const int side = (modules.cols + 2 * spec.border_modules) * scale;
    const cv::Scalar dark = to_bgra(style_.module);

    cv::Mat raster(side, side, CV_8UC4, to_bgra(style_.background));
    for (int y = 0; y < modules.rows; ++y) {
        const auto* row = modules.ptr<uchar>(y);
        for (int x = 0; x < modules.cols; ++x) {
            if (row[x]) {
                raster(cv::Rect(offset + x * scale, offset + y * scale, scale, scale)).setTo(dark);
            }
        }
    }
    return raster;
}

std::unique_ptr<IMatrixEncoder> create_matrix_encoder(const MatrixStyle& style,
                                                      DiagnosticSink log) {
    return std::make_unique<QrencodeMatrixEncoder>(style, std::move(log));
}

}  // namespace kickqr
