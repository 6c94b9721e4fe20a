#pragma once

#include "kickqr/core/error.hpp"
#include "kickqr/core/logger.hpp"

#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace kickqr {

/**
 * @brief QR decoder interface
 *
 * Reads QR payloads back from a raster. Used only to check that a
 * generated image still scans.
 */
class IQRDecoder {
public:
    virtual ~IQRDecoder() = default;

    /**
     * @brief Decode every QR symbol in an image
     *
     * @param image 8-bit image with 1, 3 or 4 channels
     * @return Payloads found (empty if no symbol was decoded)
     */
    virtual std::vector<std::string> decode(const cv::Mat& image) = 0;

    /**
     * @brief Backend name for logging
     */
    virtual std::string name() const = 0;
};

/**
 * @brief Create the ZBar-backed decoder
 *
 * @return Decoder, or nullptr when the build has no ZBar support
 */
std::unique_ptr<IQRDecoder> create_qr_decoder(DiagnosticSink log);

/**
 * @brief Round-trip check of a saved QR image
 */
class ScanValidator {
public:
    ScanValidator(IQRDecoder& decoder, DiagnosticSink log);

    /**
     * @brief Reload image_path, decode it and compare with expected
     *
     * @return success if any decoded payload equals expected,
     *         ValidationMismatch if none does (or nothing decodes),
     *         DecodeError if the file cannot be read back
     */
    Status validate(const std::string& image_path, const std::string& expected);

private:
    IQRDecoder& decoder_;
    DiagnosticSink log_;
};

}  // namespace kickqr
