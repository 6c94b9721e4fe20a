// QR decoding using ZBar

#include "kickqr/qr/qr_decoder.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#ifdef HAS_ZBAR
#include <zbar.h>
#endif

namespace kickqr {

#ifdef HAS_ZBAR

namespace {

class ZBarDecoder : public IQRDecoder {
public:
    explicit ZBarDecoder(DiagnosticSink log)
        : log_(std::move(log))
    {
        scanner_.set_config(zbar::ZBAR_NONE, zbar::ZBAR_CFG_ENABLE, 0);
        scanner_.set_config(zbar::ZBAR_QRCODE, zbar::ZBAR_CFG_ENABLE, 1);
    }

    std::vector<std::string> decode(const cv::Mat& image) override {
        std::vector<std::string> payloads;
        if (image.empty()) {
            return payloads;
        }

        cv::Mat gray;
        switch (image.channels()) {
            case 1: gray = image.clone(); break;
            case 3: cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY); break;
            case 4: cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY); break;
            default:
                log_->warn("ZBar: unsupported channel count {}", image.channels());
                return payloads;
        }

        zbar::Image zbar_image(gray.cols, gray.rows, "Y800", gray.data,
                               static_cast<unsigned long>(gray.cols) * gray.rows);
        const int found = scanner_.scan(zbar_image);
        if (found < 0) {
            log_->warn("ZBar scan failed");
            return payloads;
        }

        for (auto symbol = zbar_image.symbol_begin(); symbol != zbar_image.symbol_end(); ++symbol) {
            payloads.push_back(symbol->get_data());
        }
        return payloads;
    }

    std::string name() const override { return "zbar"; }

private:
    zbar::ImageScanner scanner_;
    DiagnosticSink log_;
};

}  // namespace

std::unique_ptr<IQRDecoder> create_qr_decoder(DiagnosticSink log) {
    return std::make_unique<ZBarDecoder>(std::move(log));
}

#else

std::unique_ptr<IQRDecoder> create_qr_decoder(DiagnosticSink log) {
    log->warn("QR validation requires ZBar, which is not available");
    return nullptr;
}

#endif

// ============================================================================
// ScanValidator
// ============================================================================

ScanValidator::ScanValidator(IQRDecoder& decoder, DiagnosticSink log)
    : decoder_(decoder)
    , log_(std::move(log))
{
}

Status ScanValidator::validate(const std::string& image_path, const std::string& expected) {
    log_->info("--- Running Validation on {} ({}) ---", image_path, decoder_.name());

    cv::Mat image;
    try {
        image = cv::imread(image_path, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        log_->error("Could not reload '{}' for validation: {}", image_path, e.what());
        return make_error(ErrorCode::DECODE_ERROR, "could not reload " + image_path);
    }
    if (image.empty()) {
        log_->error("Could not reload '{}' for validation", image_path);
        return make_error(ErrorCode::DECODE_ERROR, "could not reload " + image_path);
    }

    const auto payloads = decoder_.decode(image);
    if (payloads.empty()) {
        log_->error("VALIDATION FAILED: No QR code found in the generated image.");
        return make_error(ErrorCode::VALIDATION_MISMATCH, "no QR code found in " + image_path);
    }

    for (const auto& payload : payloads) {
        if (payload == expected) {
            log_->info("VALIDATION SUCCESS: Found QR code with matching data: {}", payload);
            return Status::success();
        }
    }

    log_->error("VALIDATION FAILED: Found a QR code, but data does not match.");
    log_->error("  Expected: {}", expected);
    log_->error("  Found:    {}", payloads.front());
    return make_error(ErrorCode::VALIDATION_MISMATCH,
                      "expected '" + expected + "' but decoded '" + payloads.front() + "'");
}

}  // namespace kickqr
