#pragma once

#include "kickqr/core/error.hpp"
#include "kickqr/core/generator_config.hpp"
#include "kickqr/core/logger.hpp"
#include "kickqr/core/types.hpp"
#include "kickqr/qr/matrix_encoder.hpp"
#include "kickqr/qr/qr_decoder.hpp"

#include <memory>
#include <string>

namespace kickqr {

/**
 * @brief Outcome of the optional scan check
 */
enum class ValidationOutcome : uint8_t {
    SKIPPED = 0,    // Not requested, or no decoder available
    PASSED,
    FAILED
};

inline const char* to_string(ValidationOutcome outcome) {
    switch (outcome) {
        case ValidationOutcome::SKIPPED: return "SKIPPED";
        case ValidationOutcome::PASSED: return "PASSED";
        case ValidationOutcome::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Summary of a successful generation run
 */
struct GenerationReport {
    int version = 0;
    int module_count = 0;
    cv::Size qr_size;
    cv::Size final_size;
    CoverageReport coverage;
    std::string output_path;
    ValidationOutcome validation = ValidationOutcome::SKIPPED;
    std::string validation_message;
};

/**
 * @brief Soccer-ball QR code pipeline
 *
 * Runs, in order: logo load, QR encoding at level H, finder restyling,
 * emblem drawing, logo compositing, emblem overlay, border framing and
 * saving. The first failing stage aborts the run and nothing is written.
 * Validation, when a decoder is supplied and enabled, runs after the
 * save and never changes the saved file.
 */
class QRCodeGenerator {
public:
    /**
     * @param config Validated configuration
     * @param encoder QR encoder (required)
     * @param decoder Scan decoder, or nullptr to skip validation
     * @param log Diagnostic sink for this run
     */
    QRCodeGenerator(GeneratorConfig config,
                    std::unique_ptr<IMatrixEncoder> encoder,
                    std::unique_ptr<IQRDecoder> decoder,
                    DiagnosticSink log);

    /**
     * @brief Run the whole pipeline once
     */
    Result<GenerationReport> generate();

    const GeneratorConfig& config() const { return config_; }

private:
    void run_validation(GenerationReport& report);
    void log_scanning_tips() const;

    const GeneratorConfig config_;
    std::unique_ptr<IMatrixEncoder> encoder_;
    std::unique_ptr<IQRDecoder> decoder_;
    DiagnosticSink log_;
};

/**
 * @brief Build a generator with the default encoder and, if validation
 *        is enabled, the default decoder
 */
std::unique_ptr<QRCodeGenerator> create_generator(const GeneratorConfig& config,
                                                  DiagnosticSink log);

}  // namespace kickqr
