/**
 * @file qr_generator.cpp
 * @brief Pipeline driver for the soccer-ball QR code
 */

#include "kickqr/pipeline/qr_generator.hpp"
#include "kickqr/compose/image_assembler.hpp"
#include "kickqr/compose/overlay_compositor.hpp"
#include "kickqr/emblem/emblem_generator.hpp"
#include "kickqr/emblem/logo_compositor.hpp"
#include "kickqr/qr/finder_pattern_painter.hpp"

namespace kickqr {

QRCodeGenerator::QRCodeGenerator(GeneratorConfig config,
                                 std::unique_ptr<IMatrixEncoder> encoder,
                                 std::unique_ptr<IQRDecoder> decoder,
                                 DiagnosticSink log)
    : config_(std::move(config))
    , encoder_(std::move(encoder))
    , decoder_(std::move(decoder))
    , log_(std::move(log))
{
}

Result<GenerationReport> QRCodeGenerator::generate() {
    // Logo first: a missing asset should fail before any work is done
    auto logo = load_logo(config_.logo_path, log_);
    if (!logo) {
        return logo.error();
    }

    // ========================================================================
    // QR matrix
    // ========================================================================
    auto encoded = encoder_->encode(config_.qr_specification());
    if (!encoded) {
        log_->error("Failed to create QR code: {}", encoded.error().message);
        return encoded.error();
    }

    FinderPatternPainter painter(config_.colors.accent, config_.colors.background, log_);
    auto painted = painter.paint(encoded.take());
    if (!painted) {
        return painted.error();
    }
    QRMatrix matrix = painted.take();

    // ========================================================================
    // Emblem
    // ========================================================================
    const int ball_size = static_cast<int>(matrix.raster.rows * config_.ball_relative_size);

    EmblemGenerator emblem_generator(
        EmblemColors{config_.colors.background, config_.colors.pattern}, log_);
    auto emblem = emblem_generator.generate(config_.emblem_geometry(ball_size));
    if (!emblem) {
        return emblem.error();
    }

    LogoCompositor logo_compositor(LogoStyle{config_.logo_relative_size, config_.logo_contrast},
                                   log_);
    auto emblem_with_logo = logo_compositor.composite(emblem.take(), logo.value());
    if (!emblem_with_logo) {
        return emblem_with_logo.error();
    }

    // ========================================================================
    // Overlay and output
    // ========================================================================
    OverlayCompositor overlay(config_.coverage_warn_threshold_percent, log_);
    auto overlaid = overlay.overlay(std::move(matrix), emblem_with_logo.value());
    if (!overlaid) {
        return overlaid.error();
    }
    OverlayResult result = overlaid.take();

    GenerationReport report;
    report.version = result.matrix.version;
    report.module_count = result.matrix.module_count;
    report.qr_size = result.matrix.raster.size();
    report.coverage = result.coverage;
    report.output_path = config_.output_path;

    ImageAssembler assembler(config_.outer_border_px, config_.colors.background, log_);
    const cv::Mat final_image = assembler.assemble(std::move(result.matrix.raster));
    report.final_size = final_image.size();

    auto saved = assembler.save(final_image, config_.output_path);
    if (!saved) {
        return saved.error();
    }

    log_->info("It points to: {}", config_.data);

    run_validation(report);
    log_scanning_tips();

    log_->info("QR code generation complete.");
    return report;
}

void QRCodeGenerator::run_validation(GenerationReport& report) {
    if (!config_.validate) {
        return;
    }
    if (!decoder_) {
        log_->warn("No QR decoder available. Skipping validation.");
        report.validation_message = "no decoder available";
        return;
    }

    ScanValidator validator(*decoder_, log_);
    auto status = validator.validate(config_.output_path, config_.data);
    if (status) {
        report.validation = ValidationOutcome::PASSED;
        report.validation_message = "decoded payload matches";
    } else {
        report.validation = ValidationOutcome::FAILED;
        report.validation_message = status.error().describe();
        log_->error("Please check parameters. The QR code might be too obscured.");
    }
}

void QRCodeGenerator::log_scanning_tips() const {
    log_->info("SCANNING TIPS:");
    log_->info("1. Test with multiple devices and apps");
    log_->info("2. Print at least 1.5 inches (38mm) wide");
    log_->info("3. Use non-glossy paper to reduce glare for outdoor use");
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<QRCodeGenerator> create_generator(const GeneratorConfig& config,
                                                  DiagnosticSink log) {
    auto encoder = create_matrix_encoder(
        MatrixStyle{config.colors.module, config.colors.background}, log);

    std::unique_ptr<IQRDecoder> decoder;
    if (config.validate) {
        decoder = create_qr_decoder(log);
    }

    return std::make_unique<QRCodeGenerator>(config, std::move(encoder), std::move(decoder),
                                             std::move(log));
}

}  // namespace kickqr
