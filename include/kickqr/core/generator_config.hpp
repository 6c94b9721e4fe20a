#pragma once

#include "kickqr/core/error.hpp"
#include "kickqr/core/types.hpp"

#include <string>

namespace kickqr {

class Config;

/**
 * @brief Typed generator configuration
 *
 * Immutable record of every tunable the pipeline reads. Defaults reproduce
 * the print layout the tool was designed for; every field can be
 * overridden through YAML or the command line.
 */
struct GeneratorConfig {
    // QR symbol
    std::string data = "https://www.ayso154cypress.org";
    int module_pixel_size = 35;
    int border_modules = 6;

    // Files
    std::string logo_path = "logo_square.png";
    std::string output_path = "AYSO_Homepage_QR_Print.png";
    int outer_border_px = 20;

    // Emblem and logo proportions
    double ball_relative_size = 0.25;       // Emblem diameter relative to QR height
    double logo_relative_size = 0.7;        // Logo longer side relative to emblem diameter
    double logo_contrast = 1.1;             // 1.0 leaves the logo untouched
    double pentagon_radius_factor = 0.18;
    double hexagon_radius_factor = 0.16;
    double hexagon_distance_factor = 0.3;
    double rotation_offset_degrees = -90.0;

    // Scanability
    double coverage_warn_threshold_percent = 25.0;
    bool validate = false;

    // Colors (RGB)
    struct Colors {
        Color module{0, 0, 102};            // Navy blue data modules
        Color accent{200, 16, 46};          // Red finder patterns
        Color background{255, 255, 255};    // White
        Color pattern{160, 160, 160};       // Light gray emblem lines
    } colors;

    /**
     * @brief Build a validated record from a raw configuration source
     *
     * Recognizes the command-line aliases url, logo_path, output_path and
     * validate in addition to the dotted YAML keys.
     *
     * @return Typed configuration, or InvalidConfig naming the offending key
     */
    static Result<GeneratorConfig> from_config(const Config& config);

    /**
     * @brief Check value ranges
     */
    Status validate_ranges() const;

    /**
     * @brief QR request derived from this configuration (always level H)
     */
    QRSpecification qr_specification() const;

    /**
     * @brief Emblem geometry for a given diameter
     */
    EmblemGeometry emblem_geometry(int ball_diameter_px) const;
};

}  // namespace kickqr
