#pragma once

#include <cstdint>
#include <string>

#include <opencv2/core.hpp>

namespace kickqr {

// ============================================================================
// Color
// ============================================================================
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

// ============================================================================
// Error Correction Level
// ============================================================================
enum class ErrorCorrectionLevel : uint8_t {
    L = 0,      // ~7% recoverable
    M,          // ~15%
    Q,          // ~25%
    H           // ~30%
};

inline const char* to_string(ErrorCorrectionLevel level) {
    switch (level) {
        case ErrorCorrectionLevel::L: return "L";
        case ErrorCorrectionLevel::M: return "M";
        case ErrorCorrectionLevel::Q: return "Q";
        case ErrorCorrectionLevel::H: return "H";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// QR Specification
// ============================================================================
struct QRSpecification {
    std::string data;
    ErrorCorrectionLevel error_correction_level = ErrorCorrectionLevel::H;
    int module_pixel_size = 35;     // Pixels per module side
    int border_modules = 6;         // Quiet zone width in modules
};

// ============================================================================
// QR Matrix
// ============================================================================
struct QRMatrix {
    int version = 0;
    int module_count = 0;           // 4 * version + 17
    int module_pixel_size = 0;
    int border_modules = 0;
    cv::Mat raster;                 // CV_8UC4 (BGRA)

    static constexpr int max_version = 40;
    static constexpr int max_pixel_side = 32768;    // Largest raster side the pipeline allocates

    static constexpr int module_count_for(int version) {
        return 4 * version + 17;
    }

    int expected_pixel_side() const {
        return (module_count + 2 * border_modules) * module_pixel_size;
    }

    // Pixel offset of the first data module from the raster edge
    int quiet_zone_px() const {
        return border_modules * module_pixel_size;
    }

    bool consistent() const {
        return version >= 1 &&
               module_count == module_count_for(version) &&
               module_pixel_size > 0 &&
               border_modules >= 0 &&
               !raster.empty() &&
               raster.type() == CV_8UC4 &&
               raster.cols == expected_pixel_side() &&
               raster.rows == expected_pixel_side();
    }
};

// ============================================================================
// Finder Pattern
// ============================================================================
enum class FinderPosition : uint8_t {
    TOP_LEFT = 0,
    TOP_RIGHT,
    BOTTOM_LEFT
};

inline const char* to_string(FinderPosition position) {
    switch (position) {
        case FinderPosition::TOP_LEFT: return "TOP_LEFT";
        case FinderPosition::TOP_RIGHT: return "TOP_RIGHT";
        case FinderPosition::BOTTOM_LEFT: return "BOTTOM_LEFT";
        default: return "UNKNOWN";
    }
}

struct FinderPatternSpec {
    FinderPosition position = FinderPosition::TOP_LEFT;

    // Fixed 7:5:3 concentric ratio
    static constexpr int outer_side_modules = 7;
    static constexpr int inner_side_modules = 5;
    static constexpr int center_side_modules = 3;

    Color outer_color{200, 16, 46};
    Color inner_color{255, 255, 255};
    Color center_color{200, 16, 46};
};

// ============================================================================
// Emblem Geometry
// ============================================================================
struct EmblemGeometry {
    int ball_diameter_px = 0;
    double pentagon_radius_factor = 0.18;
    double hexagon_radius_factor = 0.16;
    double hexagon_distance_factor = 0.3;
    double rotation_offset_degrees = -90.0;    // First pentagon vertex points up

    double ball_radius() const { return ball_diameter_px / 2.0; }
};

struct EmblemColors {
    Color background{255, 255, 255};
    Color pattern{160, 160, 160};
};

// ============================================================================
// Coverage Report
// ============================================================================
struct CoverageReport {
    int ball_size_px = 0;
    cv::Point position;             // Top-left corner of the emblem on the QR raster
    double coverage_percent = 0.0;
    double threshold_percent = 25.0;
    bool exceeds_threshold = false;
};

}  // namespace kickqr
