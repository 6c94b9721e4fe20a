#include "kickqr/core/generator_config.hpp"
#include "kickqr/core/config.hpp"
#include "kickqr/core/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>

namespace kickqr {

namespace {

// Command-line flag -> YAML key
constexpr std::array<std::pair<const char*, const char*>, 4> kAliases = {{
    {"url", "qr.data"},
    {"logo_path", "logo.path"},
    {"output_path", "output.path"},
    {"validate", "validation.enabled"},
}};

std::string resolve_key(const Config& config, const std::string& key) {
    for (const auto& [alias, target] : kAliases) {
        if (key == target && config.has(alias)) {
            return alias;
        }
    }
    return key;
}

Result<Color> read_color(const Config& config, const std::string& key, Color default_value) {
    if (!config.has(key)) {
        return default_value;
    }

    auto values = config.get_int_list(key);
    if (values.size() != 3) {
        return make_error(ErrorCode::INVALID_CONFIG,
                          key + " must list exactly 3 components (R, G, B)");
    }
    for (int v : values) {
        if (v < 0 || v > 255) {
            return make_error(ErrorCode::INVALID_CONFIG,
                              key + " components must be within 0..255");
        }
    }
    return Color{static_cast<uint8_t>(values[0]),
                 static_cast<uint8_t>(values[1]),
                 static_cast<uint8_t>(values[2])};
}

bool in_open_unit_interval(double v) {
    return v > 0.0 && v < 1.0;
}

bool is_lossless_extension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".png" || ext == ".bmp" || ext == ".tif" || ext == ".tiff" ||
           ext == ".ppm" || ext == ".pgm";
}

Error invalid(const std::string& key, const std::string& why) {
    return make_error(ErrorCode::INVALID_CONFIG, key + " " + why);
}

}  // namespace

Result<GeneratorConfig> GeneratorConfig::from_config(const Config& config) {
    GeneratorConfig gc;

    auto str = [&](const std::string& key, const std::string& def) {
        return config.get_string(resolve_key(config, key), def);
    };

    gc.data = str("qr.data", gc.data);
    gc.module_pixel_size = config.get_int("qr.module_pixel_size", gc.module_pixel_size);
    gc.border_modules = config.get_int("qr.border_modules", gc.border_modules);

    gc.logo_path = str("logo.path", gc.logo_path);
    gc.logo_relative_size = config.get_double("logo.relative_size", gc.logo_relative_size);
    gc.logo_contrast = config.get_double("logo.contrast", gc.logo_contrast);

    gc.output_path = str("output.path", gc.output_path);
    gc.outer_border_px = config.get_int("output.outer_border", gc.outer_border_px);

    gc.ball_relative_size = config.get_double("emblem.relative_size", gc.ball_relative_size);
    gc.pentagon_radius_factor =
        config.get_double("emblem.pentagon_radius_factor", gc.pentagon_radius_factor);
    gc.hexagon_radius_factor =
        config.get_double("emblem.hexagon_radius_factor", gc.hexagon_radius_factor);
    gc.hexagon_distance_factor =
        config.get_double("emblem.hexagon_distance_factor", gc.hexagon_distance_factor);
    gc.rotation_offset_degrees =
        config.get_double("emblem.rotation_offset_degrees", gc.rotation_offset_degrees);

    gc.coverage_warn_threshold_percent =
        config.get_double("coverage.warn_threshold_percent", gc.coverage_warn_threshold_percent);
    gc.validate = config.get_bool(resolve_key(config, "validation.enabled"), gc.validate);

    auto module = read_color(config, "colors.module", gc.colors.module);
    if (!module) return module.error();
    auto accent = read_color(config, "colors.accent", gc.colors.accent);
    if (!accent) return accent.error();
    auto background = read_color(config, "colors.background", gc.colors.background);
    if (!background) return background.error();
    auto pattern = read_color(config, "colors.pattern", gc.colors.pattern);
    if (!pattern) return pattern.error();

    gc.colors.module = module.value();
    gc.colors.accent = accent.value();
    gc.colors.background = background.value();
    gc.colors.pattern = pattern.value();

    auto status = gc.validate_ranges();
    if (!status) {
        return status.error();
    }

    LOG_DEBUG("Generator config: data='{}', module={}px, border={}, ball={:.2f}, logo={:.2f}",
              gc.data, gc.module_pixel_size, gc.border_modules,
              gc.ball_relative_size, gc.logo_relative_size);
    return gc;
}

Status GeneratorConfig::validate_ranges() const {
    if (data.empty()) {
        return invalid("qr.data", "must not be empty");
    }
    if (module_pixel_size <= 0) {
        return invalid("qr.module_pixel_size", "must be positive");
    }
    if (border_modules < 0) {
        return invalid("qr.border_modules", "must not be negative");
    }
    if (outer_border_px < 0) {
        return invalid("output.outer_border", "must not be negative");
    }

    // Worst case is a version 40 symbol
    const int64_t largest_side =
        (static_cast<int64_t>(QRMatrix::module_count_for(QRMatrix::max_version)) +
         2 * static_cast<int64_t>(border_modules)) * module_pixel_size + outer_border_px;
    if (largest_side > QRMatrix::max_pixel_side) {
        return invalid("qr.module_pixel_size",
                       "with qr.border_modules and output.outer_border gives a canvas of up to " +
                       std::to_string(largest_side) + "px, above the " +
                       std::to_string(QRMatrix::max_pixel_side) + "px limit");
    }
    if (logo_path.empty()) {
        return invalid("logo.path", "must not be empty");
    }
    if (output_path.empty()) {
        return invalid("output.path", "must not be empty");
    }
    if (!is_lossless_extension(output_path)) {
        return invalid("output.path", "must use a lossless format (.png, .bmp, .tif, .tiff, .ppm, .pgm)");
    }
    if (!in_open_unit_interval(ball_relative_size)) {
        return invalid("emblem.relative_size", "must be within (0, 1)");
    }
    if (!in_open_unit_interval(logo_relative_size)) {
        return invalid("logo.relative_size", "must be within (0, 1)");
    }
    if (logo_contrast <= 0.0) {
        return invalid("logo.contrast", "must be positive");
    }
    if (!in_open_unit_interval(pentagon_radius_factor)) {
        return invalid("emblem.pentagon_radius_factor", "must be within (0, 1)");
    }
    if (!in_open_unit_interval(hexagon_radius_factor)) {
        return invalid("emblem.hexagon_radius_factor", "must be within (0, 1)");
    }
    if (!in_open_unit_interval(hexagon_distance_factor)) {
        return invalid("emblem.hexagon_distance_factor", "must be within (0, 1)");
    }
    if (coverage_warn_threshold_percent <= 0.0 || coverage_warn_threshold_percent > 100.0) {
        return invalid("coverage.warn_threshold_percent", "must be within (0, 100]");
    }
    return Status::success();
}

QRSpecification GeneratorConfig::qr_specification() const {
    QRSpecification spec;
    spec.data = data;
    spec.error_correction_level = ErrorCorrectionLevel::H;
    spec.module_pixel_size = module_pixel_size;
    spec.border_modules = border_modules;
    return spec;
}

EmblemGeometry GeneratorConfig::emblem_geometry(int ball_diameter_px) const {
    EmblemGeometry geometry;
    geometry.ball_diameter_px = ball_diameter_px;
    geometry.pentagon_radius_factor = pentagon_radius_factor;
    geometry.hexagon_radius_factor = hexagon_radius_factor;
    geometry.hexagon_distance_factor = hexagon_distance_factor;
    geometry.rotation_offset_degrees = rotation_offset_degrees;
    return geometry;
}

}  // namespace kickqr
