#include <gtest/gtest.h>

#include "kickqr/core/config.hpp"
#include "kickqr/core/generator_config.hpp"
#include "kickqr/core/logger.hpp"

#include <fstream>
#include <filesystem>

namespace fs = std::filesystem;
using namespace kickqr;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Initialize logger for tests
        Logger::init("", LogLevel::OFF, LogLevel::OFF);

        // Create temp config file
        temp_dir_ = fs::temp_directory_path() / "kickqr_config_test";
        fs::create_directories(temp_dir_);

        config_path_ = temp_dir_ / "test_config.yaml";

        std::ofstream f(config_path_);
        f << R"(
qr:
  data: "https://example.org"
  module_pixel_size: 20
  border_modules: 4

logo:
  path: "club_logo.png"
  contrast: 1.25

output:
  path: "out/print.png"

colors:
  accent: [0, 120, 60]

validation:
  enabled: true
)";
    }

    void TearDown() override {
        fs::remove_all(temp_dir_);
    }

    fs::path temp_dir_;
    fs::path config_path_;
};

TEST_F(ConfigTest, LoadValid) {
    Config config;
    EXPECT_TRUE(config.load(config_path_.string()));
    EXPECT_EQ(config.file_path(), config_path_.string());
}

TEST_F(ConfigTest, LoadInvalid) {
    Config config;
    EXPECT_FALSE(config.load("/nonexistent/path/config.yaml"));
}

TEST_F(ConfigTest, GetString) {
    Config config;
    ASSERT_TRUE(config.load(config_path_.string()));

    EXPECT_EQ(config.get_string("qr.data"), "https://example.org");
    EXPECT_EQ(config.get_string("nonexistent", "default"), "default");
}

TEST_F(ConfigTest, GetInt) {
    Config config;
    ASSERT_TRUE(config.load(config_path_.string()));

    EXPECT_EQ(config.get_int("qr.module_pixel_size"), 20);
    EXPECT_EQ(config.get_int("qr.border_modules"), 4);
    EXPECT_EQ(config.get_int("nonexistent", 42), 42);
}

TEST_F(ConfigTest, GetDouble) {
    Config config;
    ASSERT_TRUE(config.load(config_path_.string()));

    EXPECT_DOUBLE_EQ(config.get_double("logo.contrast"), 1.25);
    EXPECT_DOUBLE_EQ(config.get_double("nonexistent", 1.5), 1.5);
}

TEST_F(ConfigTest, GetBool) {
    Config config;
    ASSERT_TRUE(config.load(config_path_.string()));

    EXPECT_TRUE(config.get_bool("validation.enabled"));
    EXPECT_FALSE(config.get_bool("nonexistent", false));
}

TEST_F(ConfigTest, GetIntList) {
    Config config;
    ASSERT_TRUE(config.load(config_path_.string()));

    auto accent = config.get_int_list("colors.accent");
    ASSERT_EQ(accent.size(), 3u);
    EXPECT_EQ(accent[0], 0);
    EXPECT_EQ(accent[1], 120);
    EXPECT_EQ(accent[2], 60);

    EXPECT_TRUE(config.get_int_list("colors.missing").empty());
}

TEST_F(ConfigTest, Has) {
    Config config;
    ASSERT_TRUE(config.load(config_path_.string()));

    EXPECT_TRUE(config.has("qr.data"));
    EXPECT_TRUE(config.has("colors.accent"));
    EXPECT_FALSE(config.has("nonexistent.key"));
}

TEST_F(ConfigTest, Override) {
    Config config;
    ASSERT_TRUE(config.load(config_path_.string()));

    // Original value
    EXPECT_EQ(config.get_int("qr.module_pixel_size"), 20);

    // Override
    config.override("qr.module_pixel_size", "40");
    EXPECT_EQ(config.get_int("qr.module_pixel_size"), 40);
}

TEST_F(ConfigTest, OverrideNotANumberFallsBack) {
    Config config;
    config.override("qr.module_pixel_size", "big");
    EXPECT_EQ(config.get_int("qr.module_pixel_size", 35), 35);
}

TEST_F(ConfigTest, OverrideIntListFromCommaText) {
    Config config;
    config.override("colors.module", "10,20,30");

    auto values = config.get_int_list("colors.module");
    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(values[2], 30);
}

TEST_F(ConfigTest, ParseArgs) {
    Config config;
    ASSERT_TRUE(config.load(config_path_.string()));

    const char* argv[] = {
        "program",
        "--qr.module_pixel_size=25",
        "--logo.contrast", "1.5",
        "--validate"
    };
    int argc = 5;

    config.parse_args(argc, const_cast<char**>(argv));

    EXPECT_EQ(config.get_int("qr.module_pixel_size"), 25);
    EXPECT_DOUBLE_EQ(config.get_double("logo.contrast"), 1.5);
    EXPECT_TRUE(config.get_bool("validate"));
}

// ============================================================================
// GeneratorConfig
// ============================================================================

TEST_F(ConfigTest, GeneratorDefaultsWithoutFile) {
    Config config;
    auto result = GeneratorConfig::from_config(config);
    ASSERT_TRUE(result.ok());

    const auto& gc = result.value();
    EXPECT_EQ(gc.data, "https://www.ayso154cypress.org");
    EXPECT_EQ(gc.module_pixel_size, 35);
    EXPECT_EQ(gc.border_modules, 6);
    EXPECT_EQ(gc.outer_border_px, 20);
    EXPECT_DOUBLE_EQ(gc.ball_relative_size, 0.25);
    EXPECT_DOUBLE_EQ(gc.logo_relative_size, 0.7);
    EXPECT_DOUBLE_EQ(gc.logo_contrast, 1.1);
    EXPECT_DOUBLE_EQ(gc.coverage_warn_threshold_percent, 25.0);
    EXPECT_FALSE(gc.validate);
    EXPECT_EQ(gc.colors.module, (Color{0, 0, 102}));
    EXPECT_EQ(gc.colors.accent, (Color{200, 16, 46}));
    EXPECT_EQ(gc.colors.background, (Color{255, 255, 255}));
    EXPECT_EQ(gc.colors.pattern, (Color{160, 160, 160}));
}

TEST_F(ConfigTest, GeneratorReadsFile) {
    Config config;
    ASSERT_TRUE(config.load(config_path_.string()));

    auto result = GeneratorConfig::from_config(config);
    ASSERT_TRUE(result.ok());

    const auto& gc = result.value();
    EXPECT_EQ(gc.data, "https://example.org");
    EXPECT_EQ(gc.module_pixel_size, 20);
    EXPECT_EQ(gc.logo_path, "club_logo.png");
    EXPECT_EQ(gc.output_path, "out/print.png");
    EXPECT_EQ(gc.colors.accent, (Color{0, 120, 60}));
    EXPECT_TRUE(gc.validate);
}

TEST_F(ConfigTest, CommandLineAliasesWinOverFile) {
    Config config;
    ASSERT_TRUE(config.load(config_path_.string()));

    const char* argv[] = {
        "program",
        "--url", "https://kick.example/club",
        "--logo_path=badge.png",
        "--output_path", "poster.bmp"
    };
    config.parse_args(6, const_cast<char**>(argv));

    auto result = GeneratorConfig::from_config(config);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().data, "https://kick.example/club");
    EXPECT_EQ(result.value().logo_path, "badge.png");
    EXPECT_EQ(result.value().output_path, "poster.bmp");
}

TEST_F(ConfigTest, QrSpecificationIsAlwaysLevelH) {
    GeneratorConfig gc;
    gc.module_pixel_size = 12;
    gc.border_modules = 2;

    auto spec = gc.qr_specification();
    EXPECT_EQ(spec.error_correction_level, ErrorCorrectionLevel::H);
    EXPECT_EQ(spec.module_pixel_size, 12);
    EXPECT_EQ(spec.border_modules, 2);
    EXPECT_EQ(spec.data, gc.data);
}

TEST_F(ConfigTest, EmblemGeometryCarriesFactors) {
    GeneratorConfig gc;
    gc.hexagon_distance_factor = 0.35;

    auto geometry = gc.emblem_geometry(358);
    EXPECT_EQ(geometry.ball_diameter_px, 358);
    EXPECT_DOUBLE_EQ(geometry.ball_radius(), 179.0);
    EXPECT_DOUBLE_EQ(geometry.pentagon_radius_factor, 0.18);
    EXPECT_DOUBLE_EQ(geometry.hexagon_distance_factor, 0.35);
    EXPECT_DOUBLE_EQ(geometry.rotation_offset_degrees, -90.0);
}

TEST_F(ConfigTest, LargestPrintableModuleSizeAccepted) {
    // (177 + 2 * 6) * 173 + 20 stays within the raster limit
    Config config;
    config.override("qr.module_pixel_size", "173");

    auto result = GeneratorConfig::from_config(config);
    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_EQ(result.value().module_pixel_size, 173);
}

struct InvalidOverride {
    const char* key;
    const char* value;
};

class GeneratorConfigRejectTest : public ::testing::TestWithParam<InvalidOverride> {
protected:
    void SetUp() override {
        Logger::init("", LogLevel::OFF, LogLevel::OFF);
    }
};

TEST_P(GeneratorConfigRejectTest, RejectsOutOfRange) {
    Config config;
    config.override(GetParam().key, GetParam().value);

    auto result = GeneratorConfig::from_config(config);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_CONFIG);
}

INSTANTIATE_TEST_SUITE_P(
    OutOfRange, GeneratorConfigRejectTest,
    ::testing::Values(
        InvalidOverride{"qr.module_pixel_size", "0"},
        InvalidOverride{"qr.border_modules", "-1"},
        InvalidOverride{"output.outer_border", "-2"},
        InvalidOverride{"output.path", "print.jpg"},
        InvalidOverride{"emblem.relative_size", "1.0"},
        InvalidOverride{"logo.relative_size", "0"},
        InvalidOverride{"logo.contrast", "-0.5"},
        InvalidOverride{"emblem.hexagon_distance_factor", "1.2"},
        InvalidOverride{"coverage.warn_threshold_percent", "0"},
        InvalidOverride{"colors.accent", "300,0,0"},
        InvalidOverride{"colors.module", "1,2"},
        InvalidOverride{"qr.module_pixel_size", "20000"},
        InvalidOverride{"qr.border_modules", "2000000000"},
        InvalidOverride{"output.outer_border", "40000"}
    ));
