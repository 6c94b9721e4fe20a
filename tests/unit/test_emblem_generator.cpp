#include <gtest/gtest.h>

#include "kickqr/core/raster.hpp"
#include "kickqr/emblem/emblem_generator.hpp"

#include <spdlog/sinks/null_sink.h>

#include <cmath>

using namespace kickqr;

class EmblemGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_ = std::make_shared<spdlog::logger>(
            "emblem_test", std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    static EmblemGeometry geometry(int diameter) {
        EmblemGeometry g;
        g.ball_diameter_px = diameter;
        return g;
    }

    static int count_color(const cv::Mat& bgra, const Color& color) {
        int count = 0;
        for (int y = 0; y < bgra.rows; ++y) {
            for (int x = 0; x < bgra.cols; ++x) {
                if (bgra.at<cv::Vec4b>(y, x)[3] == 255 && color_at(bgra, x, y) == color) {
                    ++count;
                }
            }
        }
        return count;
    }

    // Any pixel in the 3x3 window around p at least halfway to the pattern color
    bool stroked_near(const cv::Mat& bgra, cv::Point2d p) const {
        const int cx = static_cast<int>(std::lround(p.x));
        const int cy = static_cast<int>(std::lround(p.y));
        for (int y = cy - 1; y <= cy + 1; ++y) {
            for (int x = cx - 1; x <= cx + 1; ++x) {
                const auto px = bgra.at<cv::Vec4b>(y, x);
                if (px[3] == 255 &&
                    px[0] <= (colors_.pattern.b + colors_.background.b) / 2 &&
                    px[1] <= (colors_.pattern.g + colors_.background.g) / 2 &&
                    px[2] <= (colors_.pattern.r + colors_.background.r) / 2) {
                    return true;
                }
            }
        }
        return false;
    }

    bool plain_background(const cv::Mat& bgra, int x, int y) const {
        return bgra.at<cv::Vec4b>(y, x)[3] == 255 && color_at(bgra, x, y) == colors_.background;
    }

    EmblemColors colors_;
    DiagnosticSink log_;
};

TEST_F(EmblemGeneratorTest, SquareBgraCanvas) {
    EmblemGenerator generator(colors_, log_);
    auto result = generator.generate(geometry(200));
    ASSERT_TRUE(result.ok());

    EXPECT_EQ(result.value().cols, 200);
    EXPECT_EQ(result.value().rows, 200);
    EXPECT_EQ(result.value().type(), CV_8UC4);
}

TEST_F(EmblemGeneratorTest, CornersTransparentDiscOpaque) {
    EmblemGenerator generator(colors_, log_);
    auto result = generator.generate(geometry(200));
    ASSERT_TRUE(result.ok());
    const auto& emblem = result.value();

    EXPECT_EQ(emblem.at<cv::Vec4b>(0, 0)[3], 0);
    EXPECT_EQ(emblem.at<cv::Vec4b>(5, 194)[3], 0);
    EXPECT_EQ(emblem.at<cv::Vec4b>(199, 199)[3], 0);

    // Center sits inside the pentagon, away from any line
    EXPECT_EQ(emblem.at<cv::Vec4b>(99, 99)[3], 255);
    EXPECT_EQ(color_at(emblem, 99, 99), colors_.background);

    // Between the pattern and the outline
    EXPECT_EQ(emblem.at<cv::Vec4b>(100, 10)[3], 255);
}

TEST_F(EmblemGeneratorTest, DrawsPattern) {
    EmblemGenerator generator(colors_, log_);
    auto result = generator.generate(geometry(300));
    ASSERT_TRUE(result.ok());

    EXPECT_GT(count_color(result.value(), colors_.pattern), 0);
    EXPECT_GT(count_color(result.value(), colors_.background), 0);
}

TEST_F(EmblemGeneratorTest, HexagonsAtFifthTurnsAroundCenter) {
    EmblemGenerator generator(colors_, log_);
    auto result = generator.generate(geometry(400));
    ASSERT_TRUE(result.ok());
    const auto& emblem = result.value();

    // r = 200, hexagons 60px out with a 32px radius
    const cv::Point2d center(199.5, 199.5);
    for (int i = 0; i < 5; ++i) {
        const double angle = i * 72.0 * CV_PI / 180.0;
        const cv::Point2d hex_center(center.x + 60.0 * std::cos(angle),
                                     center.y + 60.0 * std::sin(angle));
        EXPECT_TRUE(stroked_near(emblem, hex_center + cv::Point2d(32.0, 0.0))) << "hexagon " << i;
        EXPECT_TRUE(stroked_near(emblem, hex_center - cv::Point2d(32.0, 0.0))) << "hexagon " << i;
    }

    // Rightmost vertex of hexagon 0 at (0.3 + 0.16) * r
    EXPECT_TRUE(stroked_near(emblem, cv::Point2d(center.x + 92.0, center.y)));

    // Inside hexagon 0, clear of every line
    EXPECT_TRUE(plain_background(emblem, 259, 199));

    // Just past hexagon 0's radius
    EXPECT_TRUE(plain_background(emblem, 296, 199));

    // Where a 60 degree step would put hexagon 1's rightmost vertex
    EXPECT_TRUE(plain_background(emblem, 261, 251));
}

TEST_F(EmblemGeneratorTest, PentagonPointsUp) {
    // Hexagons pushed out to a ring of 120..160px so the pentagon stands alone
    auto g = geometry(400);
    g.hexagon_distance_factor = 0.7;
    g.hexagon_radius_factor = 0.1;

    EmblemGenerator generator(colors_, log_);
    auto result = generator.generate(g);
    ASSERT_TRUE(result.ok());
    const auto& emblem = result.value();

    // Top vertex at center.y - 0.18 * r
    EXPECT_TRUE(stroked_near(emblem, cv::Point2d(199.5, 199.5 - 36.0)));

    // Bottom edge is flat at 36 * cos(36) below the center
    EXPECT_TRUE(stroked_near(emblem, cv::Point2d(199.5, 199.5 + 36.0 * std::cos(CV_PI / 5.0))));
    EXPECT_TRUE(plain_background(emblem, 199, 236));

    EXPECT_TRUE(plain_background(emblem, 199, 199));
    EXPECT_TRUE(plain_background(emblem, 199, 157));
}

TEST_F(EmblemGeneratorTest, Deterministic) {
    EmblemGenerator generator(colors_, log_);
    auto first = generator.generate(geometry(358));
    auto second = generator.generate(geometry(358));
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());

    EXPECT_EQ(cv::norm(first.value(), second.value(), cv::NORM_INF), 0.0);
}

TEST_F(EmblemGeneratorTest, StrokeWidth) {
    EXPECT_EQ(EmblemGenerator::stroke_width(1), 1);
    EXPECT_EQ(EmblemGenerator::stroke_width(199), 1);
    EXPECT_EQ(EmblemGenerator::stroke_width(400), 2);
    EXPECT_EQ(EmblemGenerator::stroke_width(1000), 5);
}

TEST_F(EmblemGeneratorTest, RegularPolygonVertices) {
    auto square = EmblemGenerator::regular_polygon(cv::Point2d(50, 50), 10.0, 4, 0.0);
    ASSERT_EQ(square.size(), 4u);
    EXPECT_NEAR(square[0].x, 60.0, 1e-9);
    EXPECT_NEAR(square[0].y, 50.0, 1e-9);
    EXPECT_NEAR(square[1].x, 50.0, 1e-9);
    EXPECT_NEAR(square[1].y, 60.0, 1e-9);

    // -90 degrees puts the first vertex straight up
    auto pentagon = EmblemGenerator::regular_polygon(cv::Point2d(0, 0), 18.0, 5, -90.0);
    ASSERT_EQ(pentagon.size(), 5u);
    EXPECT_NEAR(pentagon[0].x, 0.0, 1e-9);
    EXPECT_NEAR(pentagon[0].y, -18.0, 1e-9);
    for (const auto& v : pentagon) {
        EXPECT_NEAR(std::hypot(v.x, v.y), 18.0, 1e-9);
    }
}

TEST_F(EmblemGeneratorTest, TinyDiameter) {
    EmblemGenerator generator(colors_, log_);
    auto result = generator.generate(geometry(1));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().cols, 1);
}

TEST_F(EmblemGeneratorTest, RejectsNonPositiveDiameter) {
    EmblemGenerator generator(colors_, log_);
    auto result = generator.generate(geometry(0));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_CONFIG);
}

TEST_F(EmblemGeneratorTest, RejectsFactorsOutsideUnitInterval) {
    EmblemGenerator generator(colors_, log_);
    auto g = geometry(200);
    g.hexagon_radius_factor = 1.5;

    auto result = generator.generate(g);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_CONFIG);
}
