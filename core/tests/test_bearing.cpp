#include <gtest/gtest.h>
#include "mapbearing/bearing.h"
#include "mapbearing/error.h"
#include "scene_utils.h"

#include <cmath>
#include <limits>

using namespace MapBearing;

static MarkerGeometry MakeGeometry(cv::Point2f tip, cv::Point2f b0, cv::Point2f b1) {
    MarkerGeometry g;
    g.tip  = tip;
    g.base = {b0, b1};
    return g;
}

// Base centered on (50, 50); tip placed 40 px away in direction \p dx, \p dy.
static MarkerGeometry Pointing(float dx, float dy) {
    const cv::Point2f mid(50.0f, 50.0f);
    const cv::Point2f perp(-dy * 10.0f, dx * 10.0f);
    return MakeGeometry(mid + cv::Point2f(dx * 40.0f, dy * 40.0f), mid + perp, mid - perp);
}

TEST(Bearing, CardinalDirections) {
    EXPECT_DOUBLE_EQ(ComputeBearing(Pointing(0.0f, -1.0f)), 0.0);
    EXPECT_DOUBLE_EQ(ComputeBearing(Pointing(1.0f, 0.0f)), 90.0);
    EXPECT_DOUBLE_EQ(ComputeBearing(Pointing(0.0f, 1.0f)), 180.0);
    EXPECT_DOUBLE_EQ(ComputeBearing(Pointing(-1.0f, 0.0f)), 270.0);
}

TEST(Bearing, Diagonals) {
    EXPECT_NEAR(ComputeBearing(Pointing(1.0f, -1.0f)), 45.0, 1e-9);
    EXPECT_NEAR(ComputeBearing(Pointing(1.0f, 1.0f)), 135.0, 1e-9);
    EXPECT_NEAR(ComputeBearing(Pointing(-1.0f, 1.0f)), 225.0, 1e-9);
    EXPECT_NEAR(ComputeBearing(Pointing(-1.0f, -1.0f)), 315.0, 1e-9);
}

TEST(Bearing, RawImageAngleUsesImageAxes) {
    EXPECT_DOUBLE_EQ(RawImageAngle(Pointing(0.0f, -1.0f)), -90.0);
    EXPECT_DOUBLE_EQ(RawImageAngle(Pointing(1.0f, 0.0f)), 0.0);
    EXPECT_DOUBLE_EQ(RawImageAngle(Pointing(-1.0f, 0.0f)), 180.0);
}

TEST(Bearing, SweepStaysInRangeAndMatchesCompassAngle) {
    constexpr double kPi = 3.14159265358979323846;
    for (int deg = 0; deg < 360; deg += 7) {
        const double rad = deg * kPi / 180.0;
        // Compass direction: 0 = up (-y), clockwise.
        const auto dx = static_cast<float>(std::sin(rad));
        const auto dy = static_cast<float>(-std::cos(rad));
        const double b = ComputeBearing(Pointing(dx, dy));
        EXPECT_GE(b, 0.0) << "deg=" << deg;
        EXPECT_LT(b, 360.0) << "deg=" << deg;
        EXPECT_LT(test::BearingDelta(b, deg), 1e-3) << "deg=" << deg;
    }
}

TEST(Bearing, WorkedExample) {
    const MarkerGeometry g = MakeGeometry({50.0f, 20.0f}, {40.0f, 60.0f}, {60.0f, 60.0f});
    EXPECT_DOUBLE_EQ(RawImageAngle(g), -90.0);
    EXPECT_DOUBLE_EQ(ComputeBearing(g), 0.0);

    const NormalizedPosition pos = NormalizePosition(g.tip, cv::Size(100, 100));
    EXPECT_DOUBLE_EQ(pos.xpos, 0.5);
    EXPECT_DOUBLE_EQ(pos.ypos, 0.8);
}

TEST(Bearing, BaseOrderDoesNotMatter) {
    const MarkerGeometry a = MakeGeometry({90.0f, 70.0f}, {20.0f, 10.0f}, {30.0f, 60.0f});
    const MarkerGeometry b = MakeGeometry({90.0f, 70.0f}, {30.0f, 60.0f}, {20.0f, 10.0f});
    EXPECT_DOUBLE_EQ(ComputeBearing(a), ComputeBearing(b));
}

TEST(Bearing, RepeatedCallsAreBitIdentical) {
    const MarkerGeometry g = MakeGeometry({13.7f, 91.2f}, {40.1f, 20.3f}, {55.9f, 33.3f});
    const double first  = ComputeBearing(g);
    const double second = ComputeBearing(g);
    EXPECT_EQ(first, second);
}

TEST(Bearing, TipOnBaseMidpointIsGeometryFailure) {
    const MarkerGeometry g = MakeGeometry({50.0f, 50.0f}, {40.0f, 50.0f}, {60.0f, 50.0f});
    try {
        ComputeBearing(g);
        FAIL() << "expected GeometryError";
    } catch (const GeometryError& e) {
        EXPECT_EQ(e.stage(), PipelineStage::BearingCalculation);
    }
}

TEST(NormalizeBearing, WrapsIntoRange) {
    EXPECT_DOUBLE_EQ(NormalizeBearing(360.0), 0.0);
    EXPECT_DOUBLE_EQ(NormalizeBearing(-90.0), 270.0);
    EXPECT_DOUBLE_EQ(NormalizeBearing(725.0), 5.0);
    EXPECT_DOUBLE_EQ(NormalizeBearing(0.0), 0.0);
    EXPECT_THROW(NormalizeBearing(std::numeric_limits<double>::quiet_NaN()), GeometryError);
}

TEST(Bearing, NonFiniteGeometryFailsInBearingStage) {
    const float inf        = std::numeric_limits<float>::infinity();
    const MarkerGeometry g = MakeGeometry({inf, 20.0f}, {40.0f, 60.0f}, {60.0f, 60.0f});
    try {
        ComputeBearing(g);
        FAIL() << "expected GeometryError";
    } catch (const GeometryError& e) {
        EXPECT_EQ(e.stage(), PipelineStage::BearingCalculation);
        EXPECT_EQ(e.code(), ErrorCode::GeometryFailure);
    }
    try {
        NormalizePosition(g.tip, cv::Size(100, 100));
        FAIL() << "expected GeometryError";
    } catch (const GeometryError& e) {
        EXPECT_EQ(e.stage(), PipelineStage::BearingCalculation);
    }
}

TEST(NormalizePosition, CenterIsHalfForAnyAspectRatio) {
    const NormalizedPosition wide = NormalizePosition({320.0f, 100.0f}, cv::Size(640, 200));
    EXPECT_DOUBLE_EQ(wide.xpos, 0.5);
    EXPECT_DOUBLE_EQ(wide.ypos, 0.5);

    const NormalizedPosition tall = NormalizePosition({75.0f, 450.0f}, cv::Size(150, 900));
    EXPECT_DOUBLE_EQ(tall.xpos, 0.5);
    EXPECT_DOUBLE_EQ(tall.ypos, 0.5);
}

TEST(NormalizePosition, ClampsOutsideTips) {
    const NormalizedPosition pos = NormalizePosition({-5.0f, 250.0f}, cv::Size(100, 200));
    EXPECT_DOUBLE_EQ(pos.xpos, 0.0);
    EXPECT_DOUBLE_EQ(pos.ypos, 0.0);
}

TEST(NormalizePosition, RejectsEmptySize) {
    EXPECT_THROW(NormalizePosition({1.0f, 1.0f}, cv::Size(0, 10)), InputError);
}
