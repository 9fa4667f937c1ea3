#include <gtest/gtest.h>
#include "mapbearing/error.h"
#include "mapbearing/geometry.h"

#include <algorithm>
#include <vector>

using namespace MapBearing;

static double Sum(const cv::Point2f& p) { return p.x + p.y; }
static double RowMinusCol(const cv::Point2f& p) { return p.y - p.x; }

TEST(OrderCorners, AxisAlignedSquareAnyOrder) {
    std::vector<cv::Point2f> pts = {
        {100.0f, 100.0f}, {0.0f, 100.0f}, {100.0f, 0.0f}, {0.0f, 0.0f}};
    std::sort(pts.begin(), pts.end(),
              [](const cv::Point2f& a, const cv::Point2f& b) { return a.y < b.y; });

    Quadrilateral q = OrderCorners(pts);
    EXPECT_EQ(q.top_left, cv::Point2f(0.0f, 0.0f));
    EXPECT_EQ(q.top_right, cv::Point2f(100.0f, 0.0f));
    EXPECT_EQ(q.bottom_right, cv::Point2f(100.0f, 100.0f));
    EXPECT_EQ(q.bottom_left, cv::Point2f(0.0f, 100.0f));
}

TEST(OrderCorners, SlightlySkewedQuadSatisfiesSumDiffProperty) {
    const std::vector<cv::Point2f> quad = {
        {12.0f, 8.0f}, {205.0f, 15.0f}, {198.0f, 141.0f}, {5.0f, 133.0f}};
    Quadrilateral q = OrderCorners(quad);

    EXPECT_EQ(q.top_left, quad[0]);
    EXPECT_EQ(q.top_right, quad[1]);
    EXPECT_EQ(q.bottom_right, quad[2]);
    EXPECT_EQ(q.bottom_left, quad[3]);

    for (const auto& p : quad) {
        EXPECT_LE(Sum(q.top_left), Sum(p));
        EXPECT_GE(Sum(q.bottom_right), Sum(p));
        EXPECT_LE(RowMinusCol(q.top_right), RowMinusCol(p));
        EXPECT_GE(RowMinusCol(q.bottom_left), RowMinusCol(p));
    }
}

TEST(OrderCorners, UsesEveryContourPoint) {
    // Dense outline of a rectangle: edge points must never win over corners.
    Silhouette contour;
    for (int x = 10; x <= 90; ++x) { contour.emplace_back(x, 20); }
    for (int y = 21; y <= 60; ++y) { contour.emplace_back(90, y); }
    for (int x = 89; x >= 10; --x) { contour.emplace_back(x, 60); }
    for (int y = 59; y > 20; --y) { contour.emplace_back(10, y); }

    Quadrilateral q = OrderCorners(contour);
    EXPECT_EQ(q.top_left, cv::Point2f(10.0f, 20.0f));
    EXPECT_EQ(q.top_right, cv::Point2f(90.0f, 20.0f));
    EXPECT_EQ(q.bottom_right, cv::Point2f(90.0f, 60.0f));
    EXPECT_EQ(q.bottom_left, cv::Point2f(10.0f, 60.0f));
}

TEST(OrderCorners, TooFewPointsIsGeometryFailure) {
    const std::vector<cv::Point2f> pts = {{0.0f, 0.0f}, {1.0f, 0.0f}, {1.0f, 1.0f}};
    try {
        OrderCorners(pts);
        FAIL() << "expected GeometryError";
    } catch (const GeometryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::GeometryFailure);
        EXPECT_EQ(e.stage(), PipelineStage::RegionExtraction);
    }
}

TEST(OrderCorners, DegenerateLineIsGeometryFailure) {
    const std::vector<cv::Point2f> pts = {
        {0.0f, 0.0f}, {1.0f, 0.0f}, {2.0f, 0.0f}, {3.0f, 0.0f}};
    EXPECT_THROW(OrderCorners(pts), GeometryError);
}

TEST(SelectContour, EmptyListIsSegmentationFailure) {
    std::vector<Silhouette> contours;
    try {
        SelectContour(contours, ContourSelection::Largest, PipelineStage::MarkerLocation);
        FAIL() << "expected SegmentationError";
    } catch (const SegmentationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::SegmentationFailure);
        EXPECT_EQ(e.stage(), PipelineStage::MarkerLocation);
    }
}

TEST(SelectContour, Policies) {
    const Silhouette small = {{0, 0}, {4, 0}, {4, 4}, {0, 4}};
    const Silhouette large = {{10, 10}, {50, 10}, {50, 50}, {10, 50}};
    const std::vector<Silhouette> contours = {small, large};

    EXPECT_EQ(SelectContour(contours, ContourSelection::First, PipelineStage::RegionExtraction),
              0u);
    EXPECT_EQ(SelectContour(contours, ContourSelection::Largest, PipelineStage::RegionExtraction),
              1u);
    EXPECT_THROW(
        SelectContour(contours, ContourSelection::Single, PipelineStage::RegionExtraction),
        SegmentationError);

    const std::vector<Silhouette> single = {large};
    EXPECT_EQ(SelectContour(single, ContourSelection::Single, PipelineStage::RegionExtraction),
              0u);
}

TEST(CommonStrings, EnumConversions) {
    EXPECT_EQ(FromContourSelectionString(ToContourSelectionString(ContourSelection::Single)),
              ContourSelection::Single);
    EXPECT_EQ(FromTipTieBreakString("Error"), TipTieBreak::Error);
    EXPECT_EQ(ToPipelineStageString(PipelineStage::MarkerLocation), "MarkerLocation");
    EXPECT_EQ(ToErrorCodeString(ErrorCode::SegmentationFailure), "SegmentationFailure");
    EXPECT_THROW(FromContourSelectionString("Biggest"), FormatError);
}
