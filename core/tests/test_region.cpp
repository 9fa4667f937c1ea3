#include <gtest/gtest.h>
#include "mapbearing/error.h"
#include "mapbearing/region.h"
#include "scene_utils.h"

#include <cmath>
#include <vector>

using namespace MapBearing;

namespace {

const cv::Size kMapSize(240, 160);
const cv::Size kCanvas(480, 480);

cv::Mat TiltedPhoto(double angle_deg) {
    const cv::Mat map = test::DrawMarkerMap(kMapSize, {});
    return test::EmbedInPhoto(map, kCanvas, angle_deg);
}

} // namespace

TEST(StraighteningAngle, FoldsIntoSmallestRotation) {
    EXPECT_DOUBLE_EQ(StraighteningAngle(90.0), 0.0);
    EXPECT_DOUBLE_EQ(StraighteningAngle(80.0), -10.0);
    EXPECT_DOUBLE_EQ(StraighteningAngle(10.0), 10.0);
    EXPECT_DOUBLE_EQ(StraighteningAngle(-80.0), 10.0);
    EXPECT_DOUBLE_EQ(StraighteningAngle(-10.0), -10.0);
    EXPECT_DOUBLE_EQ(StraighteningAngle(45.0), 45.0);
    EXPECT_DOUBLE_EQ(StraighteningAngle(46.0), -44.0);
    EXPECT_DOUBLE_EQ(StraighteningAngle(0.0), 0.0);
}

TEST(RegionExtractor, SegmentSeparatesMapFromDesk) {
    const cv::Mat photo = TiltedPhoto(0.0);
    RegionExtractor extractor;
    double threshold   = 0.0;
    const cv::Mat mask = extractor.Segment(photo, &threshold);

    EXPECT_GT(threshold, 20.0);
    EXPECT_LT(threshold, 235.0);
    EXPECT_EQ(mask.at<uint8_t>(kCanvas.height / 2, kCanvas.width / 2), 255);
    EXPECT_EQ(mask.at<uint8_t>(5, 5), 0);
}

TEST(RegionExtractor, StraightensAndRectifiesTiltedMap) {
    const cv::Mat photo = TiltedPhoto(12.0);

    RegionExtractor extractor;
    const RegionResult result = extractor.Run(photo);

    EXPECT_NEAR(std::abs(result.rotation_deg), 12.0, 1.5);
    ASSERT_FALSE(result.map.empty());
    EXPECT_EQ(result.map.size(), result.crop.size());
    EXPECT_NEAR(result.map.cols, kMapSize.width, 8);
    EXPECT_NEAR(result.map.rows, kMapSize.height, 8);

    // Rectified interior is map paper, not desk.
    const std::vector<cv::Point> samples = {
        {result.map.cols / 2, result.map.rows / 2},
        {result.map.cols / 4, result.map.rows / 4},
        {3 * result.map.cols / 4, 3 * result.map.rows / 4},
    };
    for (const auto& p : samples) {
        const cv::Vec3b px = result.map.at<cv::Vec3b>(p);
        EXPECT_GT(px[0], 200) << "sample " << p;
        EXPECT_GT(px[2], 200) << "sample " << p;
    }

    const Quadrilateral& q = result.corners;
    EXPECT_LT(q.top_left.x, q.top_right.x);
    EXPECT_LT(q.bottom_left.x, q.bottom_right.x);
    EXPECT_LT(q.top_left.y, q.bottom_left.y);
    EXPECT_LT(q.top_right.y, q.bottom_right.y);
}

TEST(RegionExtractor, SourceCornersMapBackIntoPhotograph) {
    RegionExtractor extractor;
    const RegionResult result = extractor.Run(TiltedPhoto(12.0));

    // Pixel corners of the map before the scene was rotated.
    const float x0 = static_cast<float>((kCanvas.width - kMapSize.width) / 2);
    const float y0 = static_cast<float>((kCanvas.height - kMapSize.height) / 2);
    const float x1 = x0 + static_cast<float>(kMapSize.width - 1);
    const float y1 = y0 + static_cast<float>(kMapSize.height - 1);
    const std::vector<cv::Point2f> upright = {{x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}};

    const cv::Point2f center(kCanvas.width * 0.5f, kCanvas.height * 0.5f);
    std::vector<cv::Point2f> expected;
    cv::transform(upright, expected, cv::getRotationMatrix2D(center, 12.0, 1.0));

    const std::vector<cv::Point2f> actual = result.source_corners.ToVector();
    ASSERT_EQ(actual.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_LT(cv::norm(actual[i] - expected[i]), 5.0) << "corner " << i;
    }
    // The straightened frame differs from the photograph once the scene is tilted.
    EXPECT_GT(cv::norm(result.straightened_corners.top_left - result.source_corners.top_left),
              5.0);
}

TEST(RegionExtractor, RectifiesKeystonedMap) {
    const cv::Size map_size(300, 200);
    const cv::Mat photo =
        test::KeystonePhoto(test::DrawMarkerMap(map_size, {}), cv::Size(500, 400), 40.0f);

    RegionExtractor extractor;
    const RegionResult result = extractor.Run(photo);

    EXPECT_EQ(result.map.size(), result.crop.size());
    EXPECT_NEAR(result.map.cols, map_size.width, 6);
    EXPECT_NEAR(result.map.rows, map_size.height, 6);

    // The top edge is narrower in the photograph; only a perspective warp
    // brings map paper into the top corners of the crop.
    const std::vector<cv::Point> top_corners = {{4, 4}, {result.map.cols - 5, 4}};
    for (const auto& p : top_corners) {
        const cv::Vec3b px = result.map.at<cv::Vec3b>(p);
        EXPECT_GT(px[0], 200) << "corner " << p;
        EXPECT_GT(px[2], 200) << "corner " << p;
    }
}

TEST(RegionExtractor, NegativeTiltRecoversSameSize) {
    RegionExtractor extractor;
    const RegionResult result = extractor.Run(TiltedPhoto(-20.0));
    EXPECT_NEAR(std::abs(result.rotation_deg), 20.0, 1.5);
    EXPECT_NEAR(result.map.cols, kMapSize.width, 8);
    EXPECT_NEAR(result.map.rows, kMapSize.height, 8);
}

TEST(RegionExtractor, WorksWithoutCanvasExpansion) {
    RegionExtractorConfig cfg;
    cfg.expand_canvas = false;
    RegionExtractor extractor(cfg);

    const RegionResult result = extractor.Run(TiltedPhoto(6.0));
    EXPECT_NEAR(result.map.cols, kMapSize.width, 8);
    EXPECT_NEAR(result.map.rows, kMapSize.height, 8);
}

TEST(RegionExtractor, AcceptsGrayscaleInput) {
    cv::Mat gray;
    cv::cvtColor(TiltedPhoto(0.0), gray, cv::COLOR_BGR2GRAY);

    RegionExtractor extractor;
    const RegionResult result = extractor.Run(gray);
    EXPECT_EQ(result.map.channels(), 3);
    EXPECT_NEAR(result.map.cols, kMapSize.width, 8);
}

TEST(RegionExtractor, BlankPhotoIsSegmentationFailure) {
    const cv::Mat photo(kCanvas, CV_8UC3, cv::Scalar(0, 0, 0));
    try {
        RegionExtractor().Run(photo);
        FAIL() << "expected SegmentationError";
    } catch (const SegmentationError& e) {
        EXPECT_EQ(e.stage(), PipelineStage::RegionExtraction);
        EXPECT_EQ(e.code(), ErrorCode::SegmentationFailure);
    }
}

TEST(RegionExtractor, EmptyImageIsInputError) {
    EXPECT_THROW(RegionExtractor().Run(cv::Mat()), InputError);
}

TEST(RegionExtractorConfig, RejectsInvalidKernels) {
    RegionExtractorConfig cfg;
    cfg.blur_kernel = 4;
    EXPECT_THROW(cfg.Validate(), FormatError);

    cfg              = RegionExtractorConfig{};
    cfg.morph_kernel = 0;
    EXPECT_THROW(RegionExtractor{cfg}, FormatError);

    cfg                  = RegionExtractorConfig{};
    cfg.erode_iterations = -1;
    EXPECT_THROW(cfg.Validate(), FormatError);
}
