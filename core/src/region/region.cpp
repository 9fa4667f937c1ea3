#include "mapbearing/region.h"
#include "mapbearing/error.h"
#include "detail/cv_utils.h"
#include "detail/debug_image.h"

#include <spdlog/spdlog.h>

#include <opencv2/imgproc.hpp>

#include <cmath>
#include <string>
#include <vector>

namespace MapBearing {
namespace {

constexpr double kQuarterTurn = 90.0;

static void CheckOddKernel(int k, const char* name) {
    if (k <= 0 || k % 2 == 0) {
        throw FormatError(std::string(name) + " must be a positive odd size, got " +
                          std::to_string(k));
    }
}

// Rotation about the image center. With expand=true the translation is
// shifted so the whole rotated frame fits the returned canvas.
static cv::Mat BuildRotation(const cv::Size& size, double angle_deg, bool expand,
                             cv::Size& canvas) {
    const cv::Point2f center(static_cast<float>(size.width) * 0.5f,
                             static_cast<float>(size.height) * 0.5f);
    cv::Mat rotation = cv::getRotationMatrix2D(center, angle_deg, 1.0);
    canvas           = size;
    if (!expand) { return rotation; }

    const double cos_a = std::abs(rotation.at<double>(0, 0));
    const double sin_a = std::abs(rotation.at<double>(0, 1));
    const int new_w    = static_cast<int>(std::ceil(size.height * sin_a + size.width * cos_a));
    const int new_h    = static_cast<int>(std::ceil(size.height * cos_a + size.width * sin_a));
    rotation.at<double>(0, 2) += new_w * 0.5 - center.x;
    rotation.at<double>(1, 2) += new_h * 0.5 - center.y;
    canvas = cv::Size(new_w, new_h);
    return rotation;
}

static cv::Mat DrawOutline(const cv::Mat& bgr, const Silhouette& contour,
                           const Quadrilateral& quad) {
    cv::Mat vis = bgr.clone();
    cv::drawContours(vis, std::vector<Silhouette>{contour}, -1, cv::Scalar(0, 255, 0), 2);
    const std::vector<cv::Point2f> corners = quad.ToVector();
    for (size_t i = 0; i < corners.size(); ++i) {
        cv::line(vis, corners[i], corners[(i + 1) % corners.size()], cv::Scalar(0, 0, 255), 2);
    }
    return vis;
}

} // namespace

void RegionExtractorConfig::Validate() const {
    CheckOddKernel(blur_kernel, "blur_kernel");
    CheckOddKernel(morph_kernel, "morph_kernel");
    if (dilate_iterations < 0 || erode_iterations < 0) {
        throw FormatError("dilate_iterations and erode_iterations must be non-negative");
    }
}

double StraighteningAngle(double rect_angle_deg) {
    double angle = std::fmod(rect_angle_deg, kQuarterTurn);
    if (angle > 45.0) {
        angle -= kQuarterTurn;
    } else if (angle <= -45.0) {
        angle += kQuarterTurn;
    }
    return angle;
}

RegionExtractor::RegionExtractor(const RegionExtractorConfig& config) : config_(config) {
    config_.Validate();
}

cv::Mat RegionExtractor::Segment(const cv::Mat& bgr, double* threshold) const {
    cv::Mat gray;
    cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
    cv::GaussianBlur(gray, gray, cv::Size(config_.blur_kernel, config_.blur_kernel), 0.0);

    const int mode = (config_.invert_threshold ? cv::THRESH_BINARY_INV : cv::THRESH_BINARY) |
                     cv::THRESH_OTSU;
    cv::Mat binary;
    const double otsu = cv::threshold(gray, binary, 0.0, 255.0, mode);
    spdlog::debug("RegionExtractor: Otsu threshold = {:.1f}", otsu);
    if (threshold) { *threshold = otsu; }

    // Dilate then erode: fills holes left by printed detail, then trims speckle.
    const cv::Mat kernel = detail::SquareKernel(config_.morph_kernel);
    cv::dilate(binary, binary, kernel, cv::Point(-1, -1), config_.dilate_iterations);
    cv::erode(binary, binary, kernel, cv::Point(-1, -1), config_.erode_iterations);
    return binary;
}

RegionResult RegionExtractor::Run(const cv::Mat& image, const DebugOptions& debug) const {
    if (image.empty()) { throw InputError("RegionExtractor: input image is empty"); }
    const cv::Mat bgr = detail::EnsureBgr(image);

    RegionResult result;
    const cv::Mat mask = Segment(bgr, &result.otsu_threshold);
    detail::SaveDebugImage(debug, "region_01_mask.png", mask);

    std::vector<Silhouette> contours = detail::FindExternalContours(mask);
    spdlog::debug("RegionExtractor: {} external contour(s) before straightening",
                  contours.size());
    const size_t border_idx =
        SelectContour(contours, config_.contour_selection, PipelineStage::RegionExtraction);

    const cv::RotatedRect box = cv::minAreaRect(contours[border_idx]);
    result.rotation_deg       = StraighteningAngle(box.angle);

    cv::Size canvas;
    const cv::Mat rotation =
        BuildRotation(bgr.size(), result.rotation_deg, config_.expand_canvas, canvas);
    cv::Mat rotated_mask, rotated_bgr;
    cv::warpAffine(mask, rotated_mask, rotation, canvas, cv::INTER_NEAREST, cv::BORDER_CONSTANT,
                   cv::Scalar(0));
    cv::warpAffine(bgr, rotated_bgr, rotation, canvas, cv::INTER_LINEAR, cv::BORDER_CONSTANT,
                   cv::Scalar(0, 0, 0));
    detail::SaveDebugImage(debug, "region_02_rotated.png", rotated_bgr);

    // Contour coordinates from before the rotation no longer apply.
    contours = detail::FindExternalContours(rotated_mask);
    const size_t straight_idx =
        SelectContour(contours, config_.contour_selection, PipelineStage::RegionExtraction);
    const Silhouette& straight = contours[straight_idx];

    result.crop                 = cv::boundingRect(straight);
    result.straightened_corners = OrderCorners(straight);
    if (result.crop.width < 2 || result.crop.height < 2) {
        throw GeometryError(PipelineStage::RegionExtraction,
                            "Map outline is too small to rectify (" +
                                std::to_string(result.crop.width) + "x" +
                                std::to_string(result.crop.height) + ")");
    }
    if (detail::DebugEnabled(debug)) {
        detail::SaveDebugImage(debug, "region_03_outline.png",
                               DrawOutline(rotated_bgr, straight, result.straightened_corners));
    }

    cv::Mat inverse;
    cv::invertAffineTransform(rotation, inverse);
    std::vector<cv::Point2f> source_pts;
    cv::transform(result.straightened_corners.ToVector(), source_pts, inverse);
    result.source_corners =
        Quadrilateral{source_pts[0], source_pts[1], source_pts[2], source_pts[3]};

    const cv::Point2f origin(static_cast<float>(result.crop.x),
                             static_cast<float>(result.crop.y));
    std::vector<cv::Point2f> src = result.straightened_corners.ToVector();
    for (auto& p : src) { p -= origin; }

    const float w = static_cast<float>(result.crop.width - 1);
    const float h = static_cast<float>(result.crop.height - 1);
    const std::vector<cv::Point2f> dst = {
        cv::Point2f(0.0f, 0.0f),
        cv::Point2f(w, 0.0f),
        cv::Point2f(w, h),
        cv::Point2f(0.0f, h),
    };

    const cv::Mat H    = cv::getPerspectiveTransform(src, dst);
    const cv::Mat crop = rotated_bgr(result.crop);
    cv::warpPerspective(crop, result.map, H, result.crop.size(), cv::INTER_LINEAR,
                        cv::BORDER_REPLICATE);
    detail::SaveDebugImage(debug, "region_04_rectified.png", result.map);

    spdlog::info("RegionExtractor: rotation={:.2f} deg, map={}x{} at ({}, {})",
                 result.rotation_deg, result.crop.width, result.crop.height, result.crop.x,
                 result.crop.y);
    return result;
}

} // namespace MapBearing
