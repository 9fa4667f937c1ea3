#include "mapbearing/marker.h"
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

constexpr int kMaxHue     = 179;
constexpr int kMaxChannel = 255;

static cv::Scalar ToScalar(const std::array<int, 3>& v) { return cv::Scalar(v[0], v[1], v[2]); }

static cv::Mat DrawTriangle(const cv::Mat& bgr, const TriangleCandidate& triangle,
                            const MarkerGeometry& geometry) {
    cv::Mat vis = bgr.clone();
    for (size_t i = 0; i < triangle.size(); ++i) {
        cv::line(vis, triangle[i], triangle[(i + 1) % triangle.size()], cv::Scalar(0, 255, 0), 2);
    }
    cv::circle(vis, geometry.tip, 6, cv::Scalar(255, 0, 0), 2);
    cv::line(vis, geometry.BaseMidpoint(), geometry.tip, cv::Scalar(255, 0, 255), 1);
    return vis;
}

} // namespace

void MarkerLocatorConfig::Validate() const {
    for (int c = 0; c < 3; ++c) {
        const int max_v = (c == 0) ? kMaxHue : kMaxChannel;
        if (hsv_lower[c] < 0 || hsv_lower[c] > max_v || hsv_upper[c] < 0 ||
            hsv_upper[c] > max_v) {
            throw FormatError("HSV bound for channel " + std::to_string(c) +
                              " must lie in [0, " + std::to_string(max_v) + "]");
        }
        if (hsv_lower[c] > hsv_upper[c]) {
            throw FormatError("HSV lower bound exceeds upper bound for channel " +
                              std::to_string(c));
        }
    }
    if (close_kernel <= 0 || close_kernel % 2 == 0) {
        throw FormatError("close_kernel must be a positive odd size, got " +
                          std::to_string(close_kernel));
    }
    if (close_iterations < 0) { throw FormatError("close_iterations must be non-negative"); }
    if (!(tie_tolerance >= 0.0)) { throw FormatError("tie_tolerance must be non-negative"); }
}

MarkerLocator::MarkerLocator(const MarkerLocatorConfig& config) : config_(config) {
    config_.Validate();
}

cv::Mat MarkerLocator::Segment(const cv::Mat& bgr) const {
    cv::Mat hsv;
    cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);

    cv::Mat mask;
    cv::inRange(hsv, ToScalar(config_.hsv_lower), ToScalar(config_.hsv_upper), mask);

    const cv::Mat kernel = detail::SquareKernel(config_.close_kernel);
    cv::morphologyEx(mask, mask, cv::MORPH_CLOSE, kernel, cv::Point(-1, -1),
                     config_.close_iterations);
    return mask;
}

MarkerResult MarkerLocator::Run(const cv::Mat& map, const DebugOptions& debug) const {
    if (map.empty()) { throw InputError("MarkerLocator: map image is empty"); }
    const cv::Mat bgr = detail::EnsureBgr(map);

    const cv::Mat mask = Segment(bgr);
    detail::SaveDebugImage(debug, "marker_01_mask.png", mask);

    const std::vector<Silhouette> contours = detail::FindExternalContours(mask);
    spdlog::debug("MarkerLocator: {} external contour(s) in HSV band", contours.size());
    const Silhouette& silhouette = contours[SelectContour(
        contours, config_.contour_selection, PipelineStage::MarkerLocation)];

    MarkerResult result;
    result.silhouette_area = std::abs(cv::contourArea(silhouette));

    std::vector<cv::Point2f> points;
    points.reserve(silhouette.size());
    for (const auto& p : silhouette) {
        points.emplace_back(static_cast<float>(p.x), static_cast<float>(p.y));
    }

    std::vector<cv::Point2f> triangle;
    cv::minEnclosingTriangle(points, triangle);
    if (triangle.size() != 3) {
        throw GeometryError(PipelineStage::MarkerLocation,
                            "Minimum enclosing triangle has " + std::to_string(triangle.size()) +
                                " vertices, expected 3 (marker silhouette of " +
                                std::to_string(silhouette.size()) + " point(s))");
    }
    for (size_t i = 0; i < 3; ++i) { result.triangle[i] = triangle[i]; }

    result.geometry = SelectTip(result.triangle, config_.tie_break, config_.tie_tolerance);
    if (detail::DebugEnabled(debug)) {
        detail::SaveDebugImage(debug, "marker_02_triangle.png",
                               DrawTriangle(bgr, result.triangle, result.geometry));
    }

    spdlog::info("MarkerLocator: tip=({:.1f}, {:.1f}) base=({:.1f}, {:.1f}) ({:.1f}, {:.1f})",
                 result.geometry.tip.x, result.geometry.tip.y, result.geometry.base[0].x,
                 result.geometry.base[0].y, result.geometry.base[1].x, result.geometry.base[1].y);
    return result;
}

} // namespace MapBearing
