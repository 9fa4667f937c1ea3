#include "mapbearing/geometry.h"
#include "mapbearing/error.h"

#include <spdlog/spdlog.h>

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace MapBearing {
namespace {

static double Distance(const cv::Point2f& a, const cv::Point2f& b) {
    const double dx = static_cast<double>(a.x) - static_cast<double>(b.x);
    const double dy = static_cast<double>(a.y) - static_cast<double>(b.y);
    return std::sqrt(dx * dx + dy * dy);
}

static bool IsFinite(const cv::Point2f& p) { return std::isfinite(p.x) && std::isfinite(p.y); }

} // namespace

Quadrilateral OrderCorners(const std::vector<cv::Point2f>& points) {
    if (points.size() < 4) {
        throw GeometryError(PipelineStage::RegionExtraction,
                            "Corner extraction needs at least 4 contour points, got " +
                                std::to_string(points.size()));
    }

    Quadrilateral quad;
    double min_sum  = std::numeric_limits<double>::infinity();
    double max_sum  = -std::numeric_limits<double>::infinity();
    double min_diff = std::numeric_limits<double>::infinity();
    double max_diff = -std::numeric_limits<double>::infinity();
    for (const auto& p : points) {
        double sum  = static_cast<double>(p.x) + static_cast<double>(p.y);
        double diff = static_cast<double>(p.y) - static_cast<double>(p.x);
        if (sum < min_sum) { min_sum = sum, quad.top_left = p; }
        if (sum > max_sum) { max_sum = sum, quad.bottom_right = p; }
        if (diff < min_diff) { min_diff = diff, quad.top_right = p; }
        if (diff > max_diff) { max_diff = diff, quad.bottom_left = p; }
    }

    const std::vector<cv::Point2f> corners = quad.ToVector();
    for (size_t i = 0; i < corners.size(); ++i) {
        for (size_t j = i + 1; j < corners.size(); ++j) {
            if (corners[i] == corners[j]) {
                throw GeometryError(PipelineStage::RegionExtraction,
                                    "Corner extraction did not yield 4 distinct corners; the map "
                                    "outline is degenerate");
            }
        }
    }
    return quad;
}

Quadrilateral OrderCorners(const Silhouette& contour) {
    std::vector<cv::Point2f> points;
    points.reserve(contour.size());
    for (const auto& p : contour) {
        points.emplace_back(static_cast<float>(p.x), static_cast<float>(p.y));
    }
    return OrderCorners(points);
}

size_t SelectContour(const std::vector<Silhouette>& contours, ContourSelection policy,
                     PipelineStage stage) {
    if (contours.empty()) {
        throw SegmentationError(stage, "No external contour found after thresholding (" +
                                           ToPipelineStageString(stage) + ")");
    }

    switch (policy) {
    case ContourSelection::First:
        return 0;
    case ContourSelection::Single:
        if (contours.size() != 1) {
            throw SegmentationError(stage, "Expected a single external contour, found " +
                                               std::to_string(contours.size()) + " (" +
                                               ToPipelineStageString(stage) + ")");
        }
        return 0;
    case ContourSelection::Largest:
        break;
    }

    size_t best      = 0;
    double best_area = -1.0;
    for (size_t i = 0; i < contours.size(); ++i) {
        const double area = std::abs(cv::contourArea(contours[i]));
        if (area > best_area) {
            best_area = area;
            best      = i;
        }
    }
    spdlog::debug("SelectContour: {} candidate(s), picked #{} (area={:.1f})", contours.size(),
                  best, best_area);
    return best;
}

MarkerGeometry SelectTip(const TriangleCandidate& triangle, TipTieBreak policy,
                         double tolerance) {
    for (const auto& v : triangle) {
        if (!IsFinite(v)) {
            throw GeometryError(PipelineStage::MarkerLocation,
                                "SelectTip: triangle vertex is not finite");
        }
    }

    double sums[3];
    double max_sum = -1.0;
    for (int i = 0; i < 3; ++i) {
        sums[i] = Distance(triangle[i], triangle[(i + 1) % 3]) +
                  Distance(triangle[i], triangle[(i + 2) % 3]);
        max_sum = std::max(max_sum, sums[i]);
    }

    int tip_idx = -1;
    int tied    = 0;
    for (int i = 0; i < 3; ++i) {
        if (max_sum - sums[i] <= tolerance) {
            if (tip_idx < 0) { tip_idx = i; }
            ++tied;
        }
    }

    if (tied > 1 && policy == TipTieBreak::Error) {
        throw GeometryError(PipelineStage::MarkerLocation,
                            "Tip selection is ambiguous: " + std::to_string(tied) +
                                " vertices share the maximum distance sum");
    }

    MarkerGeometry geometry;
    geometry.tip = triangle[static_cast<size_t>(tip_idx)];
    int k        = 0;
    for (int i = 0; i < 3; ++i) {
        if (i == tip_idx) { continue; }
        geometry.base[static_cast<size_t>(k++)] = triangle[static_cast<size_t>(i)];
    }
    return geometry;
}

} // namespace MapBearing
