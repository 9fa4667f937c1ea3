/// \file geometry.h
/// \brief Geometric value types and the pure helpers shared by the stages.

#pragma once

#include "common.h"
#include "export.h"

#include <array>
#include <cstddef>
#include <vector>

#include <opencv2/core.hpp>

namespace MapBearing {

/// Traced boundary of a segmented region, as produced by cv::findContours.
using Silhouette = std::vector<cv::Point>;

/// Map corners in source-image coordinates, ordered TL, TR, BR, BL.
struct Quadrilateral {
    cv::Point2f top_left;
    cv::Point2f top_right;
    cv::Point2f bottom_right;
    cv::Point2f bottom_left;

    /// Corners as {TL, TR, BR, BL}, the order cv::getPerspectiveTransform expects here.
    std::vector<cv::Point2f> ToVector() const {
        return {top_left, top_right, bottom_right, bottom_left};
    }
};

/// Vertices of the minimum enclosing triangle, in the order OpenCV returned them.
using TriangleCandidate = std::array<cv::Point2f, 3>;

/// Enclosing triangle split into its directional tip and the two base vertices.
struct MarkerGeometry {
    cv::Point2f tip;
    std::array<cv::Point2f, 2> base; ///< Non-tip vertices, original triangle order.

    cv::Point2f BaseMidpoint() const {
        return cv::Point2f((base[0].x + base[1].x) * 0.5f, (base[0].y + base[1].y) * 0.5f);
    }
};

/// Tip position relative to the map: x rightward, y upward, both in [0, 1].
struct NormalizedPosition {
    double xpos = 0.0;
    double ypos = 0.0;
};

/// Orders four corners of a roughly axis-aligned quadrilateral from a point set.
///
/// Top-left has the minimum x+y and bottom-right the maximum x+y. The
/// difference is taken as y-x (row minus column): top-right has the minimum
/// y-x and bottom-left the maximum. The first point wins ties.
/// \throws GeometryError (RegionExtraction) if fewer than 4 points are given or
///         the heuristic does not yield 4 distinct corners.
MAPBEARING_API Quadrilateral OrderCorners(const std::vector<cv::Point2f>& points);

/// Integer-contour overload of OrderCorners.
MAPBEARING_API Quadrilateral OrderCorners(const Silhouette& contour);

/// Returns the index of the contour chosen by \p policy.
/// \throws SegmentationError tagged with \p stage when \p contours is empty, or
///         when policy is Single and more than one contour exists.
MAPBEARING_API size_t SelectContour(const std::vector<Silhouette>& contours,
                                    ContourSelection policy, PipelineStage stage);

/// Picks the triangle vertex whose summed distance to the other two is largest.
///
/// Sums within \p tolerance of the maximum are treated as tied; \p policy
/// decides between the lowest tied index and a GeometryError (MarkerLocation).
/// \throws GeometryError (MarkerLocation) if a vertex has non-finite coordinates.
MAPBEARING_API MarkerGeometry SelectTip(const TriangleCandidate& triangle,
                                        TipTieBreak policy = TipTieBreak::LowestIndex,
                                        double tolerance   = 1e-6);

} // namespace MapBearing
