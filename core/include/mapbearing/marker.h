#pragma once

/// \file marker.h
/// \brief Color-keyed marker segmentation and tip identification.

#include "common.h"
#include "export.h"
#include "geometry.h"

#include <array>

#include <opencv2/core.hpp>

namespace MapBearing {

/// Tuning for MarkerLocator.
///
/// The HSV band uses OpenCV 8-bit ranges (H 0..179, S and V 0..255) and was
/// calibrated against photographs of the red printed pointer; bounds are
/// inclusive. Recalibrating for another pointer color is a config change.
struct MarkerLocatorConfig {
    std::array<int, 3> hsv_lower = {0, 120, 70};
    std::array<int, 3> hsv_upper = {10, 255, 255};

    int close_kernel     = 5; ///< Square closing kernel side (odd).
    int close_iterations = 1;

    ContourSelection contour_selection = ContourSelection::Largest;
    TipTieBreak tie_break              = TipTieBreak::LowestIndex;
    double tie_tolerance               = 1e-6; ///< Distance-sum tie tolerance in pixels.

    /// \throws FormatError for out-of-range HSV bounds, lower > upper, an
    ///         invalid kernel, negative iterations or a negative tolerance.
    void Validate() const;
};

/// Output of MarkerLocator::Run.
struct MarkerResult {
    MarkerGeometry geometry;     ///< Tip and base, in map-image coordinates.
    TriangleCandidate triangle;  ///< Enclosing triangle as returned by OpenCV.
    double silhouette_area = 0.0;
};

/// Finds the pointer inside a rectified map and identifies its tip.
class MAPBEARING_API MarkerLocator {
public:
    explicit MarkerLocator(const MarkerLocatorConfig& config = {});

    /// Locate the marker.
    /// \throws InputError for an empty image.
    /// \throws SegmentationError if no pixel cluster falls inside the HSV band.
    /// \throws GeometryError if the enclosing triangle does not have 3 vertices
    ///         or the tip is tied under TipTieBreak::Error.
    MarkerResult Run(const cv::Mat& map, const DebugOptions& debug = {}) const;

    /// Binary mask of pixels inside the HSV band, after closing.
    cv::Mat Segment(const cv::Mat& bgr) const;

    /// Read-only access to the current configuration.
    const MarkerLocatorConfig& config() const { return config_; }

private:
    MarkerLocatorConfig config_;
};

} // namespace MapBearing
