#pragma once

/// \file region.h
/// \brief Map region extraction: segmentation, straightening and perspective rectification.

#include "common.h"
#include "export.h"
#include "geometry.h"

#include <opencv2/core.hpp>

namespace MapBearing {

/// Tuning for RegionExtractor. Defaults were calibrated on photographs of a
/// light printed map lying on a dark desk.
struct RegionExtractorConfig {
    int blur_kernel       = 5;     ///< Gaussian blur kernel side (odd).
    bool invert_threshold = false; ///< true when the map is darker than the background.
    int morph_kernel      = 7;     ///< Square dilate/erode kernel side (odd).
    int dilate_iterations = 2;
    int erode_iterations  = 2;
    bool expand_canvas    = true;  ///< Grow the rotation canvas so corners are never clipped.

    ContourSelection contour_selection = ContourSelection::Largest;

    /// \throws FormatError if a kernel is not a positive odd size or an
    ///         iteration count is negative.
    void Validate() const;
};

/// Output of RegionExtractor::Run.
struct RegionResult {
    cv::Mat map;                  ///< Rectified BGR map; size equals crop.size().
    Quadrilateral straightened_corners; ///< Map corners after the straightening rotation.
    Quadrilateral source_corners;       ///< Map corners in the input photograph.
    cv::Rect crop;                ///< Axis-aligned box of the straightened map contour.
    double rotation_deg   = 0.0;  ///< Straightening rotation applied (degrees, CCW positive).
    double otsu_threshold = 0.0;  ///< Threshold chosen by Otsu's method.
};

/// Finds the single map quadrilateral in a photograph and returns it rectified.
class MAPBEARING_API RegionExtractor {
public:
    explicit RegionExtractor(const RegionExtractorConfig& config = {});

    /// Extract and rectify the map.
    /// \throws InputError for an empty image.
    /// \throws SegmentationError if no usable external contour is found.
    /// \throws GeometryError if the four corners cannot be extracted.
    RegionResult Run(const cv::Mat& image, const DebugOptions& debug = {}) const;

    /// Binary foreground mask (Otsu threshold followed by dilate then erode).
    cv::Mat Segment(const cv::Mat& bgr, double* threshold = nullptr) const;

    /// Read-only access to the current configuration.
    const RegionExtractorConfig& config() const { return config_; }

private:
    RegionExtractorConfig config_;
};

/// Folds a cv::minAreaRect angle into the smallest straightening rotation,
/// in (-45, 45] degrees. Works for both OpenCV angle conventions.
MAPBEARING_API double StraighteningAngle(double rect_angle_deg);

} // namespace MapBearing
