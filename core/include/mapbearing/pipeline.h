/// \file pipeline.h
/// \brief Photograph-to-bearing pipeline: region extraction, marker location, bearing.

#pragma once

#include "common.h"
#include "export.h"
#include "geometry.h"
#include "marker.h"
#include "region.h"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace MapBearing {

/// Complete tuning of the pipeline, loadable from JSON.
struct MAPBEARING_API PipelineConfig {
    RegionExtractorConfig region;
    MarkerLocatorConfig marker;
    DebugOptions debug;

    /// Validates every section. \throws FormatError
    void Validate() const;

    void SaveToJson(const std::string& path) const;
    static PipelineConfig LoadFromJson(const std::string& path);

    std::string ToJsonString() const;
    static PipelineConfig FromJsonString(const std::string& json_str);
};

/// Request parameters for locating the marker in one photograph.
struct LocateRequest {
    // Image input (buffer takes priority if non-empty)
    std::string image_path; ///< Path to the photograph (ignored if image_buffer is non-empty).
    std::vector<uint8_t> image_buffer; ///< Encoded image bytes (PNG, JPEG, ...).
    std::string image_name; ///< Name used in logs when loading from buffer.

    PipelineConfig config;
};

/// Result of one pipeline run.
struct LocateResult {
    NormalizedPosition position; ///< Tip position within the map, y up.
    double bearing = 0.0;        ///< Compass bearing in degrees, [0, 360).

    MarkerGeometry marker;       ///< Tip and base vertices in map-image coordinates.
    Quadrilateral corners;       ///< Map corners in the source photograph.
    cv::Size map_size;           ///< Size of the rectified map image.
    double rotation_deg = 0.0;   ///< Straightening rotation applied to the photograph.
};

/// Progress callback function type.
/// \param stage Stage about to run
/// \param progress Overall progress value [0.0, 1.0]
using ProgressCallback = std::function<void(PipelineStage stage, float progress)>;

/// Runs the three stages on an already decoded image.
/// \throws InputError, SegmentationError, GeometryError
MAPBEARING_API LocateResult LocateImage(const cv::Mat& image, const PipelineConfig& config = {},
                                        ProgressCallback progress = nullptr);

/// Loads the photograph described by \p request and runs the pipeline.
/// \throws IOError if the image cannot be read or decoded, plus the LocateImage errors.
MAPBEARING_API LocateResult Locate(const LocateRequest& request,
                                   ProgressCallback progress = nullptr);

/// Formats the result as "POSITION x.xxx y.yyy\nBEARING b.b\n".
/// A bearing that rounds to 360.0 is printed as 0.0.
MAPBEARING_API std::string FormatReport(const LocateResult& result);

} // namespace MapBearing
