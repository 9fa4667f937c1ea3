#include "mapbearing/pipeline.h"
#include "mapbearing/bearing.h"
#include "mapbearing/error.h"
#include "mapbearing/marker.h"
#include "mapbearing/region.h"

#include <spdlog/spdlog.h>

#include <opencv2/imgcodecs.hpp>

#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

namespace MapBearing {
namespace {

void NotifyProgress(const ProgressCallback& cb, PipelineStage stage, float progress) {
    if (cb) { cb(stage, progress); }
}

cv::Mat LoadImage(const LocateRequest& request) {
    if (!request.image_buffer.empty()) {
        spdlog::info("Locate: decoding image from buffer ({} bytes, name={})",
                     request.image_buffer.size(), request.image_name);
        cv::Mat image = cv::imdecode(request.image_buffer, cv::IMREAD_UNCHANGED);
        if (image.empty()) { throw IOError("Failed to decode image buffer " + request.image_name); }
        return image;
    }
    if (request.image_path.empty()) { throw InputError("Locate: no image path or buffer given"); }

    spdlog::info("Locate: loading image from file: {}", request.image_path);
    cv::Mat image = cv::imread(request.image_path, cv::IMREAD_UNCHANGED);
    if (image.empty()) { throw IOError("Failed to read image: " + request.image_path); }
    return image;
}

} // namespace

LocateResult LocateImage(const cv::Mat& image, const PipelineConfig& config,
                         ProgressCallback progress) {
    if (image.empty()) { throw InputError("LocateImage: input image is empty"); }
    spdlog::debug("LocateImage: {}x{}, {} channel(s)", image.cols, image.rows, image.channels());

    // === 1. Map region ===
    NotifyProgress(progress, PipelineStage::RegionExtraction, 0.0f);
    const RegionExtractor extractor(config.region);
    const RegionResult region = extractor.Run(image, config.debug);

    // === 2. Marker ===
    NotifyProgress(progress, PipelineStage::MarkerLocation, 1.0f / 3.0f);
    const MarkerLocator locator(config.marker);
    const MarkerResult marker = locator.Run(region.map, config.debug);

    // === 3. Bearing ===
    NotifyProgress(progress, PipelineStage::BearingCalculation, 2.0f / 3.0f);
    LocateResult result;
    result.marker       = marker.geometry;
    result.corners      = region.source_corners;
    result.map_size     = region.map.size();
    result.rotation_deg = region.rotation_deg;
    result.position     = NormalizePosition(marker.geometry.tip, result.map_size);
    result.bearing      = ComputeBearing(marker.geometry);

    spdlog::info("Locate: position=({:.3f}, {:.3f}) raw_angle={:.2f} bearing={:.1f}",
                 result.position.xpos, result.position.ypos, RawImageAngle(marker.geometry),
                 result.bearing);
    NotifyProgress(progress, PipelineStage::BearingCalculation, 1.0f);
    return result;
}

LocateResult Locate(const LocateRequest& request, ProgressCallback progress) {
    NotifyProgress(progress, PipelineStage::LoadingImage, 0.0f);
    const cv::Mat image = LoadImage(request);
    return LocateImage(image, request.config, progress);
}

std::string FormatReport(const LocateResult& result) {
    double bearing = std::round(result.bearing * 10.0) / 10.0;
    if (bearing >= 360.0) { bearing = 0.0; }

    char buffer[96];
    std::snprintf(buffer, sizeof(buffer), "POSITION %.3f %.3f\nBEARING %.1f\n",
                  result.position.xpos, result.position.ypos, bearing);
    return std::string(buffer);
}

} // namespace MapBearing
