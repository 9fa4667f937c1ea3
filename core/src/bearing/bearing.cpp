#include "mapbearing/bearing.h"
#include "mapbearing/error.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace MapBearing {
namespace {

constexpr double kPi              = 3.14159265358979323846;
constexpr double kFullTurn        = 360.0;
constexpr double kMinDirectionLen = 1e-9;

static double RadToDeg(double rad) { return rad * 180.0 / kPi; }

struct Direction {
    double dx = 0.0;
    double dy = 0.0;
};

static Direction TipDirection(const MarkerGeometry& geometry) {
    const double mid_x = (static_cast<double>(geometry.base[0].x) + geometry.base[1].x) * 0.5;
    const double mid_y = (static_cast<double>(geometry.base[0].y) + geometry.base[1].y) * 0.5;
    Direction dir;
    dir.dx = static_cast<double>(geometry.tip.x) - mid_x;
    dir.dy = static_cast<double>(geometry.tip.y) - mid_y;
    if (!std::isfinite(dir.dx) || !std::isfinite(dir.dy)) {
        throw GeometryError(PipelineStage::BearingCalculation,
                            "Marker geometry contains non-finite coordinates");
    }
    return dir;
}

} // namespace

double RawImageAngle(const MarkerGeometry& geometry) {
    const Direction dir = TipDirection(geometry);
    return RadToDeg(std::atan2(dir.dy, dir.dx));
}

double NormalizeBearing(double degrees) {
    if (!std::isfinite(degrees)) {
        throw GeometryError(PipelineStage::BearingCalculation,
                            "Cannot normalize a non-finite bearing");
    }
    double b = std::fmod(degrees, kFullTurn);
    if (b < 0.0) { b += kFullTurn; }
    if (b >= kFullTurn) { b = 0.0; }
    return b;
}

double ComputeBearing(const MarkerGeometry& geometry) {
    const Direction dir = TipDirection(geometry);
    if (std::hypot(dir.dx, dir.dy) < kMinDirectionLen) {
        throw GeometryError(PipelineStage::BearingCalculation,
                            "Marker tip coincides with the base midpoint; direction is undefined");
    }

    const double raw     = RadToDeg(std::atan2(dir.dy, dir.dx));
    const double bearing = (raw < 0.0) ? 450.0 + raw : raw + 90.0;
    const double result  = NormalizeBearing(bearing);
    spdlog::debug("ComputeBearing: dir=({:.3f}, {:.3f}) raw={:.3f} bearing={:.3f}", dir.dx,
                  dir.dy, raw, result);
    return result;
}

NormalizedPosition NormalizePosition(const cv::Point2f& tip, const cv::Size& size) {
    if (size.width <= 0 || size.height <= 0) {
        throw InputError("NormalizePosition: image size must be positive, got " +
                         std::to_string(size.width) + "x" + std::to_string(size.height));
    }
    if (!std::isfinite(tip.x) || !std::isfinite(tip.y)) {
        throw GeometryError(PipelineStage::BearingCalculation,
                            "NormalizePosition: tip is not finite");
    }

    NormalizedPosition pos;
    pos.xpos = static_cast<double>(tip.x) / static_cast<double>(size.width);
    pos.ypos = 1.0 - static_cast<double>(tip.y) / static_cast<double>(size.height);
    if (pos.xpos < 0.0 || pos.xpos > 1.0 || pos.ypos < 0.0 || pos.ypos > 1.0) {
        spdlog::debug("NormalizePosition: tip ({:.2f}, {:.2f}) outside {}x{}, clamping", tip.x,
                      tip.y, size.width, size.height);
    }
    pos.xpos = std::clamp(pos.xpos, 0.0, 1.0);
    pos.ypos = std::clamp(pos.ypos, 0.0, 1.0);
    return pos;
}

} // namespace MapBearing
