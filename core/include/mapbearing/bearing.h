/// \file bearing.h
/// \brief Bearing and normalized position from marker geometry.

#pragma once

#include "export.h"
#include "geometry.h"

#include <opencv2/core.hpp>

namespace MapBearing {

/// Angle of (tip - base midpoint) in image space, in degrees within (-180, 180].
/// 0 points rightward and positive angles turn toward increasing image y.
MAPBEARING_API double RawImageAngle(const MarkerGeometry& geometry);

/// Wraps an angle in degrees into [0, 360).
/// \throws GeometryError (BearingCalculation) if \p degrees is not finite.
MAPBEARING_API double NormalizeBearing(double degrees);

/// Compass bearing of the marker in degrees, [0, 360), 0 = up, clockwise.
///
/// Image space measures angles from +x with y pointing down, so clockwise on
/// screen. Compass space measures from image "up" (-y), also clockwise. The
/// bearing is therefore the image angle plus 90 degrees, folded into range:
/// raw < 0 maps to 450 + raw and raw >= 0 maps to raw + 90.
/// \throws GeometryError (BearingCalculation) if the tip coincides with the
///         base midpoint.
MAPBEARING_API double ComputeBearing(const MarkerGeometry& geometry);

/// Tip position normalized to the map: xpos = x / w, ypos = 1 - y / h.
/// Values are clamped to [0, 1].
/// \throws InputError if \p size is not positive.
/// \throws GeometryError (BearingCalculation) if \p tip is not finite.
MAPBEARING_API NormalizedPosition NormalizePosition(const cv::Point2f& tip, const cv::Size& size);

} // namespace MapBearing
