/// \file common.h
/// \brief Common enumerations and types used throughout MapBearing.

#pragma once

#include "export.h"

#include <cstdint>
#include <string>

namespace MapBearing {

/// Stage of the locate pipeline. Errors raised by a stage carry it.
enum class PipelineStage : uint8_t {
    LoadingImage       = 0, ///< Decoding the source photograph.
    RegionExtraction   = 1, ///< Finding and rectifying the map quadrilateral.
    MarkerLocation     = 2, ///< Segmenting the marker and selecting its tip.
    BearingCalculation = 3, ///< Converting tip geometry into position and bearing.
};

/// Convert PipelineStage to its string representation.
MAPBEARING_API std::string ToPipelineStageString(PipelineStage stage);

/// Rule used to pick the target among the external contours of a mask.
enum class ContourSelection : uint8_t {
    First   = 0, ///< Index zero of the traced contours.
    Largest = 1, ///< Contour with the largest absolute area (first wins ties).
    Single  = 2, ///< Exactly one contour must exist, otherwise fail.
};

/// Convert ContourSelection to its string representation.
MAPBEARING_API std::string ToContourSelectionString(ContourSelection selection);

/// Parse ContourSelection from a string ("First" / "Largest" / "Single").
MAPBEARING_API ContourSelection FromContourSelectionString(const std::string& str);

/// Policy applied when two triangle vertices have the same distance sum.
enum class TipTieBreak : uint8_t {
    LowestIndex = 0, ///< Lowest vertex index among the tied maxima wins.
    Error       = 1, ///< A tie is a geometry failure.
};

/// Convert TipTieBreak to its string representation.
MAPBEARING_API std::string ToTipTieBreakString(TipTieBreak policy);

/// Parse TipTieBreak from a string ("LowestIndex" / "Error").
MAPBEARING_API TipTieBreak FromTipTieBreakString(const std::string& str);

/// Intermediate-image output shared by every stage.
///
/// Passed explicitly into each component call; nothing in the library keeps a
/// process-wide debug switch.
struct DebugOptions {
    bool show_intermediate_steps = false; ///< Log and dump intermediate images.
    std::string dump_dir;                 ///< Directory for PNG dumps (empty = log only).
};

} // namespace MapBearing
