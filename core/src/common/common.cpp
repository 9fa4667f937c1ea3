#include "mapbearing/common.h"
#include "mapbearing/error.h"

namespace MapBearing {

std::string ToPipelineStageString(PipelineStage stage) {
    switch (stage) {
    case PipelineStage::LoadingImage:
        return "LoadingImage";
    case PipelineStage::RegionExtraction:
        return "RegionExtraction";
    case PipelineStage::MarkerLocation:
        return "MarkerLocation";
    case PipelineStage::BearingCalculation:
        return "BearingCalculation";
    }
    return "Unknown";
}

std::string ToContourSelectionString(ContourSelection selection) {
    switch (selection) {
    case ContourSelection::First:
        return "First";
    case ContourSelection::Largest:
        return "Largest";
    case ContourSelection::Single:
        return "Single";
    }
    return "Largest";
}

ContourSelection FromContourSelectionString(const std::string& str) {
    if (str == "First") { return ContourSelection::First; }
    if (str == "Largest") { return ContourSelection::Largest; }
    if (str == "Single") { return ContourSelection::Single; }
    throw FormatError("Invalid contour_selection string: " + str);
}

std::string ToTipTieBreakString(TipTieBreak policy) {
    switch (policy) {
    case TipTieBreak::LowestIndex:
        return "LowestIndex";
    case TipTieBreak::Error:
        return "Error";
    }
    return "LowestIndex";
}

TipTieBreak FromTipTieBreakString(const std::string& str) {
    if (str == "LowestIndex") { return TipTieBreak::LowestIndex; }
    if (str == "Error") { return TipTieBreak::Error; }
    throw FormatError("Invalid tie_break string: " + str);
}

std::string ToErrorCodeString(ErrorCode code) {
    switch (code) {
    case ErrorCode::Ok:
        return "Ok";
    case ErrorCode::InvalidInput:
        return "InvalidInput";
    case ErrorCode::IOError:
        return "IOError";
    case ErrorCode::FormatError:
        return "FormatError";
    case ErrorCode::SegmentationFailure:
        return "SegmentationFailure";
    case ErrorCode::GeometryFailure:
        return "GeometryFailure";
    case ErrorCode::InternalError:
        return "InternalError";
    }
    return "InternalError";
}

} // namespace MapBearing
