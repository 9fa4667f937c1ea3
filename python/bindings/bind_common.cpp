#include "bindings.h"

#include "mapbearing/common.h"
#include "mapbearing/error.h"

namespace py = pybind11;

namespace MapBearing::pybind {

void BindCommon(py::module_& m) {
    py::enum_<PipelineStage>(m, "PipelineStage", "Stage of the locate pipeline.")
        .value("LoadingImage", PipelineStage::LoadingImage)
        .value("RegionExtraction", PipelineStage::RegionExtraction)
        .value("MarkerLocation", PipelineStage::MarkerLocation)
        .value("BearingCalculation", PipelineStage::BearingCalculation);

    py::enum_<ContourSelection>(m, "ContourSelection", "Rule for picking the target contour.")
        .value("First", ContourSelection::First)
        .value("Largest", ContourSelection::Largest)
        .value("Single", ContourSelection::Single);

    py::enum_<TipTieBreak>(m, "TipTieBreak", "Policy for tied tip candidates.")
        .value("LowestIndex", TipTieBreak::LowestIndex)
        .value("Error", TipTieBreak::Error);

    py::enum_<ErrorCode>(m, "ErrorCode", "Error category of a failed call.")
        .value("Ok", ErrorCode::Ok)
        .value("InvalidInput", ErrorCode::InvalidInput)
        .value("IOError", ErrorCode::IOError)
        .value("FormatError", ErrorCode::FormatError)
        .value("SegmentationFailure", ErrorCode::SegmentationFailure)
        .value("GeometryFailure", ErrorCode::GeometryFailure)
        .value("InternalError", ErrorCode::InternalError);

    py::class_<DebugOptions>(m, "DebugOptions", "Intermediate-image output options.")
        .def(py::init<>())
        .def_readwrite("show_intermediate_steps", &DebugOptions::show_intermediate_steps,
                       "Log and dump intermediate images.")
        .def_readwrite("dump_dir", &DebugOptions::dump_dir,
                       "Directory for PNG dumps (empty = log only).");

    // Translators run newest first, so subclasses registered later take precedence.
    auto error = py::register_exception<Error>(m, "Error", PyExc_RuntimeError);
    py::register_exception<IOError>(m, "IOError", error);
    py::register_exception<InputError>(m, "InputError", error);
    py::register_exception<FormatError>(m, "FormatError", error);
    auto stage_error = py::register_exception<StageError>(m, "StageError", error);
    py::register_exception<SegmentationError>(m, "SegmentationError", stage_error);
    py::register_exception<GeometryError>(m, "GeometryError", stage_error);
}

} // namespace MapBearing::pybind
