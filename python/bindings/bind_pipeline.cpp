#include "bindings.h"

#include "mapbearing/marker.h"
#include "mapbearing/pipeline.h"
#include "mapbearing/region.h"
#include "pybind_utils.h"

#include <string>

namespace py = pybind11;

namespace MapBearing::pybind {

void BindPipeline(py::module_& m) {
    using pybind_utils::MatToNumpy;
    using pybind_utils::NumpyToMat;
    using pybind_utils::PointToTuple;

    py::class_<RegionExtractorConfig>(m, "RegionExtractorConfig", "Map segmentation tuning.")
        .def(py::init<>())
        .def_readwrite("blur_kernel", &RegionExtractorConfig::blur_kernel)
        .def_readwrite("invert_threshold", &RegionExtractorConfig::invert_threshold)
        .def_readwrite("morph_kernel", &RegionExtractorConfig::morph_kernel)
        .def_readwrite("dilate_iterations", &RegionExtractorConfig::dilate_iterations)
        .def_readwrite("erode_iterations", &RegionExtractorConfig::erode_iterations)
        .def_readwrite("expand_canvas", &RegionExtractorConfig::expand_canvas)
        .def_readwrite("contour_selection", &RegionExtractorConfig::contour_selection)
        .def("validate", &RegionExtractorConfig::Validate);

    py::class_<MarkerLocatorConfig>(m, "MarkerLocatorConfig", "Marker segmentation tuning.")
        .def(py::init<>())
        .def_readwrite("hsv_lower", &MarkerLocatorConfig::hsv_lower)
        .def_readwrite("hsv_upper", &MarkerLocatorConfig::hsv_upper)
        .def_readwrite("close_kernel", &MarkerLocatorConfig::close_kernel)
        .def_readwrite("close_iterations", &MarkerLocatorConfig::close_iterations)
        .def_readwrite("contour_selection", &MarkerLocatorConfig::contour_selection)
        .def_readwrite("tie_break", &MarkerLocatorConfig::tie_break)
        .def_readwrite("tie_tolerance", &MarkerLocatorConfig::tie_tolerance)
        .def("validate", &MarkerLocatorConfig::Validate);

    py::class_<PipelineConfig>(m, "PipelineConfig", "Complete pipeline tuning.")
        .def(py::init<>())
        .def_readwrite("region", &PipelineConfig::region)
        .def_readwrite("marker", &PipelineConfig::marker)
        .def_readwrite("debug", &PipelineConfig::debug)
        .def("validate", &PipelineConfig::Validate)
        .def("save_to_json", &PipelineConfig::SaveToJson, py::arg("path"))
        .def_static("load_from_json", &PipelineConfig::LoadFromJson, py::arg("path"))
        .def("to_json_string", &PipelineConfig::ToJsonString)
        .def_static("from_json_string", &PipelineConfig::FromJsonString, py::arg("json_str"));

    py::class_<RegionResult>(m, "RegionResult", "Rectified map and its outline.")
        .def_property_readonly(
            "map", [](const RegionResult& r) { return MatToNumpy<uint8_t>(r.map); },
            "Rectified BGR map as numpy array (H, W, 3).")
        .def_readonly("straightened_corners", &RegionResult::straightened_corners)
        .def_readonly("source_corners", &RegionResult::source_corners)
        .def_property_readonly("crop",
                               [](const RegionResult& r) {
                                   return py::make_tuple(r.crop.x, r.crop.y, r.crop.width,
                                                         r.crop.height);
                               })
        .def_readonly("rotation_deg", &RegionResult::rotation_deg)
        .def_readonly("otsu_threshold", &RegionResult::otsu_threshold);

    py::class_<MarkerResult>(m, "MarkerResult", "Located marker.")
        .def_readonly("geometry", &MarkerResult::geometry)
        .def_property_readonly("triangle",
                               [](const MarkerResult& r) {
                                   return py::make_tuple(PointToTuple(r.triangle[0]),
                                                         PointToTuple(r.triangle[1]),
                                                         PointToTuple(r.triangle[2]));
                               })
        .def_readonly("silhouette_area", &MarkerResult::silhouette_area);

    py::class_<RegionExtractor>(m, "RegionExtractor", "Finds and rectifies the map.")
        .def(py::init<const RegionExtractorConfig&>(), py::arg("config") = RegionExtractorConfig{})
        .def(
            "run",
            [](const RegionExtractor& self, const pybind_utils::ImageArray& image,
               const DebugOptions& debug) { return self.Run(NumpyToMat(image), debug); },
            py::arg("image"), py::arg("debug") = DebugOptions{},
            "Extract the map from a BGR array.")
        .def_property_readonly("config", &RegionExtractor::config);

    py::class_<MarkerLocator>(m, "MarkerLocator", "Finds the marker in a rectified map.")
        .def(py::init<const MarkerLocatorConfig&>(), py::arg("config") = MarkerLocatorConfig{})
        .def(
            "run",
            [](const MarkerLocator& self, const pybind_utils::ImageArray& map,
               const DebugOptions& debug) { return self.Run(NumpyToMat(map), debug); },
            py::arg("map"), py::arg("debug") = DebugOptions{}, "Locate the marker in a BGR array.")
        .def_property_readonly("config", &MarkerLocator::config);

    py::class_<LocateResult>(m, "LocateResult", "Position and bearing of the marker.")
        .def_readonly("position", &LocateResult::position)
        .def_readonly("bearing", &LocateResult::bearing)
        .def_readonly("marker", &LocateResult::marker)
        .def_readonly("corners", &LocateResult::corners)
        .def_property_readonly(
            "map_size",
            [](const LocateResult& r) {
                return py::make_tuple(r.map_size.width, r.map_size.height);
            })
        .def_readonly("rotation_deg", &LocateResult::rotation_deg)
        .def("report", &FormatReport, "POSITION/BEARING report text.");

    m.def(
        "locate",
        [](const std::string& path, const PipelineConfig& config) {
            LocateRequest request;
            request.image_path = path;
            request.config     = config;
            py::gil_scoped_release release;
            return Locate(request);
        },
        py::arg("path"), py::arg("config") = PipelineConfig{},
        "Locate the marker in an image file.");

    m.def(
        "locate_array",
        [](const pybind_utils::ImageArray& image, const PipelineConfig& config) {
            const cv::Mat mat = NumpyToMat(image);
            py::gil_scoped_release release;
            return LocateImage(mat, config);
        },
        py::arg("image"), py::arg("config") = PipelineConfig{},
        "Locate the marker in a BGR numpy array.");

    m.def("format_report", &FormatReport, py::arg("result"));
}

} // namespace MapBearing::pybind
