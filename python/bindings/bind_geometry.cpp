#include "bindings.h"

#include "mapbearing/bearing.h"
#include "mapbearing/geometry.h"
#include "pybind_utils.h"

#include <array>
#include <utility>
#include <vector>

namespace py = pybind11;

namespace MapBearing::pybind {
namespace {

using PointPair = std::pair<float, float>;

TriangleCandidate ToTriangle(const std::array<PointPair, 3>& pts) {
    return {pybind_utils::TupleToPoint(pts[0]), pybind_utils::TupleToPoint(pts[1]),
            pybind_utils::TupleToPoint(pts[2])};
}

} // namespace

void BindGeometry(py::module_& m) {
    using pybind_utils::PointToTuple;

    py::class_<Quadrilateral>(m, "Quadrilateral", "Map corners ordered TL, TR, BR, BL.")
        .def_property_readonly("top_left",
                               [](const Quadrilateral& q) { return PointToTuple(q.top_left); })
        .def_property_readonly("top_right",
                               [](const Quadrilateral& q) { return PointToTuple(q.top_right); })
        .def_property_readonly(
            "bottom_right", [](const Quadrilateral& q) { return PointToTuple(q.bottom_right); })
        .def_property_readonly(
            "bottom_left", [](const Quadrilateral& q) { return PointToTuple(q.bottom_left); });

    py::class_<MarkerGeometry>(m, "MarkerGeometry", "Marker tip and base vertices.")
        .def_property_readonly("tip", [](const MarkerGeometry& g) { return PointToTuple(g.tip); })
        .def_property_readonly("base",
                               [](const MarkerGeometry& g) {
                                   return py::make_tuple(PointToTuple(g.base[0]),
                                                         PointToTuple(g.base[1]));
                               })
        .def_property_readonly(
            "base_midpoint",
            [](const MarkerGeometry& g) { return PointToTuple(g.BaseMidpoint()); });

    py::class_<NormalizedPosition>(m, "NormalizedPosition", "Tip position in [0, 1], y up.")
        .def_readonly("xpos", &NormalizedPosition::xpos)
        .def_readonly("ypos", &NormalizedPosition::ypos);

    m.def(
        "order_corners",
        [](const std::vector<PointPair>& pts) {
            std::vector<cv::Point2f> points;
            points.reserve(pts.size());
            for (const auto& p : pts) { points.push_back(pybind_utils::TupleToPoint(p)); }
            return OrderCorners(points);
        },
        py::arg("points"), "Order four corners from a point set by the sum/difference rule.");

    m.def(
        "select_tip",
        [](const std::array<PointPair, 3>& triangle, TipTieBreak policy, double tolerance) {
            return SelectTip(ToTriangle(triangle), policy, tolerance);
        },
        py::arg("triangle"), py::arg("policy") = TipTieBreak::LowestIndex,
        py::arg("tolerance") = 1e-6, "Split a triangle into tip and base.");

    m.def("compute_bearing", &ComputeBearing, py::arg("geometry"),
          "Compass bearing in degrees, [0, 360), 0 = up, clockwise.");
    m.def("raw_image_angle", &RawImageAngle, py::arg("geometry"),
          "atan2 of the base-to-tip direction in image axes, degrees.");
    m.def("normalize_bearing", &NormalizeBearing, py::arg("degrees"),
          "Wrap an angle into [0, 360).");
    m.def(
        "normalize_position",
        [](const PointPair& tip, int width, int height) {
            return NormalizePosition(pybind_utils::TupleToPoint(tip), cv::Size(width, height));
        },
        py::arg("tip"), py::arg("width"), py::arg("height"),
        "Tip position normalized to a map of width x height.");
}

} // namespace MapBearing::pybind
