#pragma once

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace MapBearing::pybind {

void BindCommon(pybind11::module_& m);
void BindGeometry(pybind11::module_& m);
void BindPipeline(pybind11::module_& m);

} // namespace MapBearing::pybind
