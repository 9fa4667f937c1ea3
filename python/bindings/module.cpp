#include <pybind11/pybind11.h>

#include "bindings.h"
#include "mapbearing/version.h"

PYBIND11_MODULE(MapBearing, m) {
    m.doc()               = "MapBearing core bindings";
    m.attr("__version__") = MAPBEARING_VERSION_STRING;

    MapBearing::pybind::BindCommon(m);
    MapBearing::pybind::BindGeometry(m);
    MapBearing::pybind::BindPipeline(m);
}
