#pragma once

/// \file mapbearing.h
/// \brief Umbrella header; includes every public header in MapBearing.

#include "mapbearing/version.h"
#include "export.h"
#include "error.h"
#include "common.h"
#include "geometry.h"
#include "region.h"
#include "marker.h"
#include "bearing.h"
#include "pipeline.h"
#include "logging.h"
