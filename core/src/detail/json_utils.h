/// \file detail/json_utils.h
/// \brief Internal JSON-related utility functions shared across core modules.

#pragma once

#include "mapbearing/common.h"
#include "mapbearing/error.h"

#include <nlohmann/json.hpp>

#include <array>
#include <string>

namespace MapBearing::detail {

/// Parse ContourSelection from a JSON value (accepts string or integer).
inline ContourSelection ParseContourSelection(const nlohmann::json& value) {
    if (value.is_string()) { return FromContourSelectionString(value.get<std::string>()); }
    if (value.is_number_integer()) {
        int v = value.get<int>();
        if (v == 0) { return ContourSelection::First; }
        if (v == 1) { return ContourSelection::Largest; }
        if (v == 2) { return ContourSelection::Single; }
    }
    throw FormatError("Invalid contour_selection value");
}

/// Parse TipTieBreak from a JSON value (accepts string or integer).
inline TipTieBreak ParseTipTieBreak(const nlohmann::json& value) {
    if (value.is_string()) { return FromTipTieBreakString(value.get<std::string>()); }
    if (value.is_number_integer()) {
        int v = value.get<int>();
        if (v == 0) { return TipTieBreak::LowestIndex; }
        if (v == 1) { return TipTieBreak::Error; }
    }
    throw FormatError("Invalid tie_break value");
}

/// Parse a three-component integer triple such as an HSV bound.
inline std::array<int, 3> ParseTriple(const nlohmann::json& value, const std::string& key) {
    if (!value.is_array() || value.size() != 3) {
        throw FormatError(key + " must be an array of size 3");
    }
    std::array<int, 3> out{};
    for (size_t i = 0; i < 3; ++i) {
        if (!value.at(i).is_number_integer()) {
            throw FormatError(key + " must contain integers");
        }
        out[i] = value.at(i).get<int>();
    }
    return out;
}

} // namespace MapBearing::detail
