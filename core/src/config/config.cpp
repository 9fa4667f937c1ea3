#include "mapbearing/pipeline.h"
#include "mapbearing/error.h"
#include "detail/json_utils.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <string>

namespace MapBearing {

using nlohmann::json;

static json ConfigToJson(const PipelineConfig& cfg) {
    json region;
    region["blur_kernel"]       = cfg.region.blur_kernel;
    region["invert_threshold"]  = cfg.region.invert_threshold;
    region["morph_kernel"]      = cfg.region.morph_kernel;
    region["dilate_iterations"] = cfg.region.dilate_iterations;
    region["erode_iterations"]  = cfg.region.erode_iterations;
    region["expand_canvas"]     = cfg.region.expand_canvas;
    region["contour_selection"] = ToContourSelectionString(cfg.region.contour_selection);

    json marker;
    marker["hsv_lower"]         = cfg.marker.hsv_lower;
    marker["hsv_upper"]         = cfg.marker.hsv_upper;
    marker["close_kernel"]      = cfg.marker.close_kernel;
    marker["close_iterations"]  = cfg.marker.close_iterations;
    marker["contour_selection"] = ToContourSelectionString(cfg.marker.contour_selection);
    marker["tie_break"]         = ToTipTieBreakString(cfg.marker.tie_break);
    marker["tie_tolerance"]     = cfg.marker.tie_tolerance;

    json debug;
    debug["show_intermediate_steps"] = cfg.debug.show_intermediate_steps;
    debug["dump_dir"]                = cfg.debug.dump_dir;

    json j;
    j["region"] = region;
    j["marker"] = marker;
    j["debug"]  = debug;
    return j;
}

static PipelineConfig ConfigFromJson(const json& j) {
    if (!j.is_object()) { throw FormatError("Pipeline config must be a JSON object"); }

    PipelineConfig cfg;
    try {
        if (j.contains("region")) {
            const auto& r               = j.at("region");
            cfg.region.blur_kernel      = r.value("blur_kernel", cfg.region.blur_kernel);
            cfg.region.invert_threshold = r.value("invert_threshold", cfg.region.invert_threshold);
            cfg.region.morph_kernel     = r.value("morph_kernel", cfg.region.morph_kernel);
            cfg.region.dilate_iterations =
                r.value("dilate_iterations", cfg.region.dilate_iterations);
            cfg.region.erode_iterations = r.value("erode_iterations", cfg.region.erode_iterations);
            cfg.region.expand_canvas    = r.value("expand_canvas", cfg.region.expand_canvas);
            if (r.contains("contour_selection")) {
                cfg.region.contour_selection =
                    detail::ParseContourSelection(r.at("contour_selection"));
            }
        }

        if (j.contains("marker")) {
            const auto& m = j.at("marker");
            if (m.contains("hsv_lower")) {
                cfg.marker.hsv_lower = detail::ParseTriple(m.at("hsv_lower"), "hsv_lower");
            }
            if (m.contains("hsv_upper")) {
                cfg.marker.hsv_upper = detail::ParseTriple(m.at("hsv_upper"), "hsv_upper");
            }
            cfg.marker.close_kernel     = m.value("close_kernel", cfg.marker.close_kernel);
            cfg.marker.close_iterations = m.value("close_iterations", cfg.marker.close_iterations);
            cfg.marker.tie_tolerance    = m.value("tie_tolerance", cfg.marker.tie_tolerance);
            if (m.contains("contour_selection")) {
                cfg.marker.contour_selection =
                    detail::ParseContourSelection(m.at("contour_selection"));
            }
            if (m.contains("tie_break")) {
                cfg.marker.tie_break = detail::ParseTipTieBreak(m.at("tie_break"));
            }
        }

        if (j.contains("debug")) {
            const auto& d = j.at("debug");
            cfg.debug.show_intermediate_steps =
                d.value("show_intermediate_steps", cfg.debug.show_intermediate_steps);
            cfg.debug.dump_dir = d.value("dump_dir", cfg.debug.dump_dir);
        }
    } catch (const json::exception& e) {
        throw FormatError(std::string("Invalid pipeline config: ") + e.what());
    }

    cfg.Validate();
    return cfg;
}

void PipelineConfig::Validate() const {
    region.Validate();
    marker.Validate();
}

void PipelineConfig::SaveToJson(const std::string& path) const {
    json j = ConfigToJson(*this);
    std::ofstream out(path);
    if (!out.is_open()) { throw IOError("Failed to open file: " + path); }
    out << j.dump(4);
    if (!out.good()) { throw IOError("Failed to write json: " + path); }
}

PipelineConfig PipelineConfig::LoadFromJson(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) { throw IOError("Failed to open file: " + path); }
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw FormatError("Failed to parse " + path + ": " + e.what());
    }
    spdlog::debug("Loaded pipeline config from {}", path);
    return ConfigFromJson(j);
}

std::string PipelineConfig::ToJsonString() const { return ConfigToJson(*this).dump(4); }

PipelineConfig PipelineConfig::FromJsonString(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw FormatError(std::string("Failed to parse pipeline config: ") + e.what());
    }
    return ConfigFromJson(j);
}

} // namespace MapBearing
