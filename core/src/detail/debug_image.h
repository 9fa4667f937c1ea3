/// \file detail/debug_image.h
/// \brief Intermediate-image dumps driven by DebugOptions.

#pragma once

#include "mapbearing/common.h"

#include <spdlog/spdlog.h>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <exception>
#include <filesystem>
#include <string>

namespace MapBearing::detail {

inline bool DebugEnabled(const DebugOptions& debug) { return debug.show_intermediate_steps; }

/// Writes \p img as <dump_dir>/<name> when intermediate steps are requested.
/// Failures are logged and never interrupt the pipeline.
inline void SaveDebugImage(const DebugOptions& debug, const std::string& name,
                           const cv::Mat& img) {
    if (!debug.show_intermediate_steps) { return; }
    spdlog::debug("debug image {}: {}x{}, {} channel(s)", name, img.cols, img.rows,
                  img.channels());
    if (debug.dump_dir.empty() || img.empty()) { return; }

    try {
        std::filesystem::create_directories(debug.dump_dir);

        cv::Mat out = img;
        if (out.depth() != CV_8U) {
            double min_v = 0.0, max_v = 0.0;
            cv::minMaxLoc(out, &min_v, &max_v);
            double scale = (max_v - min_v) > 1e-6 ? (255.0 / (max_v - min_v)) : 1.0;
            out.convertTo(out, CV_8U, scale, -min_v * scale);
        }
        std::filesystem::path path = std::filesystem::path(debug.dump_dir) / name;
        if (!cv::imwrite(path.string(), out)) {
            spdlog::warn("SaveDebugImage: could not write {}", path.string());
        }
    } catch (const std::exception& e) {
        spdlog::warn("SaveDebugImage failed: {}", e.what());
    }
}

} // namespace MapBearing::detail
