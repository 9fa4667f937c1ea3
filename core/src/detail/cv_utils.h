/// \file detail/cv_utils.h
/// \brief Internal OpenCV utility functions shared across core modules.

#pragma once

#include "mapbearing/error.h"
#include "mapbearing/geometry.h"

#include <opencv2/imgproc.hpp>

#include <string>
#include <vector>

namespace MapBearing::detail {

/// Ensure the input image is in BGR CV_8U format.
/// Handles BGRA (4-channel), grayscale (1-channel), and BGR (3-channel) inputs.
/// Converts higher bit-depth images (e.g. 16-bit PNG) to 8-bit.
/// Returns an empty Mat if input is empty.
inline cv::Mat EnsureBgr(const cv::Mat& src) {
    if (src.empty()) { return cv::Mat(); }

    cv::Mat img = src;
    if (img.depth() != CV_8U) {
        double scale = (img.depth() == CV_16U || img.depth() == CV_16S) ? 1.0 / 256.0 : 1.0;
        img.convertTo(img, CV_8U, scale);
    }

    if (img.channels() == 3) { return img; }
    if (img.channels() == 4) {
        cv::Mat bgr;
        cv::cvtColor(img, bgr, cv::COLOR_BGRA2BGR);
        return bgr;
    }
    if (img.channels() == 1) {
        cv::Mat bgr;
        cv::cvtColor(img, bgr, cv::COLOR_GRAY2BGR);
        return bgr;
    }
    throw InputError("Unsupported image channel count: " + std::to_string(img.channels()));
}

/// Square structuring element of side \p size.
inline cv::Mat SquareKernel(int size) {
    return cv::getStructuringElement(cv::MORPH_RECT, cv::Size(size, size));
}

/// External contours of a binary mask, with every boundary pixel kept.
inline std::vector<Silhouette> FindExternalContours(const cv::Mat& mask) {
    std::vector<Silhouette> contours;
    cv::findContours(mask, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_NONE);
    return contours;
}

} // namespace MapBearing::detail
