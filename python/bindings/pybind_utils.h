#pragma once

#include "mapbearing/error.h"

#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include <opencv2/core.hpp>

#include <cstddef>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace MapBearing::pybind_utils {

namespace py = pybind11;

template <typename T>
inline py::array MatToNumpy(const cv::Mat& mat) {
    if (mat.empty()) { return py::array(); }
    cv::Mat contiguous = mat.isContinuous() ? mat : mat.clone();
    const int channels = contiguous.channels();
    std::vector<py::ssize_t> shape;
    if (channels == 1) {
        shape = {static_cast<py::ssize_t>(contiguous.rows),
                 static_cast<py::ssize_t>(contiguous.cols)};
    } else {
        shape = {static_cast<py::ssize_t>(contiguous.rows),
                 static_cast<py::ssize_t>(contiguous.cols), static_cast<py::ssize_t>(channels)};
    }
    py::array array(py::dtype::of<T>(), shape);
    const size_t bytes =
        static_cast<size_t>(contiguous.total()) * static_cast<size_t>(channels) * sizeof(T);
    std::memcpy(array.mutable_data(), contiguous.data, bytes);
    return array;
}

inline py::tuple PointToTuple(const cv::Point2f& p) { return py::make_tuple(p.x, p.y); }

inline cv::Point2f TupleToPoint(const std::pair<float, float>& p) {
    return cv::Point2f(p.first, p.second);
}

using ImageArray = py::array_t<uint8_t, py::array::c_style | py::array::forcecast>;

/// Copies a uint8 array of shape (H, W) or (H, W, C) into a cv::Mat.
inline cv::Mat NumpyToMat(const ImageArray& arr) {
    const py::buffer_info info = arr.request();
    if (info.ndim != 2 && info.ndim != 3) {
        throw InputError("Expected an image array of shape (H, W) or (H, W, C), got ndim=" +
                         std::to_string(info.ndim));
    }
    const int rows     = static_cast<int>(info.shape[0]);
    const int cols     = static_cast<int>(info.shape[1]);
    const int channels = info.ndim == 3 ? static_cast<int>(info.shape[2]) : 1;
    if (channels != 1 && channels != 3 && channels != 4) {
        throw InputError("Unsupported channel count: " + std::to_string(channels));
    }

    cv::Mat mat(rows, cols, CV_8UC(channels));
    std::memcpy(mat.data, info.ptr, mat.total() * mat.elemSize());
    return mat;
}

} // namespace MapBearing::pybind_utils
