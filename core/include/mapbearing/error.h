#pragma once

/// \file error.h
/// \brief Typed error hierarchy for MapBearing.
///
/// All public functions throw subclasses of MapBearing::Error instead of
/// plain std::runtime_error, so callers can catch specific categories.

#include "common.h"
#include "export.h"

#include <stdexcept>
#include <string>

namespace MapBearing {

/// Error categories returned by Error::code().
enum class ErrorCode : int {
    Ok = 0,
    InvalidInput,        ///< Caller supplied invalid arguments or data.
    IOError,             ///< File or stream I/O failure.
    FormatError,         ///< Configuration parsing or validation error.
    SegmentationFailure, ///< No usable external contour after thresholding.
    GeometryFailure,     ///< Corner, triangle or direction geometry is unusable.
    InternalError,       ///< Logic error inside the library.
};

/// Convert ErrorCode to its string representation.
MAPBEARING_API std::string ToErrorCodeString(ErrorCode code);

/// Base exception for all MapBearing errors.
class MAPBEARING_API Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/// File / stream I/O failure.
class MAPBEARING_API IOError : public Error {
public:
    explicit IOError(const std::string& msg)
        : Error(ErrorCode::IOError, msg) {}
};

/// Invalid input arguments or data.
class MAPBEARING_API InputError : public Error {
public:
    explicit InputError(const std::string& msg)
        : Error(ErrorCode::InvalidInput, msg) {}
};

/// Configuration parsing / validation failure.
class MAPBEARING_API FormatError : public Error {
public:
    explicit FormatError(const std::string& msg)
        : Error(ErrorCode::FormatError, msg) {}
};

/// Failure attributed to one pipeline stage.
class MAPBEARING_API StageError : public Error {
public:
    StageError(ErrorCode code, PipelineStage stage, const std::string& msg)
        : Error(code, msg), stage_(stage) {}

    PipelineStage stage() const noexcept { return stage_; }

private:
    PipelineStage stage_;
};

/// No external contour (or not the expected one) after segmentation.
class MAPBEARING_API SegmentationError : public StageError {
public:
    SegmentationError(PipelineStage stage, const std::string& msg)
        : StageError(ErrorCode::SegmentationFailure, stage, msg) {}
};

/// Unexpected vertex count, tied tip or degenerate direction.
class MAPBEARING_API GeometryError : public StageError {
public:
    GeometryError(PipelineStage stage, const std::string& msg)
        : StageError(ErrorCode::GeometryFailure, stage, msg) {}
};

} // namespace MapBearing
