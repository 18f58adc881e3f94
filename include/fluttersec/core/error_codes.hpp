#pragma once

#include "../common/error_framework.hpp"
#include <unordered_map>

namespace fluttersec {
namespace core {

enum class PipelineErrorCode {
    FILE_NOT_FOUND = 100,
    UNSUPPORTED_FORMAT = 101,

    INVALID_ARCHIVE = 200,
    INVALID_STRUCTURE = 201,
    WORKSPACE_FAILED = 202,

    CANCELLED = 300
};

using PipelineErrorCodeHelper = common::ErrorRegistry<PipelineErrorCode>;
using PipelineError = common::CodedError<PipelineErrorCode>;

}
}

namespace fluttersec {
namespace common {

template<>
inline const std::unordered_map<core::PipelineErrorCode, ErrorInfo<core::PipelineErrorCode>>&
ErrorRegistry<core::PipelineErrorCode>::getInfoMap() {
    static const std::unordered_map<core::PipelineErrorCode, ErrorInfo<core::PipelineErrorCode>> map = {
        {core::PipelineErrorCode::FILE_NOT_FOUND, {
            core::PipelineErrorCode::FILE_NOT_FOUND,
            "FILE_NOT_FOUND",
            "Input file not found"
        }},
        {core::PipelineErrorCode::UNSUPPORTED_FORMAT, {
            core::PipelineErrorCode::UNSUPPORTED_FORMAT,
            "UNSUPPORTED_FORMAT",
            "Unsupported file format, expected .apk or .ipa"
        }},
        {core::PipelineErrorCode::INVALID_ARCHIVE, {
            core::PipelineErrorCode::INVALID_ARCHIVE,
            "INVALID_ARCHIVE",
            "Package is not a valid zip archive"
        }},
        {core::PipelineErrorCode::INVALID_STRUCTURE, {
            core::PipelineErrorCode::INVALID_STRUCTURE,
            "INVALID_STRUCTURE",
            "Package layout is invalid"
        }},
        {core::PipelineErrorCode::WORKSPACE_FAILED, {
            core::PipelineErrorCode::WORKSPACE_FAILED,
            "WORKSPACE_FAILED",
            "Working directory could not be created"
        }},
        {core::PipelineErrorCode::CANCELLED, {
            core::PipelineErrorCode::CANCELLED,
            "CANCELLED",
            "Scan cancelled"
        }}
    };
    return map;
}

}
}
