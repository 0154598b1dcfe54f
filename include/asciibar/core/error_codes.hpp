#pragma once

#include "../common/error_framework.hpp"
#include <unordered_map>

namespace asciibar {
namespace core {

enum class BarErrorCode {
    MAX_CURRENT_EXCEEDED = 100,
    
    PROGRESS_FAILURE = 200,
    READ_FAILED = 201
};

using BarErrorCodeHelper = common::ErrorRegistry<BarErrorCode>;

}
}

namespace asciibar {
namespace common {

template<>
inline const std::unordered_map<core::BarErrorCode, ErrorInfo<core::BarErrorCode>>& 
ErrorRegistry<core::BarErrorCode>::getInfoMap() {
    static const std::unordered_map<core::BarErrorCode, ErrorInfo<core::BarErrorCode>> map = {
        {core::BarErrorCode::MAX_CURRENT_EXCEEDED, {
            core::BarErrorCode::MAX_CURRENT_EXCEEDED,
            "MAX_CURRENT_EXCEEDED",
            "errors: current value is greater total value"
        }},
        {core::BarErrorCode::PROGRESS_FAILURE, {
            core::BarErrorCode::PROGRESS_FAILURE,
            "PROGRESS_FAILURE",
            "progress bar failure"
        }},
        {core::BarErrorCode::READ_FAILED, {
            core::BarErrorCode::READ_FAILED,
            "READ_FAILED",
            "Stream read failed"
        }}
    };
    return map;
}

}
}
