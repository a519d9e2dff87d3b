#pragma once

#include "../common/error_framework.hpp"
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace progressbar {
namespace core {

enum class ProgressErrorCode {
    INVALID_TOTAL_KIND = 100,
    ARITHMETIC_DEGENERATE = 200,
    STREAM_EXHAUSTED = 300,
    INTERRUPTED_BY_USER = 400
};

using ProgressErrorCodeHelper = common::ErrorRegistry<ProgressErrorCode>;

class ProgressError : public std::runtime_error {
public:
    ProgressError(ProgressErrorCode code, common::ErrorContext context);

    ProgressErrorCode code() const { return code_; }
    const common::ErrorContext& context() const { return context_; }

private:
    ProgressErrorCode code_;
    common::ErrorContext context_;

    static std::string buildMessage(ProgressErrorCode code, const common::ErrorContext& context);
};

}
}

namespace progressbar {
namespace common {

template<>
inline const std::unordered_map<core::ProgressErrorCode, ErrorInfo<core::ProgressErrorCode>>&
ErrorRegistry<core::ProgressErrorCode>::getInfoMap() {
    static const std::unordered_map<core::ProgressErrorCode, ErrorInfo<core::ProgressErrorCode>> map = {
        {core::ProgressErrorCode::INVALID_TOTAL_KIND, {
            core::ProgressErrorCode::INVALID_TOTAL_KIND,
            "INVALID_TOTAL_KIND",
            "Total must be a non-negative count, a sequence, or the unknown sentinel -1"
        }},
        {core::ProgressErrorCode::ARITHMETIC_DEGENERATE, {
            core::ProgressErrorCode::ARITHMETIC_DEGENERATE,
            "ARITHMETIC_DEGENERATE",
            "Progress metrics undefined for a zero or unknown total"
        }},
        {core::ProgressErrorCode::STREAM_EXHAUSTED, {
            core::ProgressErrorCode::STREAM_EXHAUSTED,
            "STREAM_EXHAUSTED",
            "Sequence exhausted"
        }},
        {core::ProgressErrorCode::INTERRUPTED_BY_USER, {
            core::ProgressErrorCode::INTERRUPTED_BY_USER,
            "INTERRUPTED_BY_USER",
            "Interrupted by user"
        }}
    };
    return map;
}

}
}
