#pragma once

#include "../common/error_framework.hpp"
#include <stdexcept>
#include <utility>
#include <unordered_map>

namespace rateline {
namespace core {

enum class CoreErrorCode {
    INVALID_ALPHA = 100,
    INVALID_REDRAW_RATE = 101,
    INVALID_WIDTH = 102,

    INVALID_THEME = 200,
    UNKNOWN_THEME = 201,

    CONFIG_PARSE_FAILED = 300,
    CONFIG_WRITE_FAILED = 301
};

using CoreErrorCodeHelper = common::ErrorRegistry<CoreErrorCode>;

}
}

namespace rateline {
namespace common {

template<>
inline const std::unordered_map<core::CoreErrorCode, ErrorInfo<core::CoreErrorCode>>&
ErrorRegistry<core::CoreErrorCode>::getInfoMap() {
    static const std::unordered_map<core::CoreErrorCode, ErrorInfo<core::CoreErrorCode>> map = {
        {core::CoreErrorCode::INVALID_ALPHA, {
            core::CoreErrorCode::INVALID_ALPHA,
            "INVALID_ALPHA",
            "Smoothing factor must be in (0, 1]"
        }},
        {core::CoreErrorCode::INVALID_REDRAW_RATE, {
            core::CoreErrorCode::INVALID_REDRAW_RATE,
            "INVALID_REDRAW_RATE",
            "Target redraws per second must be at least 1"
        }},
        {core::CoreErrorCode::INVALID_WIDTH, {
            core::CoreErrorCode::INVALID_WIDTH,
            "INVALID_WIDTH",
            "Bar width must be at least 1"
        }},
        {core::CoreErrorCode::INVALID_THEME, {
            core::CoreErrorCode::INVALID_THEME,
            "INVALID_THEME",
            "Theme must contain exactly 9 glyphs"
        }},
        {core::CoreErrorCode::UNKNOWN_THEME, {
            core::CoreErrorCode::UNKNOWN_THEME,
            "UNKNOWN_THEME",
            "Theme name is not a built-in theme"
        }},
        {core::CoreErrorCode::CONFIG_PARSE_FAILED, {
            core::CoreErrorCode::CONFIG_PARSE_FAILED,
            "CONFIG_PARSE_FAILED",
            "Configuration file could not be parsed"
        }},
        {core::CoreErrorCode::CONFIG_WRITE_FAILED, {
            core::CoreErrorCode::CONFIG_WRITE_FAILED,
            "CONFIG_WRITE_FAILED",
            "Configuration file could not be written"
        }}
    };
    return map;
}

}
}

namespace rateline {
namespace core {

// Setup-time failure. report() and the renderers never throw this.
class EngineError : public std::runtime_error {
public:
    EngineError(CoreErrorCode code, common::ErrorContext context = {})
        : std::runtime_error(common::describeError(code, context)),
          code_(code),
          context_(std::move(context)) {}

    CoreErrorCode code() const { return code_; }
    const common::ErrorContext& context() const { return context_; }

private:
    CoreErrorCode code_;
    common::ErrorContext context_;
};

}
}
