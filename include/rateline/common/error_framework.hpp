#pragma once

#include <string>
#include <map>
#include <unordered_map>

namespace rateline {
namespace common {

template<typename EnumType>
struct ErrorInfo {
    EnumType code;
    const char* code_str;
    const char* default_message;
};

struct ErrorContext {
    std::string component;
    std::map<std::string, std::string> details;
};

template<typename EnumType>
class ErrorRegistry {
public:
    static const ErrorInfo<EnumType>& getInfo(EnumType code) {
        const auto& map = getInfoMap();
        auto it = map.find(code);
        if (it != map.end()) {
            return it->second;
        }
        static ErrorInfo<EnumType> fallback{EnumType{}, "UNKNOWN", "Unknown error"};
        return fallback;
    }
    
    static const char* toString(EnumType code) {
        return getInfo(code).code_str;
    }
    
    static const char* getMessage(EnumType code) {
        return getInfo(code).default_message;
    }
    
protected:
    static const std::unordered_map<EnumType, ErrorInfo<EnumType>>& getInfoMap();
};

inline std::string formatContext(const ErrorContext& ctx) {
    std::string result;
    for (const auto& [key, value] : ctx.details) {
        if (!result.empty()) {
            result += " | ";
        }
        result += key + "=" + value;
    }
    return result;
}

// "[component] CODE: message | key=value | ..."
template<typename EnumType>
std::string describeError(EnumType code, const ErrorContext& ctx) {
    std::string text;
    if (!ctx.component.empty()) {
        text += "[" + ctx.component + "] ";
    }
    text += ErrorRegistry<EnumType>::toString(code);
    text += ": ";
    text += ErrorRegistry<EnumType>::getMessage(code);

    std::string details = formatContext(ctx);
    if (!details.empty()) {
        text += " | " + details;
    }
    return text;
}

}}
