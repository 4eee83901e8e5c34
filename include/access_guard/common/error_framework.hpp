#pragma once

#include <string>
#include <map>
#include <unordered_map>

namespace access_guard {
namespace common {

// How a caller is expected to react. Authorization denial is not an
// error kind; it is a false return from the permission path.
enum class ErrorKind {
    VALIDATION,
    NOT_FOUND,
    CONFLICT,
    INTERNAL
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return "validation";
        case ErrorKind::NOT_FOUND: return "not_found";
        case ErrorKind::CONFLICT: return "conflict";
        case ErrorKind::INTERNAL: return "internal";
    }
    return "internal";
}

template<typename EnumType>
struct ErrorInfo {
    EnumType code;
    const char* code_str;
    ErrorKind kind;
    const char* default_message;
};

// Structured fields appended to "[Component] Message | ..." log lines.
struct ErrorContext {
    std::string component;
    std::string user_id;
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
        static ErrorInfo<EnumType> fallback{code, "UNKNOWN_ERROR", ErrorKind::INTERNAL, "Unknown error"};
        return fallback;
    }

    static const char* toString(EnumType code) { return getInfo(code).code_str; }
    static const char* getMessage(EnumType code) { return getInfo(code).default_message; }
    static ErrorKind kind(EnumType code) { return getInfo(code).kind; }

protected:
    static const std::unordered_map<EnumType, ErrorInfo<EnumType>>& getInfoMap();
};

inline std::string formatContext(const ErrorContext& ctx) {
    std::string result;
    auto append = [&result](const std::string& key, const std::string& value) {
        if (!result.empty()) {
            result += " | ";
        }
        result += key + "=" + value;
    };

    if (!ctx.user_id.empty()) {
        append("user", ctx.user_id);
    }
    for (const auto& [key, value] : ctx.details) {
        append(key, value);
    }
    return result;
}

}}
