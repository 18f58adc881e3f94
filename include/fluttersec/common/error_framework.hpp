#pragma once

#include <string>
#include <map>
#include <unordered_map>
#include <optional>
#include <chrono>
#include <stdexcept>

namespace fluttersec {
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
    std::optional<std::chrono::system_clock::time_point> when;

    ErrorContext& with(const std::string& key, const std::string& value) {
        details[key] = value;
        return *this;
    }
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

// Exception carrying a registered error code plus structured context.
template<typename EnumType>
class CodedError : public std::runtime_error {
public:
    CodedError(EnumType code, const std::string& message, ErrorContext context = {})
        : std::runtime_error(message.empty() ? ErrorRegistry<EnumType>::getMessage(code) : message),
          code_(code), context_(std::move(context)) {
        if (!context_.when) {
            context_.when = std::chrono::system_clock::now();
        }
    }

    EnumType code() const { return code_; }
    const char* codeString() const { return ErrorRegistry<EnumType>::toString(code_); }
    const ErrorContext& context() const { return context_; }

private:
    EnumType code_;
    ErrorContext context_;
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

}}
