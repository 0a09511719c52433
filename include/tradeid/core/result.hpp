#pragma once
#include <variant>
#include <string>
#include <string_view>
#include <utility>

namespace tradeid::core {

// Error domain for identifiers and the boundary table
enum class IdentifierErrc {
    kSuccess = 0,
    kNullArgument,
    kInvalidText,
    kInvalidHandle,
    kCapacityExceeded,
    kOutOfMemory,
    kConfigNotFound,
    kConfigCorruption,
    kUnknown
};

inline constexpr std::string_view ToString(IdentifierErrc e) {
    switch (e) {
        case IdentifierErrc::kSuccess:           return "success";
        case IdentifierErrc::kNullArgument:      return "null argument";
        case IdentifierErrc::kInvalidText:       return "invalid text encoding";
        case IdentifierErrc::kInvalidHandle:     return "invalid or released handle";
        case IdentifierErrc::kCapacityExceeded:  return "live identifier capacity exceeded";
        case IdentifierErrc::kOutOfMemory:       return "out of memory";
        case IdentifierErrc::kConfigNotFound:    return "configuration not found";
        case IdentifierErrc::kConfigCorruption:  return "configuration corrupt";
        default:                                 return "unknown error";
    }
}

class ErrorCode {
public:
    IdentifierErrc value;
    ErrorCode(IdentifierErrc v) : value(v) {}
    operator bool() const { return value != IdentifierErrc::kSuccess; }
    std::string_view Message() const { return ToString(value); }
};

template<typename T>
class Result {
    std::variant<T, ErrorCode> data_;
public:
    Result(const T& v) : data_(v) {}
    Result(T&& v) : data_(std::move(v)) {}
    Result(ErrorCode e) : data_(e) {}
    Result(IdentifierErrc e) : data_(ErrorCode(e)) {}
    bool HasValue() const { return std::holds_alternative<T>(data_); }
    T& Value() { return std::get<T>(data_); }
    const T& Value() const { return std::get<T>(data_); }
    ErrorCode Error() const { return std::get<ErrorCode>(data_); }

    explicit operator bool() const { return HasValue(); }

    T& operator*() { return Value(); }
    const T& operator*() const { return Value(); }
};

template<>
class Result<void> {
    bool ok_;
    ErrorCode err_;
public:
    Result() : ok_(true), err_(IdentifierErrc::kSuccess) {}
    Result(ErrorCode e) : ok_(false), err_(e) {}
    Result(IdentifierErrc e) : ok_(false), err_(e) {}

    bool HasValue() const { return ok_; }
    void Value() const {}  // no-op
    ErrorCode Error() const { return err_; }

    explicit operator bool() const { return ok_; }
};

} // namespace tradeid::core
