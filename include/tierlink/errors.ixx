module; // ===== Global Module Fragment =====
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <new>        // placement new
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

export module tierlink.errors;

import tierlink.types; // ErrorCode + common aliases

export namespace tierlink {

// ================================
// Error classification
// ================================

enum class ErrorSeverity : std::uint8_t {
    LOW,        // Recoverable, caller may fall back to a default
    MEDIUM,     // Needs attention
    HIGH,       // Caller bug or corrupted data
    CRITICAL    // Broken library invariant
};

enum class ErrorCategory : std::uint8_t {
    VALIDATION,     // Caller-supplied indices, counts, cut points
    FORMAT,         // Untrusted fragment text or bytes
    CONFIGURATION,  // CodecConfig / options
    INTERNAL        // Invariants/logic errors
};

[[nodiscard]] inline constexpr std::string_view to_string(ErrorSeverity s) noexcept {
    switch (s) {
        case ErrorSeverity::LOW:      return "LOW";
        case ErrorSeverity::MEDIUM:   return "MEDIUM";
        case ErrorSeverity::HIGH:     return "HIGH";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}
[[nodiscard]] inline constexpr std::string_view to_string(ErrorCategory c) noexcept {
    switch (c) {
        case ErrorCategory::VALIDATION:    return "VALIDATION";
        case ErrorCategory::FORMAT:        return "FORMAT";
        case ErrorCategory::CONFIGURATION: return "CONFIGURATION";
        case ErrorCategory::INTERNAL:      return "INTERNAL";
    }
    return "UNKNOWN";
}

class CodecError {
    ErrorCode     code_{ErrorCode::INTERNAL_ERROR};
    std::string   msg_;
    ErrorSeverity severity_{ErrorSeverity::MEDIUM};
    ErrorCategory category_{ErrorCategory::INTERNAL};
    std::string   component_;
    std::string   operation_;

public:
    CodecError() = default;

    CodecError(ErrorCode c, std::string m,
               ErrorSeverity s = ErrorSeverity::MEDIUM,
               ErrorCategory cat = ErrorCategory::INTERNAL,
               std::string comp = {},
               std::string op = {}) noexcept
        : code_(c),
          msg_(std::move(m)),
          severity_(s),
          category_(cat),
          component_(std::move(comp)),
          operation_(std::move(op)) {}

    // -------- Classification helpers --------

    // Fragment text came from outside (a stale or hand-edited URL); callers
    // usually fall back to an empty state for these.
    [[nodiscard]] bool is_format_error() const noexcept {
        return category_ == ErrorCategory::FORMAT;
    }

    [[nodiscard]] bool is_caller_error() const noexcept {
        return category_ == ErrorCategory::VALIDATION ||
               category_ == ErrorCategory::CONFIGURATION;
    }

    // -------- Accessors --------
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] ErrorSeverity severity() const noexcept { return severity_; }
    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }
    [[nodiscard]] const std::string& message() const noexcept { return msg_; }
    [[nodiscard]] const std::string& component() const noexcept { return component_; }
    [[nodiscard]] const std::string& operation() const noexcept { return operation_; }

    // -------- Formatting --------
    [[nodiscard]] std::string to_string() const {
        std::string out;
        out.reserve(96 + msg_.size() + component_.size() + operation_.size());
        out.append("CodecError[code=").append(tierlink::to_string(code_));
        out.append(", sev=").append(tierlink::to_string(severity_));
        out.append(", cat=").append(tierlink::to_string(category_));
        out.append("] in ");
        if (!component_.empty()) out.append(component_); else out.append("<unknown>");
        out.append("::");
        if (!operation_.empty()) out.append(operation_); else out.append("<unknown>");
        out.append(" - ").append(msg_);
        return out;
    }

    [[noreturn]] void throw_as_exception() const {
        throw std::runtime_error(to_string());
    }
};

// ================================
// ResultEx: outcome type (value or CodecError)
// ================================

template<typename T>
concept ResultValue =
    std::is_nothrow_move_constructible_v<T> &&
    std::is_nothrow_destructible_v<T> &&
    !std::is_reference_v<T> &&
    !std::is_pointer_v<T>;

template <ResultValue T>
class [[nodiscard]] ResultEx {
    static_assert(!std::is_same_v<T, CodecError>,
                  "ResultEx cannot hold CodecError as a value");

    bool ok_{false};
    union {
        T          value_;
        CodecError err_;
    };

    void cleanup() noexcept {
        if (ok_) value_.~T();
        else     err_.~CodecError();
    }

    template<typename U>
    void construct_value(U&& v)
        noexcept(std::is_nothrow_constructible_v<T, U&&>) {
        ::new (static_cast<void*>(&value_)) T(std::forward<U>(v));
        ok_ = true;
    }

    void construct_error(const CodecError& e) {
        ::new (static_cast<void*>(&err_)) CodecError(e);
        ok_ = false;
    }
    void construct_error(CodecError&& e) noexcept {
        ::new (static_cast<void*>(&err_)) CodecError(std::move(e));
        ok_ = false;
    }

public:
    // -------- Ctors / assignment --------
    ResultEx() = delete;

    template<typename U = T>
    requires std::is_constructible_v<T, U&&> &&
             (!std::is_same_v<std::remove_cvref_t<U>, CodecError>) &&
             (!std::is_same_v<std::remove_cvref_t<U>, ResultEx>)
    explicit ResultEx(U&& v)
        noexcept(std::is_nothrow_constructible_v<T, U&&>) {
        construct_value(std::forward<U>(v));
    }

    explicit ResultEx(const CodecError& e) { construct_error(e); }
    explicit ResultEx(CodecError&& e) noexcept { construct_error(std::move(e)); }

    ResultEx(const ResultEx& other) {
        if (other.ok_) construct_value(other.value_);
        else           construct_error(other.err_);
    }

    ResultEx(ResultEx&& other) noexcept {
        if (other.ok_) construct_value(std::move(other.value_));
        else           construct_error(std::move(other.err_));
    }

    ResultEx& operator=(const ResultEx& other) {
        if (this != &other) {
            ResultEx tmp(other);
            cleanup();
            if (tmp.ok_) construct_value(std::move(tmp.value_));
            else         construct_error(std::move(tmp.err_));
        }
        return *this;
    }

    ResultEx& operator=(ResultEx&& other) noexcept {
        if (this != &other) {
            cleanup();
            if (other.ok_) construct_value(std::move(other.value_));
            else           construct_error(std::move(other.err_));
        }
        return *this;
    }

    ~ResultEx() noexcept { cleanup(); }

    // -------- State checks --------
    [[nodiscard]] explicit operator bool() const noexcept { return ok_; }

    // -------- Value access --------
    [[nodiscard]] const T& value() const & {
        if (!ok_) throw std::runtime_error(
            "Attempted to access value of failed ResultEx: " + err_.to_string());
        return value_;
    }
    [[nodiscard]] T& value() & {
        if (!ok_) throw std::runtime_error(
            "Attempted to access value of failed ResultEx: " + err_.to_string());
        return value_;
    }
    [[nodiscard]] T&& value() && {
        if (!ok_) throw std::runtime_error(
            "Attempted to access value of failed ResultEx: " + err_.to_string());
        return std::move(value_);
    }

    // -------- Error access --------
    [[nodiscard]] const CodecError& error() const & {
        if (ok_) throw std::logic_error("No error in successful ResultEx");
        return err_;
    }
    [[nodiscard]] CodecError&& error() && {
        if (ok_) throw std::logic_error("No error in successful ResultEx");
        return std::move(err_);
    }

    // -------- Operators --------
    [[nodiscard]] const T& operator*() const & { return value(); }
    [[nodiscard]] T&       operator*() &       { return value(); }
    [[nodiscard]] T&&      operator*() &&      { return std::move(value()); }

    [[nodiscard]] const T* operator->() const { return &value(); }
    [[nodiscard]] T*       operator->()       { return &value(); }
};

// ================================
// Helpers (Ok/Err + MakeError)
// ================================

template <typename T>
[[nodiscard]] inline ResultEx<std::decay_t<T>> Ok(T&& v) {
    return ResultEx<std::decay_t<T>>(std::forward<T>(v));
}
template <typename T>
[[nodiscard]] inline ResultEx<T> Err(const CodecError& e) {
    return ResultEx<T>(e);
}
template <typename T>
[[nodiscard]] inline ResultEx<T> Err(CodecError&& e) {
    return ResultEx<T>(std::move(e));
}

[[nodiscard]] inline CodecError MakeError(
    ErrorCode code, std::string msg,
    ErrorSeverity severity = ErrorSeverity::MEDIUM,
    ErrorCategory category = ErrorCategory::INTERNAL,
    std::string component = {},
    std::string operation = {}) noexcept {
    return CodecError(code, std::move(msg), severity, category,
                      std::move(component), std::move(operation));
}

// Builders with the metadata each error family carries.
[[nodiscard]] inline CodecError make_validation_error(
    ErrorCode code, std::string msg,
    std::string component = {}, std::string op = {}) noexcept {
    return MakeError(code, std::move(msg),
                     ErrorSeverity::HIGH, ErrorCategory::VALIDATION,
                     std::move(component), std::move(op));
}
[[nodiscard]] inline CodecError make_format_error(
    ErrorCode code, std::string msg,
    std::string component = {}, std::string op = {}) noexcept {
    return MakeError(code, std::move(msg),
                     ErrorSeverity::MEDIUM, ErrorCategory::FORMAT,
                     std::move(component), std::move(op));
}
[[nodiscard]] inline CodecError make_config_error(
    std::string msg = "Invalid configuration",
    std::string component = {}, std::string op = {}) noexcept {
    return MakeError(ErrorCode::CONFIG_ERROR, std::move(msg),
                     ErrorSeverity::HIGH, ErrorCategory::CONFIGURATION,
                     std::move(component), std::move(op));
}
[[nodiscard]] inline CodecError make_internal_error(
    ErrorCode code, std::string msg,
    std::string component = {}, std::string op = {}) noexcept {
    return MakeError(code, std::move(msg),
                     ErrorSeverity::CRITICAL, ErrorCategory::INTERNAL,
                     std::move(component), std::move(op));
}

} // namespace tierlink
