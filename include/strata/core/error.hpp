#pragma once

/// @file error.hpp
/// @brief Error handling types for strata_core

#include "fwd.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>

namespace strata_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    AlreadyExists,
    InvalidArgument,
    IOError,
    ParseError,
    ValidationError,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Configuration load errors. All of them abort server startup.
struct ConfigError {
    enum class Kind : std::uint8_t {
        ContextNotAllowed,  // Directive nested in a forbidden section
        InvalidValue,       // Directive argument is not an accepted literal
        InvalidArguments,   // Wrong number of arguments
        NotAllowedHere,     // Host directive used in the wrong scope
        DuplicateCommand,   // Command name registered twice
        Syntax,             // Malformed configuration text
        Io,                 // Configuration file could not be read
    };

    Kind kind;
    std::string message;
    std::string directive;
    std::string detail;     // Forbidden ancestor, rejected value or reason
    std::string file;
    std::size_t line = 0;

    /// Factory methods
    [[nodiscard]] static ConfigError context_not_allowed(const std::string& directive,
                                                         const std::string& ancestor) {
        return ConfigError{Kind::ContextNotAllowed,
            directive + " not allowed within " + ancestor + " ...>",
            directive, ancestor, {}, 0};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& directive,
                                                   const std::string& usage,
                                                   const std::string& value) {
        return ConfigError{Kind::InvalidValue, usage + ", not " + value, directive, value, {}, 0};
    }

    [[nodiscard]] static ConfigError takes_one_argument(const std::string& directive,
                                                        const std::string& usage) {
        return ConfigError{Kind::InvalidArguments,
            directive + " takes one argument, " + usage, directive, {}, {}, 0};
    }

    [[nodiscard]] static ConfigError requires_arguments(const std::string& directive,
                                                        const std::string& usage) {
        return ConfigError{Kind::InvalidArguments,
            directive + " requires at least one argument, " + usage, directive, {}, {}, 0};
    }

    [[nodiscard]] static ConfigError not_allowed_here(const std::string& directive) {
        return ConfigError{Kind::NotAllowedHere, directive + " not allowed here", directive, {}, {}, 0};
    }

    [[nodiscard]] static ConfigError duplicate_command(const std::string& directive) {
        return ConfigError{Kind::DuplicateCommand,
            "Command already registered: " + directive, directive, {}, {}, 0};
    }

    [[nodiscard]] static ConfigError syntax(const std::string& reason) {
        return ConfigError{Kind::Syntax, reason, {}, reason, {}, 0};
    }

    [[nodiscard]] static ConfigError io(const std::string& path, const std::string& reason) {
        return ConfigError{Kind::Io,
            "Could not open configuration file " + path + ": " + reason, {}, reason, path, 0};
    }

    /// Attach the source location the error was found at
    ConfigError& at(const std::string& source, std::size_t source_line) {
        file = source;
        line = source_line;
        return *this;
    }

    /// Check whether a source location is attached
    [[nodiscard]] bool has_location() const noexcept {
        return !file.empty() && line > 0;
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ConfigError,
        std::string  // Generic message
    >;

    Error() : m_code(ErrorCode::Unknown), m_error(std::string("Unknown error")) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type, nullptr if it holds another kind
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

private:
    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::ContextNotAllowed: return ErrorCode::ValidationError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::InvalidArgument;
            case ConfigError::Kind::InvalidArguments: return ErrorCode::InvalidArgument;
            case ConfigError::Kind::NotAllowedHere: return ErrorCode::ValidationError;
            case ConfigError::Kind::DuplicateCommand: return ErrorCode::AlreadyExists;
            case ConfigError::Kind::Syntax: return ErrorCode::ParseError;
            case ConfigError::Kind::Io: return ErrorCode::IOError;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Value or error. Configuration loading returns these all the way up to
/// the caller that starts the server.
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_value(std::move(value)) {}
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_value.has_value(); }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() : m_has_value(true) {}
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

private:
    E m_error;
    bool m_has_value;
};

template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Render an error the way configuration failures are reported at startup,
/// including its source location
std::string build_error_chain(const Error& error);

} // namespace strata_core
