#pragma once

/// @file error.hpp
/// @brief Error handling types for voxel_core

#include "fwd.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace voxel_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    CapacityExceeded,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::CapacityExceeded: return "CapacityExceeded";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Configuration errors (rejected at construction, never clamped)
struct ConfigError {
    enum class Kind : std::uint8_t {
        InvalidValue,    // Field out of its legal range
        InvertedBounds,  // min > max on some axis
        ParseError,      // Malformed config document
        IOError,         // Config file unreadable
    };

    Kind kind;
    std::string message;
    std::string field;

    [[nodiscard]] static ConfigError invalid_value(const std::string& field_name, const std::string& reason) {
        return ConfigError{Kind::InvalidValue, "Invalid '" + field_name + "': " + reason, field_name};
    }

    [[nodiscard]] static ConfigError inverted_bounds(const std::string& field_name) {
        return ConfigError{Kind::InvertedBounds, "Inverted bounds in '" + field_name + "'", field_name};
    }

    [[nodiscard]] static ConfigError parse_error(const std::string& reason) {
        return ConfigError{Kind::ParseError, "Config parse error: " + reason, {}};
    }

    [[nodiscard]] static ConfigError io_error(const std::string& path) {
        return ConfigError{Kind::IOError, "Cannot read config file: " + path, path};
    }
};

/// Fixed-capacity storage exhausted
struct CapacityError {
    enum class Kind : std::uint8_t {
        EntityStoreFull,
        PairBufferFull,
        ContactBufferFull,
    };

    Kind kind;
    std::string message;
    std::size_t capacity = 0;

    [[nodiscard]] static CapacityError entity_store_full(std::size_t cap) {
        return CapacityError{Kind::EntityStoreFull,
            "Entity store full (" + std::to_string(cap) + " entities)", cap};
    }

    [[nodiscard]] static CapacityError pair_buffer_full(std::size_t cap) {
        return CapacityError{Kind::PairBufferFull,
            "Candidate pair buffer full (" + std::to_string(cap) + " pairs)", cap};
    }

    [[nodiscard]] static CapacityError contact_buffer_full(std::size_t cap) {
        return CapacityError{Kind::ContactBufferFull,
            "Contact manifold full (" + std::to_string(cap) + " points)", cap};
    }
};

/// Entity handle errors
struct EntityError {
    enum class Kind : std::uint8_t {
        OutOfRange,  // Index past the live entity count
        Invalid,     // Sentinel id
    };

    Kind kind;
    std::string message;
    std::uint32_t index = 0;

    [[nodiscard]] static EntityError out_of_range(std::uint32_t idx, std::size_t count) {
        return EntityError{Kind::OutOfRange,
            "Entity " + std::to_string(idx) + " out of range (count " + std::to_string(count) + ")", idx};
    }

    [[nodiscard]] static EntityError invalid() {
        return EntityError{Kind::Invalid, "Entity id is invalid", 0};
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
        CapacityError,
        EntityError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(CapacityError err) : m_code(ErrorCode::CapacityExceeded), m_error(std::move(err)) {}
    Error(EntityError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

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

    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::InvalidValue: return ErrorCode::ValidationError;
            case ConfigError::Kind::InvertedBounds: return ErrorCode::ValidationError;
            case ConfigError::Kind::ParseError: return ErrorCode::ParseError;
            case ConfigError::Kind::IOError: return ErrorCode::IOError;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(EntityError::Kind kind) {
        switch (kind) {
            case EntityError::Kind::OutOfRange: return ErrorCode::NotFound;
            case EntityError::Kind::Invalid: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type carrying either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
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

    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    explicit operator bool() const noexcept { return m_value.has_value(); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

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

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

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

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with kind details and context
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

std::uint64_t total_error_count();
std::uint64_t capacity_error_count();

void reset_error_stats();

std::string error_stats_summary();

} // namespace debug

} // namespace voxel_core
