#pragma once

/// @file log.hpp
/// @brief Logging utilities for voxel_physics

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <chrono>
#include <set>
#include <cstdint>

// =============================================================================
// Logging Macros
// =============================================================================

#define VOXEL_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define VOXEL_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define VOXEL_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define VOXEL_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define VOXEL_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define VOXEL_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace voxel_core {

// =============================================================================
// Basic Logging (Inline)
// =============================================================================

/// @brief Initialize the logging system (basic)
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 3;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Configure logging system with full options
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Get the core module logger
std::shared_ptr<spdlog::logger> core_logger();

/// Get the physics logger (solver, integrator, world)
std::shared_ptr<spdlog::logger> physics_logger();

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);

void set_logger_level(const std::string& name, spdlog::level::level_enum level);

spdlog::level::level_enum get_global_log_level();

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// RAII log scope for function/block tracing
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "voxel_physics");
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define VOXEL_LOG_SCOPE(name) ::voxel_core::LogScope _log_scope_##__LINE__(name)
#define VOXEL_LOG_FUNC() ::voxel_core::LogScope _log_scope_func(__FUNCTION__)

// =============================================================================
// Log Throttling
// =============================================================================

/// Remembers which occurrence classes have already been reported.
///
/// Hot loops (per-entity, per-pair) use this so a condition that repeats every
/// tick produces one warning instead of thousands. Thread-safe.
class LogThrottle {
public:
    /// Returns true the first time `key` is seen since the last reset
    [[nodiscard]] bool first_occurrence(const std::string& key);

    /// Number of occurrences swallowed since the last reset
    [[nodiscard]] std::uint64_t suppressed() const;

    void reset();

private:
    mutable std::mutex m_mutex;
    std::set<std::string> m_seen;
    std::uint64_t m_suppressed = 0;
};

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

void shutdown_logging();

} // namespace voxel_core
