#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for voxel_core module

#include <cstdint>

namespace voxel_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ConfigError;
struct CapacityError;
struct EntityError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;
class LogThrottle;

} // namespace voxel_core
