#pragma once

/// @file constants.hpp
/// @brief Numeric constants for voxel_math

#include <limits>

namespace voxel_math::consts {

/// Default comparison tolerance
inline constexpr float EPSILON = 1e-6f;

/// Looser tolerance for accumulated float error
inline constexpr float EPSILON_LOOSE = 1e-4f;

inline constexpr float INFINITY_F = std::numeric_limits<float>::infinity();

inline constexpr float MAX_FLOAT = std::numeric_limits<float>::max();

} // namespace voxel_math::consts
