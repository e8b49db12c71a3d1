#pragma once

/// @file types.hpp
/// @brief Core type definitions for voxel_math

#ifndef GLM_ENABLE_EXPERIMENTAL
#define GLM_ENABLE_EXPERIMENTAL
#endif
#include <glm/glm.hpp>
#include <glm/gtx/norm.hpp>

#include "fwd.hpp"
#include "constants.hpp"

#include <cmath>

namespace voxel_math {

// =============================================================================
// Vector Constants
// =============================================================================

namespace vec3 {
    inline constexpr Vec3 ZERO  = Vec3(0.0f, 0.0f, 0.0f);
    inline constexpr Vec3 ONE   = Vec3(1.0f, 1.0f, 1.0f);
    inline constexpr Vec3 X     = Vec3(1.0f, 0.0f, 0.0f);
    inline constexpr Vec3 Y     = Vec3(0.0f, 1.0f, 0.0f);
    inline constexpr Vec3 Z     = Vec3(0.0f, 0.0f, 1.0f);
}

// =============================================================================
// Helpers
// =============================================================================

/// True if every component is finite
[[nodiscard]] inline bool is_finite(const Vec3& v) noexcept {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

/// Component-wise floor to integer coordinates
[[nodiscard]] inline IVec3 floor_to_int(const Vec3& v) noexcept {
    return IVec3(static_cast<int>(std::floor(v.x)),
                 static_cast<int>(std::floor(v.y)),
                 static_cast<int>(std::floor(v.z)));
}

} // namespace voxel_math
