#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for voxel_math types

#include <glm/fwd.hpp>

namespace voxel_math {

// =============================================================================
// Vector Types (GLM aliases)
// =============================================================================
using Vec3 = glm::vec3;
using IVec3 = glm::ivec3;

// =============================================================================
// Forward Declarations
// =============================================================================
struct AABB;

} // namespace voxel_math
