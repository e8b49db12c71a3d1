/// @file narrow_phase.hpp
/// @brief Box-vs-box contact generation

#pragma once

#include "types.hpp"

#include <optional>

namespace voxel_physics {

/// Contact between two axis-aligned boxes.
///
/// The normal lies along the axis of least overlap and points from `a`
/// toward `b`. Depth is the overlap on that axis. Boxes that only touch
/// (zero overlap on some axis) produce no contact.
[[nodiscard]] std::optional<ContactPoint> collide_aabb(const AABB& a, const AABB& b);

/// Restitution of a pair (average of both bodies)
[[nodiscard]] inline float combine_restitution(float a, float b) noexcept {
    return (a + b) * 0.5f;
}

/// Friction of a pair (average of both bodies)
[[nodiscard]] inline float combine_friction(float a, float b) noexcept {
    return (a + b) * 0.5f;
}

} // namespace voxel_physics
