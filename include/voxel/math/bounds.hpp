#pragma once

/// @file bounds.hpp
/// @brief Axis-aligned bounding box for voxel_math

#include "types.hpp"
#include <algorithm>

namespace voxel_math {

// =============================================================================
// AABB (Axis-Aligned Bounding Box)
// =============================================================================

/// Axis-Aligned Bounding Box
struct AABB {
    Vec3 min = Vec3(consts::MAX_FLOAT);   ///< Minimum corner
    Vec3 max = Vec3(-consts::MAX_FLOAT);  ///< Maximum corner

    constexpr AABB() noexcept = default;

    constexpr AABB(const Vec3& min_point, const Vec3& max_point) noexcept
        : min(min_point), max(max_point) {}

    static AABB from_center_half_extents(const Vec3& center, const Vec3& half_extents) noexcept {
        return AABB(center - half_extents, center + half_extents);
    }

    // =========================================================================
    // Properties
    // =========================================================================

    [[nodiscard]] Vec3 center() const noexcept {
        return (min + max) * 0.5f;
    }

    [[nodiscard]] Vec3 half_extents() const noexcept {
        return (max - min) * 0.5f;
    }

    [[nodiscard]] Vec3 size() const noexcept {
        return max - min;
    }

    /// Check if AABB is valid (min <= max for all components)
    [[nodiscard]] bool is_valid() const noexcept {
        return min.x <= max.x && min.y <= max.y && min.z <= max.z;
    }

    /// Valid and free of NaN/Inf
    [[nodiscard]] bool is_finite() const noexcept {
        return voxel_math::is_finite(min) && voxel_math::is_finite(max) && is_valid();
    }

    // =========================================================================
    // Expansion
    // =========================================================================

    void expand_to_include(const AABB& other) noexcept {
        min = glm::min(min, other.min);
        max = glm::max(max, other.max);
    }

    [[nodiscard]] AABB union_with(const AABB& other) const noexcept {
        AABB result = *this;
        result.expand_to_include(other);
        return result;
    }

    [[nodiscard]] AABB expanded(float amount) const noexcept {
        return AABB(min - Vec3(amount), max + Vec3(amount));
    }

    [[nodiscard]] AABB translated(const Vec3& offset) const noexcept {
        return AABB(min + offset, max + offset);
    }

    // =========================================================================
    // Containment Tests
    // =========================================================================

    [[nodiscard]] bool contains_point(const Vec3& point) const noexcept {
        return point.x >= min.x && point.x <= max.x &&
               point.y >= min.y && point.y <= max.y &&
               point.z >= min.z && point.z <= max.z;
    }

    /// Closed-interval test: touching faces count as intersecting
    [[nodiscard]] bool intersects(const AABB& other) const noexcept {
        return min.x <= other.max.x && max.x >= other.min.x &&
               min.y <= other.max.y && max.y >= other.min.y &&
               min.z <= other.max.z && max.z >= other.min.z;
    }

    /// Open-interval test: touching faces do not overlap
    [[nodiscard]] bool overlaps(const AABB& other) const noexcept {
        return min.x < other.max.x && max.x > other.min.x &&
               min.y < other.max.y && max.y > other.min.y &&
               min.z < other.max.z && max.z > other.min.z;
    }

    /// Per-axis overlap depth (negative on separated axes)
    [[nodiscard]] Vec3 overlap_extent(const AABB& other) const noexcept {
        return glm::min(max, other.max) - glm::max(min, other.min);
    }

    bool operator==(const AABB& other) const noexcept {
        return min == other.min && max == other.max;
    }

    bool operator!=(const AABB& other) const noexcept {
        return !(*this == other);
    }
};

} // namespace voxel_math
