/// @file types.hpp
/// @brief Core types for voxel_physics

#pragma once

#include "fwd.hpp"

#include <voxel/math/bounds.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>

namespace voxel_physics {

using voxel_math::Vec3;
using voxel_math::IVec3;
using voxel_math::AABB;

// =============================================================================
// EntityId
// =============================================================================

/// Dense index into the entity store. Stable only until the next removal.
struct EntityId {
    std::uint32_t value = std::numeric_limits<std::uint32_t>::max();

    constexpr EntityId() noexcept = default;
    constexpr explicit EntityId(std::uint32_t v) noexcept : value(v) {}

    [[nodiscard]] static constexpr EntityId invalid() noexcept { return EntityId{}; }

    [[nodiscard]] constexpr bool is_valid() const noexcept {
        return value != std::numeric_limits<std::uint32_t>::max();
    }

    [[nodiscard]] constexpr std::size_t index() const noexcept { return value; }

    constexpr bool operator==(const EntityId&) const noexcept = default;
    constexpr auto operator<=>(const EntityId&) const noexcept = default;
};

// =============================================================================
// Entity Flags
// =============================================================================

using EntityFlags = std::uint8_t;

namespace flags {
    constexpr EntityFlags None     = 0;
    constexpr EntityFlags Grounded = 1 << 0;  ///< Resting on solid terrain
    constexpr EntityFlags InWater  = 1 << 1;  ///< Overlapping a water block
    constexpr EntityFlags OnLadder = 1 << 2;  ///< Overlapping a ladder block
    constexpr EntityFlags Excluded = 1 << 7;  ///< Degenerate geometry, skipped this tick

    /// Flags recomputed by the integrator every substep
    constexpr EntityFlags Environment = Grounded | InWater | OnLadder;
}

// =============================================================================
// Collision Filtering
// =============================================================================

using CollisionLayer = std::uint32_t;

namespace layers {
    constexpr CollisionLayer Default = 1u << 0;
    constexpr CollisionLayer All     = ~0u;
}

/// Both sides must accept the other's group
[[nodiscard]] constexpr bool can_collide(CollisionLayer group_a, CollisionLayer mask_a,
                                         CollisionLayer group_b, CollisionLayer mask_b) noexcept {
    return (group_a & mask_b) != 0 && (group_b & mask_a) != 0;
}

// =============================================================================
// Pairs and Contacts
// =============================================================================

/// Unordered entity pair stored canonically with a < b
struct CandidatePair {
    EntityId a;
    EntityId b;

    [[nodiscard]] static constexpr CandidatePair make(EntityId x, EntityId y) noexcept {
        return x.value < y.value ? CandidatePair{x, y} : CandidatePair{y, x};
    }

    [[nodiscard]] constexpr std::uint64_t key() const noexcept {
        return (static_cast<std::uint64_t>(a.value) << 32) | b.value;
    }

    constexpr bool operator==(const CandidatePair&) const noexcept = default;
    constexpr auto operator<=>(const CandidatePair&) const noexcept = default;
};

/// Single contact point. Normal points from the pair's first entity toward the second.
struct ContactPoint {
    Vec3 position{0.0f};
    Vec3 normal{0.0f};
    float depth = 0.0f;
};

// =============================================================================
// Statistics
// =============================================================================

/// Per-tick physics statistics. Counters reset at the start of each tick.
struct PhysicsStats {
    /// Entities
    std::uint32_t entity_count = 0;
    std::uint32_t dynamic_entities = 0;
    std::uint32_t static_entities = 0;
    std::uint32_t excluded_entities = 0;
    std::uint32_t grounded_entities = 0;

    /// Collision
    std::uint32_t broadphase_pairs = 0;
    std::uint32_t contact_pairs = 0;
    std::uint32_t contact_points = 0;
    std::uint32_t color_groups = 0;

    /// Capacity overflow
    std::uint32_t dropped_entities = 0;
    std::uint32_t dropped_pairs = 0;
    std::uint32_t dropped_contacts = 0;

    /// Stepping
    std::uint32_t fixed_steps = 0;
    std::uint32_t substeps = 0;

    /// Performance
    float step_time_ms = 0.0f;
    float broadphase_time_ms = 0.0f;
    float narrowphase_time_ms = 0.0f;
    float solver_time_ms = 0.0f;
    float integration_time_ms = 0.0f;
};

} // namespace voxel_physics

template<>
struct std::hash<voxel_physics::EntityId> {
    std::size_t operator()(const voxel_physics::EntityId& id) const noexcept {
        return std::hash<std::uint32_t>{}(id.value);
    }
};
