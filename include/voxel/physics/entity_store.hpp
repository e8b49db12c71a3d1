/// @file entity_store.hpp
/// @brief Struct-of-arrays storage for physics entities
///
/// Every column is indexed by EntityId and kept in lock-step. Removal swaps
/// the last entity into the freed slot, so ids are only stable until the
/// next removal; callers remap external handles using the returned id.
///
/// A body with inverse_mass == 0 is static: setters keep its velocity at zero.

#pragma once

#include "types.hpp"

#include <voxel/core/error.hpp>

#include <atomic>
#include <cstddef>
#include <span>
#include <vector>

namespace voxel_physics {

// =============================================================================
// EntityDesc
// =============================================================================

/// Full description of a new entity
struct EntityDesc {
    Vec3 position{0.0f};
    Vec3 velocity{0.0f};
    Vec3 half_extents{0.5f};
    /// Mass <= 0 (or non-finite) creates a static body
    float mass = 1.0f;
    float restitution = 0.3f;
    float friction = 0.5f;
    /// Linear drag coefficient per second
    float drag = 0.0f;
    float gravity_scale = 1.0f;
    CollisionLayer group = layers::Default;
    CollisionLayer mask = layers::All;

    [[nodiscard]] static EntityDesc dynamic_box(const Vec3& position, const Vec3& half_extents, float mass = 1.0f) {
        EntityDesc d;
        d.position = position;
        d.half_extents = half_extents;
        d.mass = mass;
        return d;
    }

    [[nodiscard]] static EntityDesc static_box(const Vec3& position, const Vec3& half_extents) {
        EntityDesc d;
        d.position = position;
        d.half_extents = half_extents;
        d.mass = 0.0f;
        return d;
    }
};

// =============================================================================
// EntityStore
// =============================================================================

class EntityStore {
public:
    explicit EntityStore(std::size_t max_entities = 65536);

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Append an entity; fails only when the store is at capacity
    [[nodiscard]] voxel_core::Result<EntityId> add_entity(
        const Vec3& position, const Vec3& velocity, float mass, const Vec3& half_extents);

    [[nodiscard]] voxel_core::Result<EntityId> add_entity(const EntityDesc& desc);

    /// Swap-remove. The last entity moves into the freed slot: the returned id is
    /// its former id, and it now answers to `id`. Returns EntityId::invalid()
    /// when the removed entity was the last one and nothing moved.
    [[nodiscard]] voxel_core::Result<EntityId> remove_entity(EntityId id);

    void clear();

    [[nodiscard]] std::size_t size() const noexcept { return m_position.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_position.empty(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return m_max_entities; }
    [[nodiscard]] bool contains(EntityId id) const noexcept {
        return id.is_valid() && id.index() < m_position.size();
    }

    /// Entities rejected for capacity since the last reset
    [[nodiscard]] std::uint32_t dropped_count() const noexcept { return m_dropped.load(std::memory_order_relaxed); }
    void reset_dropped_count() noexcept { m_dropped.store(0, std::memory_order_relaxed); }

    // =========================================================================
    // Per-entity access
    // =========================================================================

    [[nodiscard]] const Vec3& position(EntityId id) const { return m_position[id.index()]; }
    [[nodiscard]] const Vec3& previous_position(EntityId id) const { return m_previous_position[id.index()]; }
    [[nodiscard]] const Vec3& velocity(EntityId id) const { return m_velocity[id.index()]; }
    [[nodiscard]] const Vec3& force(EntityId id) const { return m_force[id.index()]; }
    [[nodiscard]] const Vec3& half_extents(EntityId id) const { return m_half_extents[id.index()]; }
    [[nodiscard]] float mass(EntityId id) const { return m_mass[id.index()]; }
    [[nodiscard]] float inverse_mass(EntityId id) const { return m_inverse_mass[id.index()]; }
    [[nodiscard]] float restitution(EntityId id) const { return m_restitution[id.index()]; }
    [[nodiscard]] float friction(EntityId id) const { return m_friction[id.index()]; }
    [[nodiscard]] float drag(EntityId id) const { return m_drag[id.index()]; }
    [[nodiscard]] float gravity_scale(EntityId id) const { return m_gravity_scale[id.index()]; }
    [[nodiscard]] EntityFlags entity_flags(EntityId id) const { return m_flags[id.index()]; }
    [[nodiscard]] CollisionLayer group(EntityId id) const { return m_group[id.index()]; }
    [[nodiscard]] CollisionLayer mask(EntityId id) const { return m_mask[id.index()]; }

    [[nodiscard]] bool is_static(EntityId id) const { return m_inverse_mass[id.index()] == 0.0f; }
    [[nodiscard]] bool has_flag(EntityId id, EntityFlags flag) const { return (m_flags[id.index()] & flag) != 0; }

    /// World-space box derived from position and half-extents
    [[nodiscard]] AABB aabb(EntityId id) const {
        return AABB::from_center_half_extents(m_position[id.index()], m_half_extents[id.index()]);
    }

    /// Sets position without touching the interpolation history
    void set_position(EntityId id, const Vec3& position) { m_position[id.index()] = position; }

    /// Sets position and previous position so interpolation does not smear
    void teleport(EntityId id, const Vec3& position);

    /// Ignored for static bodies
    void set_velocity(EntityId id, const Vec3& velocity);

    /// Accumulated until the integrator consumes it; ignored for static bodies
    void add_force(EntityId id, const Vec3& force);

    /// Instant velocity change of impulse * inverse_mass
    void apply_impulse(EntityId id, const Vec3& impulse);

    /// Mass <= 0 or non-finite makes the body static and zeroes its velocity
    void set_mass(EntityId id, float mass);

    void set_half_extents(EntityId id, const Vec3& half_extents) { m_half_extents[id.index()] = half_extents; }
    void set_restitution(EntityId id, float restitution) { m_restitution[id.index()] = restitution; }
    void set_friction(EntityId id, float friction) { m_friction[id.index()] = friction; }
    void set_drag(EntityId id, float drag) { m_drag[id.index()] = drag; }
    void set_gravity_scale(EntityId id, float scale) { m_gravity_scale[id.index()] = scale; }
    void set_collision_filter(EntityId id, CollisionLayer group, CollisionLayer mask);

    void set_flags(EntityId id, EntityFlags value) { m_flags[id.index()] = value; }
    void set_flag(EntityId id, EntityFlags flag, bool on);

    // =========================================================================
    // Column access
    // =========================================================================

    [[nodiscard]] std::span<Vec3> positions() noexcept { return m_position; }
    [[nodiscard]] std::span<const Vec3> positions() const noexcept { return m_position; }
    [[nodiscard]] std::span<Vec3> previous_positions() noexcept { return m_previous_position; }
    [[nodiscard]] std::span<const Vec3> previous_positions() const noexcept { return m_previous_position; }
    [[nodiscard]] std::span<Vec3> velocities() noexcept { return m_velocity; }
    [[nodiscard]] std::span<const Vec3> velocities() const noexcept { return m_velocity; }
    [[nodiscard]] std::span<Vec3> forces() noexcept { return m_force; }
    [[nodiscard]] std::span<const Vec3> half_extents() const noexcept { return m_half_extents; }
    [[nodiscard]] std::span<const float> inverse_masses() const noexcept { return m_inverse_mass; }
    [[nodiscard]] std::span<const float> restitutions() const noexcept { return m_restitution; }
    [[nodiscard]] std::span<const float> frictions() const noexcept { return m_friction; }
    [[nodiscard]] std::span<const float> drags() const noexcept { return m_drag; }
    [[nodiscard]] std::span<const float> gravity_scales() const noexcept { return m_gravity_scale; }
    [[nodiscard]] std::span<EntityFlags> flags_column() noexcept { return m_flags; }
    [[nodiscard]] std::span<const EntityFlags> flags_column() const noexcept { return m_flags; }
    [[nodiscard]] std::span<const CollisionLayer> groups() const noexcept { return m_group; }
    [[nodiscard]] std::span<const CollisionLayer> masks() const noexcept { return m_mask; }

    /// Copy current positions into the interpolation history
    void save_previous_positions();

    [[nodiscard]] std::size_t static_count() const noexcept;

private:
    template<typename F>
    void for_each_column(F&& func);

    std::size_t m_max_entities;
    std::atomic<std::uint32_t> m_dropped{0};

    std::vector<Vec3> m_position;
    std::vector<Vec3> m_previous_position;
    std::vector<Vec3> m_velocity;
    std::vector<Vec3> m_force;
    std::vector<Vec3> m_half_extents;
    std::vector<float> m_mass;
    std::vector<float> m_inverse_mass;
    std::vector<float> m_restitution;
    std::vector<float> m_friction;
    std::vector<float> m_drag;
    std::vector<float> m_gravity_scale;
    std::vector<EntityFlags> m_flags;
    std::vector<CollisionLayer> m_group;
    std::vector<CollisionLayer> m_mask;
};

} // namespace voxel_physics
