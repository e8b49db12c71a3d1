/// @file physics_world.hpp
/// @brief Owning facade over the entity store, solver and integrator

#pragma once

#include "config.hpp"
#include "entity_store.hpp"
#include "integrator.hpp"
#include "solver.hpp"
#include "spatial_hash.hpp"
#include "types.hpp"
#include "worker_pool.hpp"
#include "world_query.hpp"

#include <voxel/core/error.hpp>
#include <voxel/core/log.hpp>

#include <functional>
#include <memory>
#include <vector>

namespace voxel_physics {

/// Physics world: one worker pool, one entity store, one solver, one integrator.
///
/// Entity ids are dense indices. remove_entity() swaps the last entity into
/// the freed slot immediately; queue_removal() defers that to the end of the
/// next tick and reports every move through the remap callback.
class PhysicsWorld {
    struct ConstructKey {
        explicit ConstructKey() = default;
    };

public:
    /// (removed, moved_from, moved_to). moved_from is invalid when nothing moved.
    using RemapCallback = std::function<void(EntityId, EntityId, EntityId)>;

    [[nodiscard]] static voxel_core::Result<std::unique_ptr<PhysicsWorld>> create(const PhysicsConfig& config);

    /// Use create(); the key keeps construction behind validation
    PhysicsWorld(ConstructKey,
                 const PhysicsConfig& config,
                 std::unique_ptr<WorkerPool> pool,
                 std::unique_ptr<ParallelSolver> solver,
                 Integrator integrator);

    ~PhysicsWorld();

    PhysicsWorld(const PhysicsWorld&) = delete;
    PhysicsWorld& operator=(const PhysicsWorld&) = delete;

    // =========================================================================
    // Entities
    // =========================================================================

    /// Add a box with the configured default restitution and friction
    [[nodiscard]] voxel_core::Result<EntityId> add_entity(
        const Vec3& position, const Vec3& velocity, float mass, const Vec3& half_extents);

    [[nodiscard]] voxel_core::Result<EntityId> add_entity(const EntityDesc& desc);

    /// Immediate swap-remove; returns the former id of the entity now at `id`
    [[nodiscard]] voxel_core::Result<EntityId> remove_entity(EntityId id);

    /// Defer removal to the end of the next tick
    void queue_removal(EntityId id);

    /// Apply queued removals now, highest id first
    void flush_removals();

    void set_remap_callback(RemapCallback callback) { m_remap_callback = std::move(callback); }

    [[nodiscard]] std::size_t entity_count() const noexcept { return m_store.size(); }

    // =========================================================================
    // Manipulation
    // =========================================================================

    /// Force accumulated until the next substep
    voxel_core::Result<void> apply_force(EntityId id, const Vec3& force);
    voxel_core::Result<void> apply_impulse(EntityId id, const Vec3& impulse);
    voxel_core::Result<void> set_velocity(EntityId id, const Vec3& velocity);
    /// Move without interpolating from the old position
    voxel_core::Result<void> teleport(EntityId id, const Vec3& position);

    // =========================================================================
    // Stepping
    // =========================================================================

    /// Advance by a frame's wall time. Returns the number of fixed steps run.
    std::uint32_t tick(float frame_time, const BlockLookup* world = nullptr);

    /// Run exactly one fixed step, bypassing the accumulator
    void step_fixed(const BlockLookup* world = nullptr);

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] Vec3 interpolated_position(EntityId id, float alpha) const {
        return Integrator::interpolated_position(m_store, id, alpha);
    }

    /// Interpolated at the integrator's current alpha
    [[nodiscard]] Vec3 interpolated_position(EntityId id) const {
        return interpolated_position(id, m_integrator.alpha());
    }

    [[nodiscard]] const Vec3& position(EntityId id) const { return m_store.position(id); }
    [[nodiscard]] const Vec3& velocity(EntityId id) const { return m_store.velocity(id); }
    [[nodiscard]] EntityFlags entity_flags(EntityId id) const { return m_store.entity_flags(id); }

    [[nodiscard]] float alpha() const noexcept { return m_integrator.alpha(); }
    [[nodiscard]] const PhysicsStats& stats() const noexcept { return m_stats; }
    [[nodiscard]] SpatialHashStats spatial_hash_stats() const { return m_solver->spatial_hash().stats(); }
    [[nodiscard]] const PhysicsConfig& config() const noexcept { return m_config; }

    [[nodiscard]] EntityStore& entities() noexcept { return m_store; }
    [[nodiscard]] const EntityStore& entities() const noexcept { return m_store; }
    [[nodiscard]] const ParallelSolver& solver() const noexcept { return *m_solver; }

private:
    [[nodiscard]] voxel_core::Result<void> check(EntityId id) const;
    void begin_tick();
    void end_tick();

    PhysicsConfig m_config;
    std::unique_ptr<WorkerPool> m_pool;
    EntityStore m_store;
    std::unique_ptr<ParallelSolver> m_solver;
    Integrator m_integrator;

    std::vector<EntityId> m_pending_removals;
    RemapCallback m_remap_callback;

    PhysicsStats m_stats;
    voxel_core::LogThrottle m_throttle;
};

} // namespace voxel_physics
