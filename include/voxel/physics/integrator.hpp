/// @file integrator.hpp
/// @brief Fixed-timestep semi-implicit Euler integrator with voxel terrain sweep

#pragma once

#include "config.hpp"
#include "entity_store.hpp"
#include "types.hpp"
#include "worker_pool.hpp"
#include "world_query.hpp"

#include <voxel/core/error.hpp>

#include <cstdint>

namespace voxel_physics {

class ParallelSolver;

/// Advances entities in fixed steps, each split into substeps.
///
/// Per substep the solver runs first, then every dynamic entity gets, in
/// order: gravity (off on ladders), drag, water damping, ladder drift
/// removal, terminal velocity clamp, small-velocity zeroing, accumulated
/// force, and finally `position += velocity * dt`. The new box is then swept
/// against solid blocks one axis at a time (X, Y, Z); a blocked axis is
/// clamped to the block face and its velocity zeroed. A box pressed slightly
/// into the ground by contact correction is lifted back onto it first.
class Integrator {
public:
    [[nodiscard]] static voxel_core::Result<Integrator> create(
        const IntegratorConfig& config,
        const TerrainConfig& terrain,
        WorkerPool& pool);

    // =========================================================================
    // Stepping
    // =========================================================================

    /// Accumulate `frame_time` (clamped to max_frame_time) and run as many
    /// fixed steps as fit. Returns the number of fixed steps taken.
    std::uint32_t advance(float frame_time, EntityStore& store, ParallelSolver& solver,
                          const BlockLookup* world, PhysicsStats& stats);

    /// One fixed step: save previous positions, then run all substeps
    void step(EntityStore& store, ParallelSolver& solver, const BlockLookup* world, PhysicsStats& stats);

    /// Integrate every dynamic entity over `dt` without running the solver
    void integrate(EntityStore& store, float dt, const BlockLookup* world);

    // =========================================================================
    // Interpolation
    // =========================================================================

    /// Leftover accumulator as a fraction of the fixed timestep, in [0, 1)
    [[nodiscard]] float alpha() const noexcept { return m_accumulator / m_config.fixed_timestep; }

    [[nodiscard]] float accumulator() const noexcept { return m_accumulator; }
    void reset_accumulator() noexcept { m_accumulator = 0.0f; }

    [[nodiscard]] static Vec3 interpolate(const Vec3& previous, const Vec3& current, float alpha) noexcept {
        return previous + (current - previous) * alpha;
    }

    [[nodiscard]] static Vec3 interpolated_position(const EntityStore& store, EntityId id, float alpha) {
        return interpolate(store.previous_position(id), store.position(id), alpha);
    }

    [[nodiscard]] const IntegratorConfig& config() const noexcept { return m_config; }
    [[nodiscard]] float substep_dt() const noexcept {
        return m_config.fixed_timestep / static_cast<float>(m_config.substeps);
    }

private:
    Integrator(const IntegratorConfig& config, const TerrainConfig& terrain, WorkerPool& pool);

    void integrate_entity(EntityStore& store, std::size_t index, float dt, const BlockLookup* world) const;

    /// Move along one axis, stopping at solid blocks. Returns true if blocked.
    bool sweep_axis(Vec3& position, Vec3& velocity, const Vec3& half_extents,
                    int axis, float delta, const BlockLookup& world) const;

    /// Push a box sunk slightly into solid ground back onto the block face.
    /// Returns true if it was lifted.
    bool lift_out_of_ground(Vec3& position, Vec3& velocity, const Vec3& half_extents,
                            const BlockLookup& world) const;

    [[nodiscard]] EntityFlags environment_flags(const AABB& box, const BlockLookup& world) const;

    [[nodiscard]] bool is_solid(const BlockLookup& world, const IVec3& cell) const {
        return classify_block(world(cell), m_terrain) == BlockClass::Solid;
    }

    IntegratorConfig m_config;
    TerrainConfig m_terrain;
    WorkerPool* m_pool;
    float m_accumulator = 0.0f;
};

} // namespace voxel_physics
