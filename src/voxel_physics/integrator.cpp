/// @file integrator.cpp
/// @brief Integrator implementation

#include <voxel/physics/integrator.hpp>
#include <voxel/physics/solver.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>

namespace voxel_physics {

namespace {

constexpr std::size_t k_integrate_grain = 128;

/// Tolerance when deciding whether a block was already overlapped before a move
constexpr float k_face_tolerance = 1e-4f;

/// Deepest sink into the ground that is pushed back out instead of ignored
constexpr float k_max_ground_push = 0.25f;

/// Boxes beyond these limits move without the terrain sweep
constexpr float k_max_block_coord = 16777216.0f;
constexpr float k_max_swept_half_extent = 64.0f;

struct BlockRange {
    IVec3 lo;
    IVec3 hi;
};

int to_block(float v) {
    return static_cast<int>(std::clamp(v, -k_max_block_coord, k_max_block_coord));
}

/// Blocks whose unit cube overlaps `box` by more than the face tolerance
BlockRange blocks_overlapping(const AABB& box) {
    BlockRange r;
    for (int axis = 0; axis < 3; ++axis) {
        const float skin = std::min(k_face_tolerance, 0.5f * (box.max[axis] - box.min[axis]));
        r.lo[axis] = to_block(std::floor(box.min[axis] + skin));
        r.hi[axis] = to_block(std::ceil(box.max[axis] - skin)) - 1;
    }
    return r;
}

bool sweepable(const Vec3& position, const Vec3& half_extents) {
    for (int axis = 0; axis < 3; ++axis) {
        if (std::abs(position[axis]) > k_max_block_coord || half_extents[axis] > k_max_swept_half_extent) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

voxel_core::Result<Integrator> Integrator::create(
    const IntegratorConfig& config,
    const TerrainConfig& terrain,
    WorkerPool& pool)
{
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    if (auto valid = terrain.validate(); !valid) {
        return valid.error();
    }
    return Integrator(config, terrain, pool);
}

Integrator::Integrator(const IntegratorConfig& config, const TerrainConfig& terrain, WorkerPool& pool)
    : m_config(config)
    , m_terrain(terrain)
    , m_pool(&pool)
{
}

// =============================================================================
// Stepping
// =============================================================================

std::uint32_t Integrator::advance(float frame_time, EntityStore& store, ParallelSolver& solver,
                                  const BlockLookup* world, PhysicsStats& stats)
{
    if (!std::isfinite(frame_time) || frame_time < 0.0f) {
        frame_time = 0.0f;
    }
    m_accumulator += std::min(frame_time, m_config.max_frame_time);

    std::uint32_t steps = 0;
    while (m_accumulator >= m_config.fixed_timestep) {
        step(store, solver, world, stats);
        m_accumulator -= m_config.fixed_timestep;
        ++steps;
    }
    stats.fixed_steps = steps;
    return steps;
}

void Integrator::step(EntityStore& store, ParallelSolver& solver, const BlockLookup* world, PhysicsStats& stats) {
    store.save_previous_positions();

    const float dt = substep_dt();
    for (std::uint32_t s = 0; s < m_config.substeps; ++s) {
        solver.step(store, stats);

        auto int_start = std::chrono::high_resolution_clock::now();
        integrate(store, dt, world);
        auto int_end = std::chrono::high_resolution_clock::now();

        stats.integration_time_ms += std::chrono::duration<float, std::milli>(int_end - int_start).count();
        ++stats.substeps;
    }
}

void Integrator::integrate(EntityStore& store, float dt, const BlockLookup* world) {
    m_pool->parallel_for(store.size(), k_integrate_grain, [&](std::size_t, std::size_t begin, std::size_t end) {
        for (std::size_t i = begin; i < end; ++i) {
            integrate_entity(store, i, dt, world);
        }
    });
}

void Integrator::integrate_entity(EntityStore& store, std::size_t index, float dt, const BlockLookup* world) const {
    const EntityId id{static_cast<std::uint32_t>(index)};
    const EntityFlags current = store.entity_flags(id);
    const float inv_mass = store.inverse_mass(id);
    if (inv_mass == 0.0f) {
        return;
    }
    // Excluded boxes still fall; only non-finite state stops integration.
    if (!voxel_math::is_finite(store.position(id)) || !voxel_math::is_finite(store.velocity(id))) {
        return;
    }

    const bool on_ladder = (current & flags::OnLadder) != 0;
    const bool in_water = (current & flags::InWater) != 0;

    Vec3 velocity = store.velocity(id);

    if (!on_ladder) {
        velocity += m_config.gravity * (store.gravity_scale(id) * dt);
    }

    velocity *= std::max(0.0f, 1.0f - store.drag(id) * dt);

    if (in_water) {
        velocity.y *= m_config.water_damping;
        velocity.y = std::max(velocity.y, -m_config.water_max_fall_speed);
    }
    if (on_ladder && std::abs(velocity.y) < m_config.ladder_drift_threshold) {
        velocity.y = 0.0f;
    }

    velocity.y = std::max(velocity.y, -m_config.terminal_velocity);

    if (glm::length2(velocity) < m_config.velocity_epsilon * m_config.velocity_epsilon) {
        velocity = Vec3(0.0f);
    }

    auto forces = store.forces();
    velocity += forces[index] * (inv_mass * dt);
    forces[index] = Vec3(0.0f);

    Vec3 position = store.position(id);
    const Vec3& extents = store.half_extents(id);
    const Vec3 half = glm::max(extents, Vec3(0.0f));
    EntityFlags next = static_cast<EntityFlags>(current & ~flags::Environment);

    if (world != nullptr && voxel_math::is_finite(extents) && sweepable(position, half)) {
        if (lift_out_of_ground(position, velocity, half, *world)) {
            next |= flags::Grounded;
        }
        for (int axis = 0; axis < 3; ++axis) {
            const float delta = velocity[axis] * dt;
            const bool blocked = sweep_axis(position, velocity, half, axis, delta, *world);
            if (blocked && axis == 1 && delta < 0.0f) {
                next |= flags::Grounded;
            }
        }
        next |= environment_flags(AABB::from_center_half_extents(position, half), *world);
    } else {
        position += velocity * dt;
    }

    store.set_position(id, position);
    store.velocities()[index] = velocity;
    store.set_flags(id, next);
}

bool Integrator::sweep_axis(Vec3& position, Vec3& velocity, const Vec3& half_extents,
                            int axis, float delta, const BlockLookup& world) const
{
    if (delta == 0.0f) {
        return false;
    }

    const float old_min = position[axis] - half_extents[axis];
    const float old_max = position[axis] + half_extents[axis];

    Vec3 moved = position;
    moved[axis] += delta;
    const BlockRange range = blocks_overlapping(AABB::from_center_half_extents(moved, half_extents));

    // Nearest face in the direction of travel among blocks not already overlapped
    float limit = delta > 0.0f ? std::numeric_limits<float>::max() : std::numeric_limits<float>::lowest();
    bool hit = false;

    IVec3 cell;
    for (cell.z = range.lo.z; cell.z <= range.hi.z; ++cell.z) {
        for (cell.y = range.lo.y; cell.y <= range.hi.y; ++cell.y) {
            for (cell.x = range.lo.x; cell.x <= range.hi.x; ++cell.x) {
                const float near_face = static_cast<float>(cell[axis]);
                if (delta > 0.0f) {
                    if (near_face < old_max - k_face_tolerance || !is_solid(world, cell)) continue;
                    limit = std::min(limit, near_face);
                } else {
                    const float far_face = near_face + 1.0f;
                    if (far_face > old_min + k_face_tolerance || !is_solid(world, cell)) continue;
                    limit = std::max(limit, far_face);
                }
                hit = true;
            }
        }
    }

    if (hit) {
        moved[axis] = delta > 0.0f ? limit - half_extents[axis] : limit + half_extents[axis];
        velocity[axis] = 0.0f;
    }
    position = moved;
    return hit;
}

bool Integrator::lift_out_of_ground(Vec3& position, Vec3& velocity, const Vec3& half_extents,
                                    const BlockLookup& world) const
{
    // Contact correction against other bodies can press a resting box a
    // little way into the block below it; the sweep would then treat that
    // block as already overlapped and let the box sink.
    const float bottom = position.y - half_extents.y;
    const float face = std::ceil(bottom);
    const float depth = face - bottom;
    if (depth <= k_face_tolerance || depth > k_max_ground_push) {
        return false;
    }

    const BlockRange range = blocks_overlapping(AABB::from_center_half_extents(position, half_extents));
    IVec3 cell;
    cell.y = static_cast<int>(face) - 1;

    bool supported = false;
    for (cell.z = range.lo.z; cell.z <= range.hi.z && !supported; ++cell.z) {
        for (cell.x = range.lo.x; cell.x <= range.hi.x; ++cell.x) {
            if (is_solid(world, cell)) {
                supported = true;
                break;
            }
        }
    }
    if (!supported) {
        return false;
    }

    position.y = face + half_extents.y;
    velocity.y = std::max(velocity.y, 0.0f);
    return true;
}

EntityFlags Integrator::environment_flags(const AABB& box, const BlockLookup& world) const {
    EntityFlags result = flags::None;
    const BlockRange range = blocks_overlapping(box);

    IVec3 cell;
    for (cell.z = range.lo.z; cell.z <= range.hi.z; ++cell.z) {
        for (cell.y = range.lo.y; cell.y <= range.hi.y; ++cell.y) {
            for (cell.x = range.lo.x; cell.x <= range.hi.x; ++cell.x) {
                switch (classify_block(world(cell), m_terrain)) {
                    case BlockClass::Water: result |= flags::InWater; break;
                    case BlockClass::Ladder: result |= flags::OnLadder; break;
                    default: break;
                }
            }
        }
    }
    return result;
}

} // namespace voxel_physics
