/// @file physics_world.cpp
/// @brief PhysicsWorld implementation

#include <voxel/physics/physics_world.hpp>

#include <algorithm>

namespace voxel_physics {

// =============================================================================
// Construction
// =============================================================================

voxel_core::Result<std::unique_ptr<PhysicsWorld>> PhysicsWorld::create(const PhysicsConfig& config) {
    if (auto valid = config.validate(); !valid) {
        voxel_core::debug::record_error(valid.error());
        voxel_core::physics_logger()->error("Rejected physics config: {}",
            voxel_core::build_error_chain(valid.error()));
        return valid.error();
    }

    auto pool = std::make_unique<WorkerPool>(WorkerPool::resolve_thread_count(config.solver.worker_threads));

    auto solver = ParallelSolver::create(config.solver, config.spatial_hash, *pool);
    if (!solver) {
        return solver.error();
    }

    auto integrator = Integrator::create(config.integrator, config.terrain, *pool);
    if (!integrator) {
        return integrator.error();
    }

    return std::make_unique<PhysicsWorld>(ConstructKey{},
        config, std::move(pool), std::move(*solver), std::move(*integrator));
}

PhysicsWorld::PhysicsWorld(ConstructKey,
                           const PhysicsConfig& config,
                           std::unique_ptr<WorkerPool> pool,
                           std::unique_ptr<ParallelSolver> solver,
                           Integrator integrator)
    : m_config(config)
    , m_pool(std::move(pool))
    , m_store(config.max_entities)
    , m_solver(std::move(solver))
    , m_integrator(std::move(integrator))
{
    voxel_core::physics_logger()->info(
        "Physics world created: {} max entities, {} workers, cell size {}, {} substeps x {} iterations",
        config.max_entities, m_pool->thread_count(), config.spatial_hash.cell_size,
        config.integrator.substeps, config.solver.iterations);
}

PhysicsWorld::~PhysicsWorld() {
    voxel_core::physics_logger()->debug("Physics world destroyed with {} entities", m_store.size());
}

// =============================================================================
// Entities
// =============================================================================

voxel_core::Result<EntityId> PhysicsWorld::add_entity(
    const Vec3& position, const Vec3& velocity, float mass, const Vec3& half_extents)
{
    EntityDesc desc;
    desc.position = position;
    desc.velocity = velocity;
    desc.mass = mass;
    desc.half_extents = half_extents;
    desc.restitution = m_config.solver.default_restitution;
    desc.friction = m_config.solver.default_friction;
    return add_entity(desc);
}

voxel_core::Result<EntityId> PhysicsWorld::add_entity(const EntityDesc& desc) {
    auto id = m_store.add_entity(desc);
    if (!id) {
        voxel_core::debug::record_error(id.error());
        if (m_throttle.first_occurrence("capacity.entities")) {
            voxel_core::physics_logger()->warn("{}", voxel_core::build_error_chain(id.error()));
        }
    }
    return id;
}

voxel_core::Result<EntityId> PhysicsWorld::remove_entity(EntityId id) {
    auto moved = m_store.remove_entity(id);
    if (!moved) {
        return moved;
    }

    voxel_core::physics_logger()->trace("Removed entity {} ({} moved into its slot)",
        id.value, moved->is_valid() ? static_cast<std::int64_t>(moved->value) : -1);

    // Pending ids must keep naming the same entities after the swap.
    std::erase(m_pending_removals, id);
    if (moved->is_valid()) {
        std::replace(m_pending_removals.begin(), m_pending_removals.end(), *moved, id);
    }
    return moved;
}

void PhysicsWorld::queue_removal(EntityId id) {
    m_pending_removals.push_back(id);
}

void PhysicsWorld::flush_removals() {
    if (m_pending_removals.empty()) {
        return;
    }

    // Descending order: the entity swapped in always comes from above every
    // id still pending, so pending ids never move.
    std::sort(m_pending_removals.begin(), m_pending_removals.end(), std::greater<>());
    m_pending_removals.erase(std::unique(m_pending_removals.begin(), m_pending_removals.end()),
                             m_pending_removals.end());

    for (EntityId id : m_pending_removals) {
        auto moved = m_store.remove_entity(id);
        if (!moved) {
            voxel_core::physics_logger()->warn("Deferred removal skipped: {}",
                voxel_core::build_error_chain(moved.error()));
            continue;
        }
        if (m_remap_callback) {
            m_remap_callback(id, *moved, moved->is_valid() ? id : EntityId::invalid());
        }
    }
    m_pending_removals.clear();
}

// =============================================================================
// Manipulation
// =============================================================================

voxel_core::Result<void> PhysicsWorld::check(EntityId id) const {
    if (!id.is_valid()) {
        return voxel_core::Error(voxel_core::EntityError::invalid());
    }
    if (!m_store.contains(id)) {
        return voxel_core::Error(voxel_core::EntityError::out_of_range(id.value, m_store.size()));
    }
    return voxel_core::Ok();
}

voxel_core::Result<void> PhysicsWorld::apply_force(EntityId id, const Vec3& force) {
    if (auto r = check(id); !r) return r;
    m_store.add_force(id, force);
    return voxel_core::Ok();
}

voxel_core::Result<void> PhysicsWorld::apply_impulse(EntityId id, const Vec3& impulse) {
    if (auto r = check(id); !r) return r;
    m_store.apply_impulse(id, impulse);
    return voxel_core::Ok();
}

voxel_core::Result<void> PhysicsWorld::set_velocity(EntityId id, const Vec3& velocity) {
    if (auto r = check(id); !r) return r;
    m_store.set_velocity(id, velocity);
    return voxel_core::Ok();
}

voxel_core::Result<void> PhysicsWorld::teleport(EntityId id, const Vec3& position) {
    if (auto r = check(id); !r) return r;
    m_store.teleport(id, position);
    return voxel_core::Ok();
}

// =============================================================================
// Stepping
// =============================================================================

void PhysicsWorld::begin_tick() {
    const std::uint32_t dropped = m_store.dropped_count();
    m_store.reset_dropped_count();

    m_stats = PhysicsStats{};
    m_stats.dropped_entities = dropped;
}

void PhysicsWorld::end_tick() {
    flush_removals();

    m_stats.entity_count = static_cast<std::uint32_t>(m_store.size());
    m_stats.static_entities = static_cast<std::uint32_t>(m_store.static_count());
    m_stats.dynamic_entities = m_stats.entity_count - m_stats.static_entities;

    std::uint32_t grounded = 0;
    for (EntityFlags f : m_store.flags_column()) {
        if ((f & flags::Grounded) != 0) ++grounded;
    }
    m_stats.grounded_entities = grounded;

    m_stats.step_time_ms = m_stats.broadphase_time_ms + m_stats.narrowphase_time_ms
                         + m_stats.solver_time_ms + m_stats.integration_time_ms;

    if (m_stats.dropped_entities + m_stats.dropped_pairs + m_stats.dropped_contacts > 0) {
        voxel_core::physics_logger()->debug("Tick dropped {} entities, {} pairs, {} contacts",
            m_stats.dropped_entities, m_stats.dropped_pairs, m_stats.dropped_contacts);
    }
}

std::uint32_t PhysicsWorld::tick(float frame_time, const BlockLookup* world) {
    begin_tick();
    const std::uint32_t steps = m_integrator.advance(frame_time, m_store, *m_solver, world, m_stats);
    end_tick();
    return steps;
}

void PhysicsWorld::step_fixed(const BlockLookup* world) {
    begin_tick();
    m_integrator.step(m_store, *m_solver, world, m_stats);
    m_stats.fixed_steps = 1;
    end_tick();
}

} // namespace voxel_physics
