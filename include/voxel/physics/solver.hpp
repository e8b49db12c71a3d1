/// @file solver.hpp
/// @brief Parallel contact solver
///
/// One step() runs, in order and with a barrier between phases:
///   1. AABB refresh per entity (degenerate entities are excluded)
///   2. spatial hash rebuild
///   3. broad phase per occupied cell into worker-local pair lists, merged
///   4. narrow phase per pair into that pair's manifold slot
///   5. contact colouring, then `iterations` velocity passes and one
///      positional pass, each colour group in parallel

#pragma once

#include "collision_buffer.hpp"
#include "config.hpp"
#include "contact_graph.hpp"
#include "entity_store.hpp"
#include "spatial_hash.hpp"
#include "types.hpp"
#include "worker_pool.hpp"

#include <voxel/core/error.hpp>
#include <voxel/core/log.hpp>

#include <memory>
#include <vector>

namespace voxel_physics {

class ParallelSolver {
    struct ConstructKey {
        explicit ConstructKey() = default;
    };

public:
    /// Validates both configurations. `pool` must outlive the solver.
    [[nodiscard]] static voxel_core::Result<std::unique_ptr<ParallelSolver>> create(
        const SolverConfig& config,
        const SpatialHashConfig& hash_config,
        WorkerPool& pool);

    /// Use create(); the key keeps construction behind validation
    ParallelSolver(ConstructKey, const SolverConfig& config, SpatialHash hash, WorkerPool& pool);

    ParallelSolver(const ParallelSolver&) = delete;
    ParallelSolver& operator=(const ParallelSolver&) = delete;

    /// Detect and resolve contacts for the current positions. Counters in
    /// `stats` are overwritten; dropped items and timings are accumulated.
    void step(EntityStore& store, PhysicsStats& stats);

    // =========================================================================
    // Inspection
    // =========================================================================

    [[nodiscard]] const SolverConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const SpatialHash& spatial_hash() const noexcept { return m_hash; }
    [[nodiscard]] const CollisionBuffer& collision_buffer() const noexcept { return m_buffer; }
    [[nodiscard]] const ColorGroups& color_groups() const noexcept { return m_groups; }

    /// Re-arm warnings that are logged once per occurrence class
    void reset_warnings() { m_throttle.reset(); }

private:
    std::uint32_t refresh_aabbs(EntityStore& store);
    void rebuild_hash(const EntityStore& store);
    void broad_phase(const EntityStore& store);
    void narrow_phase(const EntityStore& store);
    void resolve(EntityStore& store);

    void resolve_velocity(EntityStore& store, const ContactManifold& manifold) const;
    void correct_position(EntityStore& store, const ContactManifold& manifold) const;

    template<typename F>
    void for_each_group(F&& func);

    void report_overflow();

    SolverConfig m_config;
    WorkerPool& m_pool;
    SpatialHash m_hash;
    CollisionBuffer m_buffer;
    ContactColoring m_coloring;
    ColorGroups m_groups;

    std::vector<AABB> m_aabbs;
    std::vector<std::vector<CandidatePair>> m_chunk_pairs;
    /// Non-empty manifold indices, used by sequential resolution
    std::vector<std::uint32_t> m_sequential;

    voxel_core::LogThrottle m_throttle;
};

} // namespace voxel_physics
