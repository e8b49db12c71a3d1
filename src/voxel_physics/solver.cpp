/// @file solver.cpp
/// @brief ParallelSolver implementation

#include <voxel/physics/solver.hpp>
#include <voxel/physics/narrow_phase.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>

namespace voxel_physics {

namespace {

using Clock = std::chrono::high_resolution_clock;

float elapsed_ms(Clock::time_point start, Clock::time_point end) {
    return std::chrono::duration<float, std::milli>(end - start).count();
}

/// Degenerate geometry classes, reported once each
enum DegenerateBits : std::uint32_t {
    NonFinitePosition = 1u << 0,
    NonFiniteExtents  = 1u << 1,
    EmptyExtents      = 1u << 2,
};

std::uint32_t classify_degenerate(const Vec3& position, const Vec3& half_extents) {
    if (!voxel_math::is_finite(position)) return NonFinitePosition;
    if (!voxel_math::is_finite(half_extents)) return NonFiniteExtents;
    if (half_extents.x <= 0.0f || half_extents.y <= 0.0f || half_extents.z <= 0.0f) return EmptyExtents;
    return 0;
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

voxel_core::Result<std::unique_ptr<ParallelSolver>> ParallelSolver::create(
    const SolverConfig& config,
    const SpatialHashConfig& hash_config,
    WorkerPool& pool)
{
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    auto hash = SpatialHash::create(hash_config);
    if (!hash) {
        return hash.error();
    }
    return std::make_unique<ParallelSolver>(ConstructKey{}, config, std::move(*hash), pool);
}

ParallelSolver::ParallelSolver(ConstructKey, const SolverConfig& config, SpatialHash hash, WorkerPool& pool)
    : m_config(config)
    , m_pool(pool)
    , m_hash(std::move(hash))
    , m_buffer(config.max_pairs)
{
}

// =============================================================================
// Step
// =============================================================================

void ParallelSolver::step(EntityStore& store, PhysicsStats& stats) {
    m_buffer.clear();

    auto bp_start = Clock::now();
    stats.excluded_entities = refresh_aabbs(store);
    rebuild_hash(store);
    broad_phase(store);
    auto bp_end = Clock::now();

    narrow_phase(store);
    auto np_end = Clock::now();

    resolve(store);
    auto solve_end = Clock::now();

    stats.broadphase_pairs = static_cast<std::uint32_t>(m_buffer.pair_count());
    stats.contact_pairs = static_cast<std::uint32_t>(m_buffer.contact_pair_count());
    stats.contact_points = static_cast<std::uint32_t>(m_buffer.contact_point_count());
    stats.color_groups = static_cast<std::uint32_t>(m_groups.group_count());
    stats.dropped_pairs += m_buffer.dropped_pairs();
    stats.dropped_contacts += m_buffer.dropped_contacts();

    stats.broadphase_time_ms += elapsed_ms(bp_start, bp_end);
    stats.narrowphase_time_ms += elapsed_ms(bp_end, np_end);
    stats.solver_time_ms += elapsed_ms(np_end, solve_end);

    report_overflow();
}

// =============================================================================
// Phases
// =============================================================================

std::uint32_t ParallelSolver::refresh_aabbs(EntityStore& store) {
    const std::size_t count = store.size();
    m_aabbs.resize(count);

    std::atomic<std::uint32_t> excluded{0};
    std::atomic<std::uint32_t> classes{0};

    auto positions = store.positions();
    auto extents = store.half_extents();
    auto entity_flags = store.flags_column();

    m_pool.parallel_for(count, m_config.batch_size, [&](std::size_t, std::size_t begin, std::size_t end) {
        std::uint32_t local_excluded = 0;
        std::uint32_t local_classes = 0;
        for (std::size_t i = begin; i < end; ++i) {
            const std::uint32_t degenerate = classify_degenerate(positions[i], extents[i]);
            if (degenerate != 0) {
                entity_flags[i] |= flags::Excluded;
                local_classes |= degenerate;
                ++local_excluded;
                continue;
            }
            entity_flags[i] &= static_cast<EntityFlags>(~flags::Excluded);
            m_aabbs[i] = AABB::from_center_half_extents(positions[i], extents[i]);
        }
        excluded.fetch_add(local_excluded, std::memory_order_relaxed);
        classes.fetch_or(local_classes, std::memory_order_relaxed);
    });

    const std::uint32_t seen = classes.load();
    auto warn_once = [this](std::uint32_t bit, std::uint32_t mask, const char* key, const char* what) {
        if ((mask & bit) != 0 && m_throttle.first_occurrence(key)) {
            voxel_core::physics_logger()->warn("Excluding entities with {} from collision", what);
        }
    };
    warn_once(NonFinitePosition, seen, "degenerate.position", "non-finite position");
    warn_once(NonFiniteExtents, seen, "degenerate.extents", "non-finite half-extents");
    warn_once(EmptyExtents, seen, "degenerate.empty", "non-positive half-extents");

    return excluded.load();
}

void ParallelSolver::rebuild_hash(const EntityStore& store) {
    m_hash.clear();
    auto entity_flags = store.flags_column();
    for (std::size_t i = 0; i < store.size(); ++i) {
        if ((entity_flags[i] & flags::Excluded) == 0) {
            m_hash.insert(EntityId{static_cast<std::uint32_t>(i)}, m_aabbs[i]);
        }
    }
}

void ParallelSolver::broad_phase(const EntityStore& store) {
    const std::size_t buckets = m_hash.bucket_count();
    const std::size_t chunks = m_pool.chunk_count(buckets, m_config.batch_size);
    if (m_chunk_pairs.size() < chunks) {
        m_chunk_pairs.resize(chunks);
    }
    for (std::size_t c = 0; c < chunks; ++c) {
        m_chunk_pairs[c].clear();
    }

    auto inv_mass = store.inverse_masses();
    auto groups = store.groups();
    auto masks = store.masks();

    m_pool.parallel_for(buckets, m_config.batch_size, [&](std::size_t chunk, std::size_t begin, std::size_t end) {
        auto& out = m_chunk_pairs[chunk];
        for (std::size_t b = begin; b < end; ++b) {
            auto cell = m_hash.bucket(b);
            for (std::size_t i = 0; i < cell.size(); ++i) {
                const std::size_t ia = cell[i].index();
                for (std::size_t j = i + 1; j < cell.size(); ++j) {
                    const std::size_t ib = cell[j].index();
                    if (ia == ib) {
                        continue;
                    }
                    if (inv_mass[ia] == 0.0f && inv_mass[ib] == 0.0f) {
                        continue;
                    }
                    if (!can_collide(groups[ia], masks[ia], groups[ib], masks[ib])) {
                        continue;
                    }
                    if (!m_aabbs[ia].overlaps(m_aabbs[ib])) {
                        continue;
                    }
                    out.push_back(CandidatePair::make(cell[i], cell[j]));
                }
            }
        }
    });

    m_buffer.merge_pairs(std::span<std::vector<CandidatePair>>(m_chunk_pairs.data(), chunks));
}

void ParallelSolver::narrow_phase(const EntityStore& store) {
    m_buffer.prepare_manifolds();
    auto pairs = m_buffer.pairs();
    auto restitution = store.restitutions();
    auto friction = store.frictions();

    m_pool.parallel_for(pairs.size(), m_config.batch_size, [&](std::size_t, std::size_t begin, std::size_t end) {
        for (std::size_t i = begin; i < end; ++i) {
            const std::size_t a = pairs[i].a.index();
            const std::size_t b = pairs[i].b.index();
            auto contact = collide_aabb(m_aabbs[a], m_aabbs[b]);
            if (!contact) {
                continue;
            }
            m_buffer.push_contact(i, *contact);
            m_buffer.set_material(i,
                combine_restitution(restitution[a], restitution[b]),
                combine_friction(friction[a], friction[b]));
        }
    });
}

template<typename F>
void ParallelSolver::for_each_group(F&& func) {
    auto manifolds = m_buffer.manifolds();

    if (!m_config.parallel_resolution) {
        for (std::uint32_t index : m_sequential) {
            func(manifolds[index]);
        }
        return;
    }

    for (std::size_t g = 0; g < m_groups.group_count(); ++g) {
        auto group = m_groups.group(g);
        m_pool.parallel_for(group.size(), m_config.batch_size, [&](std::size_t, std::size_t begin, std::size_t end) {
            for (std::size_t k = begin; k < end; ++k) {
                func(manifolds[group[k]]);
            }
        });
    }
}

void ParallelSolver::resolve(EntityStore& store) {
    auto manifolds = m_buffer.manifolds();

    m_groups.clear();
    m_sequential.clear();
    if (m_config.parallel_resolution) {
        m_coloring.build(manifolds, store.inverse_masses(), m_groups);
    } else {
        for (std::size_t i = 0; i < manifolds.size(); ++i) {
            if (!manifolds[i].empty()) {
                m_sequential.push_back(static_cast<std::uint32_t>(i));
            }
        }
    }

    for (std::uint32_t iter = 0; iter < m_config.iterations; ++iter) {
        for_each_group([this, &store](const ContactManifold& m) { resolve_velocity(store, m); });
    }
    for_each_group([this, &store](const ContactManifold& m) { correct_position(store, m); });
}

// =============================================================================
// Contact response
// =============================================================================

void ParallelSolver::resolve_velocity(EntityStore& store, const ContactManifold& manifold) const {
    const EntityId a = manifold.pair.a;
    const EntityId b = manifold.pair.b;
    const float inv_a = store.inverse_mass(a);
    const float inv_b = store.inverse_mass(b);
    const float inv_sum = inv_a + inv_b;
    if (inv_sum <= 0.0f) {
        return;
    }

    auto velocities = store.velocities();
    Vec3& vel_a = velocities[a.index()];
    Vec3& vel_b = velocities[b.index()];

    for (const ContactPoint& contact : manifold.contacts()) {
        const Vec3& n = contact.normal;
        if (glm::length2(n) < voxel_math::consts::EPSILON) {
            continue;
        }

        // Normal from a to b; negative means approaching
        Vec3 relative = vel_b - vel_a;
        const float vn = glm::dot(relative, n);
        if (vn >= 0.0f) {
            continue;
        }

        const float e = -vn > m_config.restitution_threshold ? manifold.restitution : 0.0f;
        const float j = -(1.0f + e) * vn / inv_sum;
        const Vec3 impulse = n * j;
        if (inv_a > 0.0f) vel_a -= impulse * inv_a;
        if (inv_b > 0.0f) vel_b += impulse * inv_b;

        // Friction, clamped to the Coulomb cone
        relative = vel_b - vel_a;
        Vec3 tangent = relative - n * glm::dot(relative, n);
        const float tangent_len2 = glm::length2(tangent);
        if (tangent_len2 < voxel_math::consts::EPSILON) {
            continue;
        }
        tangent /= std::sqrt(tangent_len2);

        const float max_friction = manifold.friction * j;
        const float jt = std::clamp(-glm::dot(relative, tangent) / inv_sum, -max_friction, max_friction);
        const Vec3 friction_impulse = tangent * jt;
        if (inv_a > 0.0f) vel_a -= friction_impulse * inv_a;
        if (inv_b > 0.0f) vel_b += friction_impulse * inv_b;
    }
}

void ParallelSolver::correct_position(EntityStore& store, const ContactManifold& manifold) const {
    const EntityId a = manifold.pair.a;
    const EntityId b = manifold.pair.b;
    const float inv_a = store.inverse_mass(a);
    const float inv_b = store.inverse_mass(b);
    const float inv_sum = inv_a + inv_b;
    if (inv_sum <= 0.0f) {
        return;
    }

    auto positions = store.positions();

    for (const ContactPoint& contact : manifold.contacts()) {
        const float depth = contact.depth - m_config.penetration_slop;
        if (depth <= 0.0f || glm::length2(contact.normal) < voxel_math::consts::EPSILON) {
            continue;
        }
        const Vec3 correction = contact.normal * (depth * m_config.position_correction_rate / inv_sum);
        if (inv_a > 0.0f) positions[a.index()] -= correction * inv_a;
        if (inv_b > 0.0f) positions[b.index()] += correction * inv_b;
    }
}

void ParallelSolver::report_overflow() {
    if (m_buffer.dropped_pairs() > 0 && m_throttle.first_occurrence("overflow.pairs")) {
        voxel_core::Error err(voxel_core::CapacityError::pair_buffer_full(m_buffer.max_pairs()));
        err.with_context("dropped", std::to_string(m_buffer.dropped_pairs()));
        voxel_core::debug::record_error(err);
        voxel_core::physics_logger()->warn("{}", voxel_core::build_error_chain(err));
    }
    if (m_buffer.dropped_contacts() > 0 && m_throttle.first_occurrence("overflow.contacts")) {
        voxel_core::Error err(voxel_core::CapacityError::contact_buffer_full(k_max_contact_points));
        err.with_context("dropped", std::to_string(m_buffer.dropped_contacts()));
        voxel_core::debug::record_error(err);
        voxel_core::physics_logger()->warn("{}", voxel_core::build_error_chain(err));
    }
}

} // namespace voxel_physics
