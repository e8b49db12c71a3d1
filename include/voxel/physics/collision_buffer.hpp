/// @file collision_buffer.hpp
/// @brief Per-tick candidate pairs and contact manifolds

#pragma once

#include "types.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>
#include <unordered_set>
#include <vector>

namespace voxel_physics {

/// Points kept per manifold; extra points are dropped
inline constexpr std::size_t k_max_contact_points = 4;

/// Contacts between one candidate pair
struct ContactManifold {
    CandidatePair pair;
    std::array<ContactPoint, k_max_contact_points> points{};
    std::uint32_t point_count = 0;
    float restitution = 0.0f;
    float friction = 0.0f;

    [[nodiscard]] bool empty() const noexcept { return point_count == 0; }

    [[nodiscard]] std::span<const ContactPoint> contacts() const noexcept {
        return {points.data(), point_count};
    }
};

/// Transient storage rebuilt every tick. clear() keeps allocations.
///
/// Pairs arrive either one at a time through push_pair() (deduplicated with a
/// per-tick seen set) or in bulk from worker-local buffers through
/// merge_pairs() (sorted and deduplicated once). Once pairs are final,
/// prepare_manifolds() allocates one manifold per pair; push_contact() may
/// then be called concurrently for distinct pair indices.
class CollisionBuffer {
public:
    explicit CollisionBuffer(std::size_t max_pairs = 1u << 20);

    CollisionBuffer(const CollisionBuffer&) = delete;
    CollisionBuffer& operator=(const CollisionBuffer&) = delete;

    void clear();

    // =========================================================================
    // Pairs
    // =========================================================================

    /// Append the canonical pair unless already present this tick.
    /// Returns false for duplicates, self pairs, and pairs over capacity.
    bool push_pair(EntityId a, EntityId b);

    /// Append worker-local pair lists, then sort and deduplicate everything.
    /// Pairs beyond capacity are dropped from the end and counted.
    void merge_pairs(std::span<std::vector<CandidatePair>> chunks);

    [[nodiscard]] std::span<const CandidatePair> pairs() const noexcept { return m_pairs; }
    [[nodiscard]] std::size_t pair_count() const noexcept { return m_pairs.size(); }
    [[nodiscard]] std::size_t max_pairs() const noexcept { return m_max_pairs; }

    // =========================================================================
    // Manifolds
    // =========================================================================

    /// One empty manifold per pair, in pair order
    void prepare_manifolds();

    /// Add a point to the manifold of `pair_index`. Returns false and counts
    /// the drop when the manifold already holds k_max_contact_points.
    bool push_contact(std::size_t pair_index, const ContactPoint& point);

    void set_material(std::size_t pair_index, float restitution, float friction);

    [[nodiscard]] std::span<ContactManifold> manifolds() noexcept {
        return {m_manifolds.data(), m_manifold_count};
    }
    [[nodiscard]] std::span<const ContactManifold> manifolds() const noexcept {
        return {m_manifolds.data(), m_manifold_count};
    }

    /// Manifolds holding at least one point
    [[nodiscard]] std::size_t contact_pair_count() const noexcept;
    [[nodiscard]] std::size_t contact_point_count() const noexcept;

    // =========================================================================
    // Overflow counters (reset by clear)
    // =========================================================================

    [[nodiscard]] std::uint32_t dropped_pairs() const noexcept { return m_dropped_pairs; }
    [[nodiscard]] std::uint32_t dropped_contacts() const noexcept {
        return m_dropped_contacts.load(std::memory_order_relaxed);
    }

private:
    std::size_t m_max_pairs;
    std::vector<CandidatePair> m_pairs;
    std::unordered_set<std::uint64_t> m_seen;
    bool m_seen_valid = true;
    std::vector<ContactManifold> m_manifolds;
    std::size_t m_manifold_count = 0;

    std::uint32_t m_dropped_pairs = 0;
    std::atomic<std::uint32_t> m_dropped_contacts{0};
};

} // namespace voxel_physics
