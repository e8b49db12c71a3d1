/// @file spatial_hash.hpp
/// @brief Uniform grid broad phase
///
/// Cells are cubes of `cell_size` laid out from `world_min`. An AABB is
/// inserted into every cell it touches. Coordinates outside the world bounds
/// clamp to the edge cells, so nothing at the border is ever dropped.
/// The hash is rebuilt each tick; bucket storage is kept across clear().

#pragma once

#include "config.hpp"
#include "types.hpp"

#include <voxel/core/error.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <unordered_map>
#include <vector>

namespace voxel_physics {

/// Occupancy statistics
struct SpatialHashStats {
    std::size_t occupied_cells = 0;
    std::size_t total_entries = 0;
    std::size_t max_entities_per_cell = 0;
    float avg_entities_per_cell = 0.0f;
};

class SpatialHash {
public:
    /// Validates the configuration; invalid cell size or bounds are rejected
    [[nodiscard]] static voxel_core::Result<SpatialHash> create(const SpatialHashConfig& config);

    // =========================================================================
    // Mutation
    // =========================================================================

    /// Drop all entries; bucket capacity is retained
    void clear();

    /// Add `entity` to every cell overlapped by `box`. Returns false for a
    /// non-finite or inverted box, which is not inserted.
    bool insert(EntityId entity, const AABB& box);

    /// Remove `entity` from the cells overlapped by `box`
    void remove(EntityId entity, const AABB& box);

    /// Move `entity` from the cells of `old_box` to the cells of `new_box`
    void update(EntityId entity, const AABB& old_box, const AABB& new_box);

    // =========================================================================
    // Queries
    // =========================================================================

    /// Distinct entities in all cells overlapped by `region`, ascending by id
    [[nodiscard]] std::vector<EntityId> query_region(const AABB& region) const;

    /// Same as above, reusing `out`
    void query_region(const AABB& region, std::vector<EntityId>& out) const;

    /// Cell coordinate of a world position, clamped to the grid
    [[nodiscard]] IVec3 world_to_cell(const Vec3& position) const noexcept;

    [[nodiscard]] IVec3 dimensions() const noexcept { return m_dims; }
    [[nodiscard]] const SpatialHashConfig& config() const noexcept { return m_config; }

    /// Number of bucket slots in use. Buckets may be empty after remove().
    [[nodiscard]] std::size_t bucket_count() const noexcept { return m_active_buckets; }

    /// Entities in the i-th bucket, in insertion order
    [[nodiscard]] std::span<const EntityId> bucket(std::size_t i) const noexcept {
        return m_buckets[i].entities;
    }

    [[nodiscard]] SpatialHashStats stats() const;

private:
    struct Bucket {
        std::uint64_t key = 0;
        std::vector<EntityId> entities;
    };

    explicit SpatialHash(const SpatialHashConfig& config);

    [[nodiscard]] std::uint64_t cell_key(const IVec3& cell) const noexcept;
    [[nodiscard]] IVec3 key_to_cell(std::uint64_t key) const noexcept;

    template<typename F>
    void for_each_cell(const AABB& box, F&& func) const;

    Bucket& bucket_for(std::uint64_t key);

    SpatialHashConfig m_config;
    IVec3 m_dims{1};
    float m_inv_cell_size = 1.0f;

    std::vector<Bucket> m_buckets;
    std::size_t m_active_buckets = 0;
    std::unordered_map<std::uint64_t, std::uint32_t> m_cell_index;
};

} // namespace voxel_physics
