/// @file spatial_hash.cpp
/// @brief SpatialHash implementation

#include <voxel/physics/spatial_hash.hpp>

#include <algorithm>
#include <cmath>

namespace voxel_physics {

namespace {

int cells_along(float extent, float cell_size) {
    return std::max(1, static_cast<int>(std::ceil(extent / cell_size)));
}

} // anonymous namespace

voxel_core::Result<SpatialHash> SpatialHash::create(const SpatialHashConfig& config) {
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    return SpatialHash(config);
}

SpatialHash::SpatialHash(const SpatialHashConfig& config)
    : m_config(config)
    , m_inv_cell_size(1.0f / config.cell_size)
{
    const Vec3 extent = config.world_max - config.world_min;
    m_dims = IVec3(cells_along(extent.x, config.cell_size),
                   cells_along(extent.y, config.cell_size),
                   cells_along(extent.z, config.cell_size));
    m_cell_index.reserve(256);
}

// =============================================================================
// Cell math
// =============================================================================

IVec3 SpatialHash::world_to_cell(const Vec3& position) const noexcept {
    const Vec3 local = (position - m_config.world_min) * m_inv_cell_size;
    IVec3 cell(0);
    for (int axis = 0; axis < 3; ++axis) {
        const float f = std::floor(local[axis]);
        if (!(f > 0.0f)) {
            cell[axis] = 0;
        } else if (f >= static_cast<float>(m_dims[axis] - 1)) {
            cell[axis] = m_dims[axis] - 1;
        } else {
            cell[axis] = static_cast<int>(f);
        }
    }
    return cell;
}

std::uint64_t SpatialHash::cell_key(const IVec3& cell) const noexcept {
    return static_cast<std::uint64_t>(cell.x)
         + static_cast<std::uint64_t>(m_dims.x) * (static_cast<std::uint64_t>(cell.y)
         + static_cast<std::uint64_t>(m_dims.y) * static_cast<std::uint64_t>(cell.z));
}

IVec3 SpatialHash::key_to_cell(std::uint64_t key) const noexcept {
    const auto dx = static_cast<std::uint64_t>(m_dims.x);
    const auto dy = static_cast<std::uint64_t>(m_dims.y);
    return IVec3(static_cast<int>(key % dx),
                 static_cast<int>((key / dx) % dy),
                 static_cast<int>(key / (dx * dy)));
}

template<typename F>
void SpatialHash::for_each_cell(const AABB& box, F&& func) const {
    const IVec3 lo = world_to_cell(box.min);
    const IVec3 hi = world_to_cell(box.max);
    for (int z = lo.z; z <= hi.z; ++z) {
        for (int y = lo.y; y <= hi.y; ++y) {
            for (int x = lo.x; x <= hi.x; ++x) {
                func(cell_key(IVec3(x, y, z)));
            }
        }
    }
}

SpatialHash::Bucket& SpatialHash::bucket_for(std::uint64_t key) {
    auto it = m_cell_index.find(key);
    if (it != m_cell_index.end()) {
        return m_buckets[it->second];
    }

    if (m_active_buckets == m_buckets.size()) {
        m_buckets.emplace_back();
        m_buckets.back().entities.reserve(m_config.expected_entities_per_cell);
    }
    const auto slot = static_cast<std::uint32_t>(m_active_buckets++);
    m_buckets[slot].key = key;
    m_cell_index.emplace(key, slot);
    return m_buckets[slot];
}

// =============================================================================
// Mutation
// =============================================================================

void SpatialHash::clear() {
    for (std::size_t i = 0; i < m_active_buckets; ++i) {
        m_buckets[i].entities.clear();
    }
    m_active_buckets = 0;
    m_cell_index.clear();
}

bool SpatialHash::insert(EntityId entity, const AABB& box) {
    if (!box.is_finite()) {
        return false;
    }
    for_each_cell(box, [this, entity](std::uint64_t key) {
        bucket_for(key).entities.push_back(entity);
    });
    return true;
}

void SpatialHash::remove(EntityId entity, const AABB& box) {
    if (!box.is_finite()) {
        return;
    }
    for_each_cell(box, [this, entity](std::uint64_t key) {
        auto it = m_cell_index.find(key);
        if (it == m_cell_index.end()) {
            return;
        }
        auto& entities = m_buckets[it->second].entities;
        entities.erase(std::remove(entities.begin(), entities.end(), entity), entities.end());
    });
}

void SpatialHash::update(EntityId entity, const AABB& old_box, const AABB& new_box) {
    if (old_box.is_finite() && new_box.is_finite() &&
        world_to_cell(old_box.min) == world_to_cell(new_box.min) &&
        world_to_cell(old_box.max) == world_to_cell(new_box.max)) {
        return;
    }
    remove(entity, old_box);
    insert(entity, new_box);
}

// =============================================================================
// Queries
// =============================================================================

std::vector<EntityId> SpatialHash::query_region(const AABB& region) const {
    std::vector<EntityId> out;
    query_region(region, out);
    return out;
}

void SpatialHash::query_region(const AABB& region, std::vector<EntityId>& out) const {
    out.clear();
    if (!region.is_finite()) {
        return;
    }

    const IVec3 lo = world_to_cell(region.min);
    const IVec3 hi = world_to_cell(region.max);
    const IVec3 span = hi - lo + IVec3(1);
    const std::uint64_t cell_count = static_cast<std::uint64_t>(span.x)
                                   * static_cast<std::uint64_t>(span.y)
                                   * static_cast<std::uint64_t>(span.z);

    if (cell_count > m_active_buckets) {
        // Region covers more cells than are occupied: walk the buckets instead
        for (std::size_t i = 0; i < m_active_buckets; ++i) {
            const IVec3 cell = key_to_cell(m_buckets[i].key);
            if (glm::all(glm::greaterThanEqual(cell, lo)) && glm::all(glm::lessThanEqual(cell, hi))) {
                const auto& entities = m_buckets[i].entities;
                out.insert(out.end(), entities.begin(), entities.end());
            }
        }
    } else {
        for_each_cell(region, [this, &out](std::uint64_t key) {
            auto it = m_cell_index.find(key);
            if (it != m_cell_index.end()) {
                const auto& entities = m_buckets[it->second].entities;
                out.insert(out.end(), entities.begin(), entities.end());
            }
        });
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
}

SpatialHashStats SpatialHash::stats() const {
    SpatialHashStats s;
    for (std::size_t i = 0; i < m_active_buckets; ++i) {
        const std::size_t n = m_buckets[i].entities.size();
        if (n == 0) {
            continue;
        }
        ++s.occupied_cells;
        s.total_entries += n;
        s.max_entities_per_cell = std::max(s.max_entities_per_cell, n);
    }
    if (s.occupied_cells > 0) {
        s.avg_entities_per_cell = static_cast<float>(s.total_entries) / static_cast<float>(s.occupied_cells);
    }
    return s;
}

} // namespace voxel_physics
