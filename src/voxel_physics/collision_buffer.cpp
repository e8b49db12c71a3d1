/// @file collision_buffer.cpp
/// @brief CollisionBuffer implementation

#include <voxel/physics/collision_buffer.hpp>

#include <algorithm>

namespace voxel_physics {

CollisionBuffer::CollisionBuffer(std::size_t max_pairs)
    : m_max_pairs(max_pairs) {}

void CollisionBuffer::clear() {
    m_pairs.clear();
    m_manifold_count = 0;
    m_seen.clear();
    m_seen_valid = true;
    m_dropped_pairs = 0;
    m_dropped_contacts.store(0, std::memory_order_relaxed);
}

// =============================================================================
// Pairs
// =============================================================================

bool CollisionBuffer::push_pair(EntityId a, EntityId b) {
    if (a == b) {
        return false;
    }

    if (!m_seen_valid) {
        m_seen.clear();
        for (const auto& p : m_pairs) {
            m_seen.insert(p.key());
        }
        m_seen_valid = true;
    }

    const CandidatePair pair = CandidatePair::make(a, b);
    if (m_seen.count(pair.key()) != 0) {
        return false;
    }
    if (m_pairs.size() >= m_max_pairs) {
        ++m_dropped_pairs;
        return false;
    }

    m_seen.insert(pair.key());
    m_pairs.push_back(pair);
    return true;
}

void CollisionBuffer::merge_pairs(std::span<std::vector<CandidatePair>> chunks) {
    std::size_t incoming = 0;
    for (const auto& chunk : chunks) {
        incoming += chunk.size();
    }
    m_pairs.reserve(m_pairs.size() + incoming);

    for (auto& chunk : chunks) {
        m_pairs.insert(m_pairs.end(), chunk.begin(), chunk.end());
    }

    std::sort(m_pairs.begin(), m_pairs.end());
    m_pairs.erase(std::unique(m_pairs.begin(), m_pairs.end()), m_pairs.end());

    if (m_pairs.size() > m_max_pairs) {
        m_dropped_pairs += static_cast<std::uint32_t>(m_pairs.size() - m_max_pairs);
        m_pairs.resize(m_max_pairs);
    }

    m_seen_valid = false;
}

// =============================================================================
// Manifolds
// =============================================================================

void CollisionBuffer::prepare_manifolds() {
    if (m_manifolds.size() < m_pairs.size()) {
        m_manifolds.resize(m_pairs.size());
    }
    for (std::size_t i = 0; i < m_pairs.size(); ++i) {
        auto& m = m_manifolds[i];
        m.pair = m_pairs[i];
        m.point_count = 0;
        m.restitution = 0.0f;
        m.friction = 0.0f;
    }
    m_manifold_count = m_pairs.size();
}

bool CollisionBuffer::push_contact(std::size_t pair_index, const ContactPoint& point) {
    auto& m = m_manifolds[pair_index];
    if (m.point_count >= k_max_contact_points) {
        m_dropped_contacts.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    m.points[m.point_count++] = point;
    return true;
}

void CollisionBuffer::set_material(std::size_t pair_index, float restitution, float friction) {
    m_manifolds[pair_index].restitution = restitution;
    m_manifolds[pair_index].friction = friction;
}

std::size_t CollisionBuffer::contact_pair_count() const noexcept {
    std::size_t count = 0;
    for (const auto& m : manifolds()) {
        if (!m.empty()) ++count;
    }
    return count;
}

std::size_t CollisionBuffer::contact_point_count() const noexcept {
    std::size_t count = 0;
    for (const auto& m : manifolds()) {
        count += m.point_count;
    }
    return count;
}

} // namespace voxel_physics
