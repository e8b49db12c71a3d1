/// @file contact_graph.cpp
/// @brief ContactColoring implementation

#include <voxel/physics/contact_graph.hpp>

#include <algorithm>

namespace voxel_physics {

void ContactColoring::build(std::span<const ContactManifold> manifolds,
                            std::span<const float> inverse_masses,
                            ColorGroups& out)
{
    out.clear();
    m_pending.clear();

    for (std::size_t i = 0; i < manifolds.size(); ++i) {
        if (!manifolds[i].empty()) {
            m_pending.push_back(static_cast<std::uint32_t>(i));
        }
    }
    out.m_offsets.push_back(0);
    if (m_pending.empty()) {
        return;
    }

    // Stamps hold colour + 1 of the last group that claimed an entity
    m_stamp.assign(inverse_masses.size(), 0);
    std::uint32_t color = 0;

    while (!m_pending.empty()) {
        ++color;
        m_deferred.clear();

        for (std::uint32_t index : m_pending) {
            const CandidatePair& pair = manifolds[index].pair;
            const bool a_dynamic = inverse_masses[pair.a.index()] > 0.0f;
            const bool b_dynamic = inverse_masses[pair.b.index()] > 0.0f;

            const bool a_busy = a_dynamic && m_stamp[pair.a.index()] == color;
            const bool b_busy = b_dynamic && m_stamp[pair.b.index()] == color;
            if (a_busy || b_busy) {
                m_deferred.push_back(index);
                continue;
            }

            if (a_dynamic) m_stamp[pair.a.index()] = color;
            if (b_dynamic) m_stamp[pair.b.index()] = color;
            out.m_order.push_back(index);
        }

        out.m_offsets.push_back(out.m_order.size());
        std::swap(m_pending, m_deferred);
    }
}

} // namespace voxel_physics
