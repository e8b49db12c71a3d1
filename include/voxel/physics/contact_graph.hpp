/// @file contact_graph.hpp
/// @brief Graph colouring of contacts for parallel resolution

#pragma once

#include "collision_buffer.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace voxel_physics {

/// Contacts partitioned so that no dynamic entity appears twice in a group.
///
/// Only dynamic entities are graph nodes. Resolution reads a static body's
/// state but never writes it (impulses and corrections are scaled by its zero
/// inverse mass and skipped), so one static may appear in any number of
/// contacts of the same group.
class ColorGroups {
public:
    void clear() {
        m_order.clear();
        m_offsets.clear();
    }

    [[nodiscard]] std::size_t group_count() const noexcept {
        return m_offsets.empty() ? 0 : m_offsets.size() - 1;
    }

    /// Manifold indices belonging to group `g`, ascending
    [[nodiscard]] std::span<const std::uint32_t> group(std::size_t g) const noexcept {
        return {m_order.data() + m_offsets[g], m_offsets[g + 1] - m_offsets[g]};
    }

    [[nodiscard]] std::size_t contact_count() const noexcept { return m_order.size(); }

private:
    friend class ContactColoring;

    std::vector<std::uint32_t> m_order;
    std::vector<std::size_t> m_offsets;
};

/// Greedy colouring over the contact graph.
///
/// Each pass sweeps the not-yet-coloured manifolds in index order and takes
/// every one whose dynamic endpoints are still free in the current colour.
/// The result depends only on the manifold order, so it is repeatable.
class ContactColoring {
public:
    /// Colour the non-empty manifolds. `inverse_masses` decides which
    /// endpoints are dynamic.
    void build(std::span<const ContactManifold> manifolds,
               std::span<const float> inverse_masses,
               ColorGroups& out);

private:
    std::vector<std::uint32_t> m_pending;
    std::vector<std::uint32_t> m_deferred;
    std::vector<std::uint32_t> m_stamp;
};

} // namespace voxel_physics
