/// @file entity_store.cpp
/// @brief EntityStore implementation

#include <voxel/physics/entity_store.hpp>

#include <algorithm>
#include <cmath>

namespace voxel_physics {

namespace {

float inverse_of(float mass) {
    return (std::isfinite(mass) && mass > 0.0f) ? 1.0f / mass : 0.0f;
}

} // anonymous namespace

EntityStore::EntityStore(std::size_t max_entities)
    : m_max_entities(max_entities) {}

template<typename F>
void EntityStore::for_each_column(F&& func) {
    func(m_position);
    func(m_previous_position);
    func(m_velocity);
    func(m_force);
    func(m_half_extents);
    func(m_mass);
    func(m_inverse_mass);
    func(m_restitution);
    func(m_friction);
    func(m_drag);
    func(m_gravity_scale);
    func(m_flags);
    func(m_group);
    func(m_mask);
}

// =============================================================================
// Lifecycle
// =============================================================================

voxel_core::Result<EntityId> EntityStore::add_entity(
    const Vec3& position, const Vec3& velocity, float mass, const Vec3& half_extents)
{
    EntityDesc desc;
    desc.position = position;
    desc.velocity = velocity;
    desc.mass = mass;
    desc.half_extents = half_extents;
    return add_entity(desc);
}

voxel_core::Result<EntityId> EntityStore::add_entity(const EntityDesc& desc) {
    if (m_position.size() >= m_max_entities) {
        m_dropped.fetch_add(1, std::memory_order_relaxed);
        return voxel_core::Error(voxel_core::CapacityError::entity_store_full(m_max_entities));
    }

    const float inv_mass = inverse_of(desc.mass);
    const EntityId id{static_cast<std::uint32_t>(m_position.size())};

    m_position.push_back(desc.position);
    m_previous_position.push_back(desc.position);
    m_velocity.push_back(inv_mass > 0.0f ? desc.velocity : Vec3(0.0f));
    m_force.push_back(Vec3(0.0f));
    m_half_extents.push_back(desc.half_extents);
    m_mass.push_back(inv_mass > 0.0f ? desc.mass : 0.0f);
    m_inverse_mass.push_back(inv_mass);
    m_restitution.push_back(desc.restitution);
    m_friction.push_back(desc.friction);
    m_drag.push_back(desc.drag);
    m_gravity_scale.push_back(desc.gravity_scale);
    m_flags.push_back(flags::None);
    m_group.push_back(desc.group);
    m_mask.push_back(desc.mask);

    return id;
}

voxel_core::Result<EntityId> EntityStore::remove_entity(EntityId id) {
    if (!id.is_valid()) {
        return voxel_core::Error(voxel_core::EntityError::invalid());
    }
    if (id.index() >= m_position.size()) {
        return voxel_core::Error(voxel_core::EntityError::out_of_range(id.value, m_position.size()));
    }

    const std::size_t last = m_position.size() - 1;
    const std::size_t slot = id.index();

    for_each_column([slot, last](auto& column) {
        if (slot != last) {
            column[slot] = column[last];
        }
        column.pop_back();
    });

    return slot == last ? EntityId::invalid() : EntityId{static_cast<std::uint32_t>(last)};
}

void EntityStore::clear() {
    for_each_column([](auto& column) { column.clear(); });
}

// =============================================================================
// Mutation
// =============================================================================

void EntityStore::teleport(EntityId id, const Vec3& position) {
    m_position[id.index()] = position;
    m_previous_position[id.index()] = position;
}

void EntityStore::set_velocity(EntityId id, const Vec3& velocity) {
    if (m_inverse_mass[id.index()] == 0.0f) {
        return;
    }
    m_velocity[id.index()] = velocity;
}

void EntityStore::add_force(EntityId id, const Vec3& force) {
    if (m_inverse_mass[id.index()] == 0.0f) {
        return;
    }
    m_force[id.index()] += force;
}

void EntityStore::apply_impulse(EntityId id, const Vec3& impulse) {
    const float inv_mass = m_inverse_mass[id.index()];
    if (inv_mass == 0.0f) {
        return;
    }
    m_velocity[id.index()] += impulse * inv_mass;
}

void EntityStore::set_mass(EntityId id, float mass) {
    const float inv_mass = inverse_of(mass);
    m_inverse_mass[id.index()] = inv_mass;
    m_mass[id.index()] = inv_mass > 0.0f ? mass : 0.0f;
    if (inv_mass == 0.0f) {
        m_velocity[id.index()] = Vec3(0.0f);
        m_force[id.index()] = Vec3(0.0f);
    }
}

void EntityStore::set_collision_filter(EntityId id, CollisionLayer group, CollisionLayer mask) {
    m_group[id.index()] = group;
    m_mask[id.index()] = mask;
}

void EntityStore::set_flag(EntityId id, EntityFlags flag, bool on) {
    if (on) {
        m_flags[id.index()] |= flag;
    } else {
        m_flags[id.index()] &= static_cast<EntityFlags>(~flag);
    }
}

void EntityStore::save_previous_positions() {
    std::copy(m_position.begin(), m_position.end(), m_previous_position.begin());
}

std::size_t EntityStore::static_count() const noexcept {
    return static_cast<std::size_t>(
        std::count(m_inverse_mass.begin(), m_inverse_mass.end(), 0.0f));
}

} // namespace voxel_physics
