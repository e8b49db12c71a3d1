/// @file narrow_phase.cpp
/// @brief Box-vs-box contact generation

#include <voxel/physics/narrow_phase.hpp>

namespace voxel_physics {

std::optional<ContactPoint> collide_aabb(const AABB& a, const AABB& b) {
    const Vec3 overlap = a.overlap_extent(b);
    if (overlap.x <= 0.0f || overlap.y <= 0.0f || overlap.z <= 0.0f) {
        return std::nullopt;
    }

    int axis = 0;
    if (overlap.y < overlap[axis]) axis = 1;
    if (overlap.z < overlap[axis]) axis = 2;

    const Vec3 delta = b.center() - a.center();

    ContactPoint contact;
    contact.depth = overlap[axis];
    contact.normal = Vec3(0.0f);
    contact.normal[axis] = delta[axis] < 0.0f ? -1.0f : 1.0f;
    contact.position = (glm::max(a.min, b.min) + glm::min(a.max, b.max)) * 0.5f;
    return contact;
}

} // namespace voxel_physics
