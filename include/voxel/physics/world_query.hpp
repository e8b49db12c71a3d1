/// @file world_query.hpp
/// @brief Narrow boundary to voxel world storage

#pragma once

#include "config.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>

namespace voxel_physics {

// =============================================================================
// Blocks
// =============================================================================

/// Block type id as stored by the voxel world
struct BlockId {
    std::uint16_t value = 0;

    static constexpr std::uint16_t AIR = 0;

    [[nodiscard]] static constexpr BlockId air() noexcept { return BlockId{AIR}; }
    [[nodiscard]] constexpr bool is_air() const noexcept { return value == AIR; }

    constexpr bool operator==(const BlockId&) const noexcept = default;
};

/// Maps integer voxel coordinates to the block occupying [x,x+1)x[y,y+1)x[z,z+1).
/// Must be safe to call from several threads at once.
using BlockLookup = std::function<BlockId(const IVec3&)>;

// =============================================================================
// Block Classification
// =============================================================================

/// How the integrator treats a block
enum class BlockClass : std::uint8_t {
    Air,
    Solid,
    Water,
    Ladder,
    Passable,
};

/// Classify a block against the terrain configuration
[[nodiscard]] inline BlockClass classify_block(BlockId block, const TerrainConfig& terrain) {
    if (block.is_air()) {
        return BlockClass::Air;
    }
    auto listed = [&](const std::vector<std::uint16_t>& ids) {
        return std::find(ids.begin(), ids.end(), block.value) != ids.end();
    };
    if (listed(terrain.water_blocks)) return BlockClass::Water;
    if (listed(terrain.ladder_blocks)) return BlockClass::Ladder;
    if (listed(terrain.passable_blocks)) return BlockClass::Passable;
    return BlockClass::Solid;
}

/// Get block class name
[[nodiscard]] inline const char* to_string(BlockClass cls) {
    switch (cls) {
        case BlockClass::Air: return "Air";
        case BlockClass::Solid: return "Solid";
        case BlockClass::Water: return "Water";
        case BlockClass::Ladder: return "Ladder";
        case BlockClass::Passable: return "Passable";
        default: return "Unknown";
    }
}

} // namespace voxel_physics
