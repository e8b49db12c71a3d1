/// @file config.hpp
/// @brief Configuration structs for voxel_physics
///
/// Every struct carries the engine defaults and a validate() that rejects
/// out-of-range values. Invalid configuration is never silently clamped.

#pragma once

#include "types.hpp"

#include <voxel/core/error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace voxel_physics {

// =============================================================================
// SpatialHashConfig
// =============================================================================

/// Uniform grid broad phase parameters
struct SpatialHashConfig {
    float cell_size = 4.0f;
    Vec3 world_min{-1000.0f, -100.0f, -1000.0f};
    Vec3 world_max{1000.0f, 300.0f, 1000.0f};
    /// Sizing hint for bucket reservation
    std::uint32_t expected_entities_per_cell = 8;

    [[nodiscard]] voxel_core::Result<void> validate() const;
};

// =============================================================================
// SolverConfig
// =============================================================================

/// Contact solver parameters
struct SolverConfig {
    /// Worker threads besides the caller; 0 picks hardware_concurrency - 1
    std::uint32_t worker_threads = 0;
    /// Velocity passes per substep
    std::uint32_t iterations = 4;
    /// Fraction of penetration removed per positional pass
    float position_correction_rate = 0.2f;
    /// Penetration tolerated without correction
    float penetration_slop = 0.005f;
    float default_restitution = 0.3f;
    float default_friction = 0.5f;
    /// Approach speeds below this resolve without bounce
    float restitution_threshold = 0.01f;
    /// Candidate pair capacity per tick
    std::uint32_t max_pairs = 1u << 20;
    /// Colour-grouped parallel resolution; false resolves contacts sequentially
    bool parallel_resolution = true;
    /// Minimum items per parallel chunk
    std::uint32_t batch_size = 64;

    [[nodiscard]] voxel_core::Result<void> validate() const;
};

// =============================================================================
// IntegratorConfig
// =============================================================================

/// Time stepping and environment response
struct IntegratorConfig {
    Vec3 gravity{0.0f, -9.81f, 0.0f};
    /// Maximum fall speed (positive magnitude)
    float terminal_velocity = 50.0f;
    /// Velocities whose magnitude is below this are snapped to zero
    float velocity_epsilon = 1e-3f;
    float fixed_timestep = 1.0f / 60.0f;
    /// Frame time clamp guarding against the spiral of death
    float max_frame_time = 0.25f;
    std::uint32_t substeps = 2;

    /// Vertical velocity multiplier applied per substep in water
    float water_damping = 0.95f;
    /// Maximum sink speed in water (positive magnitude)
    float water_max_fall_speed = 2.0f;
    /// Vertical drift below this is zeroed on ladders
    float ladder_drift_threshold = 0.1f;

    [[nodiscard]] voxel_core::Result<void> validate() const;
};

// =============================================================================
// TerrainConfig
// =============================================================================

/// Block classification for the world lookup. Any other non-air block is solid.
struct TerrainConfig {
    std::vector<std::uint16_t> water_blocks{6};
    std::vector<std::uint16_t> ladder_blocks{20};
    /// Non-air blocks that neither collide nor affect movement
    std::vector<std::uint16_t> passable_blocks;

    [[nodiscard]] voxel_core::Result<void> validate() const;
};

// =============================================================================
// PhysicsConfig
// =============================================================================

/// Aggregate configuration for a PhysicsWorld
struct PhysicsConfig {
    std::uint32_t max_entities = 65536;
    SpatialHashConfig spatial_hash;
    SolverConfig solver;
    IntegratorConfig integrator;
    TerrainConfig terrain;

    [[nodiscard]] voxel_core::Result<void> validate() const;

    /// Parse from JSON; absent keys keep their defaults
    [[nodiscard]] static voxel_core::Result<PhysicsConfig> from_json(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json to_json() const;

    /// Read and parse a JSON config file, then validate it
    [[nodiscard]] static voxel_core::Result<PhysicsConfig> load_file(const std::string& path);
};

} // namespace voxel_physics
