#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for voxel_physics

#include <cstdint>

namespace voxel_physics {

struct EntityId;
struct CandidatePair;
struct ContactPoint;
struct ContactManifold;
struct PhysicsStats;

struct SpatialHashConfig;
struct SolverConfig;
struct IntegratorConfig;
struct TerrainConfig;
struct PhysicsConfig;

struct EntityDesc;
class EntityStore;
class SpatialHash;
class CollisionBuffer;
class WorkerPool;
class ParallelSolver;
class Integrator;
class PhysicsWorld;

} // namespace voxel_physics
