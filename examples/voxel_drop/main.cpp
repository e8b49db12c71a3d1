/// @file main.cpp
/// @brief Voxel Drop Demo
///
/// Drops a grid of box columns onto flat terrain with a water pool and a
/// ladder, runs the physics world at a fake 144 Hz render rate, and logs
/// per-second statistics. Pass a JSON config path to override defaults.

#include <voxel/core/error.hpp>
#include <voxel/core/log.hpp>
#include <voxel/physics/physics_world.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

using namespace voxel_physics;

namespace {

constexpr std::uint16_t STONE = 1;
constexpr std::uint16_t WATER = 6;
constexpr std::uint16_t LADDER = 20;

/// Stone below y = 0, a 4x4 water pool two blocks deep, one ladder column
BlockId demo_world(const IVec3& p) {
    if (p.y < 0) {
        return BlockId{STONE};
    }
    if (p.x >= 10 && p.x < 14 && p.z >= 10 && p.z < 14 && p.y < 2) {
        return BlockId{WATER};
    }
    if (p.x == -4 && p.z == 0 && p.y < 8) {
        return BlockId{LADDER};
    }
    return BlockId::air();
}

/// Spawn `columns` x `columns` stacks of `height` boxes
void spawn_columns(PhysicsWorld& world, int columns, int height) {
    for (int cx = 0; cx < columns; ++cx) {
        for (int cz = 0; cz < columns; ++cz) {
            for (int i = 0; i < height; ++i) {
                const Vec3 position(cx * 1.5f + 0.5f, 2.0f + i * 1.1f, cz * 1.5f + 0.5f);
                auto id = world.add_entity(position, Vec3(0.0f), 1.0f, Vec3(0.45f));
                if (!id) {
                    spdlog::warn("Spawn stopped: {}", voxel_core::build_error_chain(id.error()));
                    return;
                }
            }
        }
    }
}

void print_stats(const PhysicsWorld& world, int second) {
    const PhysicsStats& s = world.stats();
    const SpatialHashStats hash = world.spatial_hash_stats();
    spdlog::info("[t={}s] entities {} ({} grounded), pairs {}, contacts {}, colours {}, step {:.3f} ms",
                 second, s.entity_count, s.grounded_entities, s.broadphase_pairs,
                 s.contact_points, s.color_groups, s.step_time_ms);
    spdlog::info("        cells {} (max {} per cell), dropped {}/{}/{}",
                 hash.occupied_cells, hash.max_entities_per_cell,
                 s.dropped_entities, s.dropped_pairs, s.dropped_contacts);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    voxel_core::init_logging();
    spdlog::info("=== Voxel Drop Demo ===");

    PhysicsConfig config;
    if (argc > 1) {
        auto loaded = PhysicsConfig::load_file(argv[1]);
        if (!loaded) {
            spdlog::error("Failed to load config: {}", voxel_core::build_error_chain(loaded.error()));
            return EXIT_FAILURE;
        }
        config = std::move(*loaded);
    }

    auto created = PhysicsWorld::create(config);
    if (!created) {
        spdlog::error("Failed to create physics world: {}", voxel_core::build_error_chain(created.error()));
        return EXIT_FAILURE;
    }
    PhysicsWorld& world = **created;

    spawn_columns(world, 6, 8);

    // A few extras: one dropped into the pool, one on the ladder
    (void)world.add_entity(Vec3(12.0f, 6.0f, 12.0f), Vec3(0.0f), 1.0f, Vec3(0.4f));
    (void)world.add_entity(Vec3(-3.5f, 4.5f, 0.5f), Vec3(0.0f), 1.0f, Vec3(0.4f));

    // Static platform
    (void)world.add_entity(EntityDesc::static_box(Vec3(-10.0f, 1.0f, -10.0f), Vec3(3.0f, 1.0f, 3.0f)));

    const BlockLookup lookup = demo_world;
    const float frame_time = 1.0f / 144.0f;
    const int seconds = 5;

    for (int frame = 1; frame <= seconds * 144; ++frame) {
        world.tick(frame_time, &lookup);
        if (frame % 144 == 0) {
            print_stats(world, frame / 144);
        }
    }

    const Vec3 first = world.interpolated_position(EntityId(0));
    spdlog::info("Entity 0 rendered at ({:.3f}, {:.3f}, {:.3f}), alpha {:.2f}",
                 first.x, first.y, first.z, world.alpha());

    voxel_core::shutdown_logging();
    return EXIT_SUCCESS;
}
