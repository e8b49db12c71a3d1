// voxel_physics Integrator tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <voxel/physics/integrator.hpp>
#include <voxel/physics/solver.hpp>

#include <limits>
#include <random>

using namespace voxel_physics;
using Catch::Matchers::WithinAbs;

namespace {

constexpr std::uint16_t STONE = 1;
constexpr std::uint16_t WATER = 6;
constexpr std::uint16_t LADDER = 20;

/// Solid ground below y = 0, air above
BlockId flat_ground(const IVec3& p) {
    return p.y < 0 ? BlockId{STONE} : BlockId::air();
}

struct Rig {
    WorkerPool pool;
    std::unique_ptr<ParallelSolver> solver;
    Integrator integrator;
    EntityStore store;
    PhysicsStats stats;

    explicit Rig(std::size_t threads = 0, IntegratorConfig config = {})
        : pool(threads)
        , solver(std::move(ParallelSolver::create(SolverConfig{}, SpatialHashConfig{}, pool)).unwrap())
        , integrator(std::move(Integrator::create(config, TerrainConfig{}, pool)).unwrap())
    {
    }

    void run(int steps, const BlockLookup* world) {
        for (int i = 0; i < steps; ++i) {
            integrator.step(store, *solver, world, stats);
        }
    }
};

} // anonymous namespace

TEST_CASE("Integrator creation", "[physics][integrator]") {
    WorkerPool pool(0);

    IntegratorConfig bad;
    bad.substeps = 0;
    auto result = Integrator::create(bad, TerrainConfig{}, pool);
    REQUIRE(result.is_err());
    REQUIRE(result.error().as<voxel_core::ConfigError>()->field == "integrator.substeps");

    TerrainConfig terrain;
    terrain.ladder_blocks = {BlockId::AIR};
    REQUIRE(Integrator::create(IntegratorConfig{}, terrain, pool).is_err());
}

TEST_CASE("Integrator free fall", "[physics][integrator]") {
    Rig rig;
    EntityId box = *rig.store.add_entity(Vec3(0.0f, 10.0f, 0.0f), Vec3(0.0f), 1.0f, Vec3(0.5f));
    EntityId wall = *rig.store.add_entity(EntityDesc::static_box(Vec3(20.0f), Vec3(1.0f)));

    rig.run(1, nullptr);

    // Semi-implicit Euler over two substeps
    const float dt = 1.0f / 120.0f;
    REQUIRE_THAT(rig.store.velocity(box).y, WithinAbs(-9.81f * 2.0f * dt, 1e-5));
    REQUIRE_THAT(rig.store.position(box).y, WithinAbs(10.0f - 9.81f * dt * dt * 3.0f, 1e-5));
    REQUIRE(rig.store.previous_position(box) == Vec3(0.0f, 10.0f, 0.0f));
    REQUIRE(rig.stats.substeps == 2);

    // Static bodies never move
    REQUIRE(rig.store.position(wall) == Vec3(20.0f));
}

TEST_CASE("Integrator velocity shaping", "[physics][integrator]") {
    Rig rig;

    SECTION("terminal velocity") {
        EntityId box = *rig.store.add_entity(Vec3(0.0f, 200.0f, 0.0f), Vec3(0.0f, -80.0f, 0.0f), 1.0f, Vec3(0.5f));
        rig.run(1, nullptr);
        REQUIRE(rig.store.velocity(box).y >= -50.0f);
    }

    SECTION("drag slows horizontal motion") {
        EntityDesc desc = EntityDesc::dynamic_box(Vec3(0.0f, 50.0f, 0.0f), Vec3(0.5f));
        desc.velocity = Vec3(10.0f, 0.0f, 0.0f);
        desc.drag = 1.0f;
        EntityId box = *rig.store.add_entity(desc);
        rig.run(1, nullptr);
        REQUIRE(rig.store.velocity(box).x < 10.0f);
        REQUIRE(rig.store.velocity(box).x > 9.0f);
    }

    SECTION("tiny velocities snap to rest") {
        EntityDesc desc = EntityDesc::dynamic_box(Vec3(0.0f, 50.0f, 0.0f), Vec3(0.5f));
        desc.velocity = Vec3(1e-4f, 0.0f, 0.0f);
        desc.gravity_scale = 0.0f;
        EntityId box = *rig.store.add_entity(desc);
        rig.run(1, nullptr);
        REQUIRE(rig.store.velocity(box) == Vec3(0.0f));
        REQUIRE(rig.store.position(box) == Vec3(0.0f, 50.0f, 0.0f));
    }

    SECTION("snapping looks at the whole velocity, not each axis") {
        EntityDesc desc = EntityDesc::dynamic_box(Vec3(0.0f, 50.0f, 0.0f), Vec3(0.5f));
        desc.velocity = Vec3(8e-4f, 0.0f, 8e-4f);
        desc.gravity_scale = 0.0f;
        EntityId box = *rig.store.add_entity(desc);
        rig.run(1, nullptr);
        REQUIRE_THAT(rig.store.velocity(box).x, WithinAbs(8e-4f, 1e-7));
        REQUIRE_THAT(rig.store.velocity(box).z, WithinAbs(8e-4f, 1e-7));
    }

    SECTION("forces are consumed each substep") {
        EntityDesc desc = EntityDesc::dynamic_box(Vec3(0.0f, 50.0f, 0.0f), Vec3(0.5f), 2.0f);
        desc.gravity_scale = 0.0f;
        EntityId box = *rig.store.add_entity(desc);
        rig.store.add_force(box, Vec3(240.0f, 0.0f, 0.0f));
        rig.run(1, nullptr);
        // 240 N on 2 kg over one 1/120 s substep
        REQUIRE_THAT(rig.store.velocity(box).x, WithinAbs(1.0f, 1e-5));
        REQUIRE(rig.store.force(box) == Vec3(0.0f));
    }
}

TEST_CASE("Integrator terrain collision", "[physics][integrator]") {
    Rig rig;
    BlockLookup ground = flat_ground;

    SECTION("box comes to rest on the ground") {
        EntityId box = *rig.store.add_entity(Vec3(0.5f, 3.0f, 0.5f), Vec3(0.0f), 1.0f, Vec3(0.5f));
        rig.run(120, &ground);

        REQUIRE_THAT(rig.store.position(box).y, WithinAbs(0.5f, 1e-5));
        REQUIRE(rig.store.velocity(box).y == 0.0f);
        REQUIRE(rig.store.has_flag(box, flags::Grounded));
    }

    SECTION("fast box does not tunnel through the ground") {
        EntityId box = *rig.store.add_entity(Vec3(0.5f, 1.0f, 0.5f), Vec3(0.0f, -45.0f, 0.0f), 1.0f, Vec3(0.5f));
        rig.run(1, &ground);
        REQUIRE(rig.store.position(box).y >= 0.5f - 1e-5f);
    }

    SECTION("wall stops horizontal motion") {
        BlockLookup walled = [](const IVec3& p) {
            return (p.y < 0 || p.x >= 3) ? BlockId{STONE} : BlockId::air();
        };
        EntityId box = *rig.store.add_entity(Vec3(1.5f, 0.5f, 0.5f), Vec3(10.0f, 0.0f, 0.0f), 1.0f, Vec3(0.5f));
        rig.run(30, &walled);

        REQUIRE_THAT(rig.store.position(box).x, WithinAbs(2.5f, 1e-5));
        REQUIRE(rig.store.velocity(box).x == 0.0f);
    }

    SECTION("box pressed against a wall while falling still reaches the ground") {
        BlockLookup walled = [](const IVec3& p) {
            return (p.y < 0 || p.x >= -1) ? BlockId{STONE} : BlockId::air();
        };
        EntityId box = *rig.store.add_entity(Vec3(-3.0f, 4.3f, 0.5f), Vec3(3.0f, 0.0f, 0.0f), 1.0f, Vec3(0.3f));
        rig.run(180, &walled);

        REQUIRE_THAT(rig.store.position(box).x, WithinAbs(-1.3f, 1e-5));
        REQUIRE_THAT(rig.store.position(box).y, WithinAbs(0.3f, 1e-5));
        REQUIRE(rig.store.has_flag(box, flags::Grounded));
    }

    SECTION("passable blocks do not block") {
        TerrainConfig terrain;
        terrain.passable_blocks = {31};
        REQUIRE(classify_block(BlockId{31}, terrain) == BlockClass::Passable);
        REQUIRE(classify_block(BlockId{31}, TerrainConfig{}) == BlockClass::Solid);
        REQUIRE(classify_block(BlockId{WATER}, terrain) == BlockClass::Water);
        REQUIRE(classify_block(BlockId::air(), terrain) == BlockClass::Air);
    }

    SECTION("landing clears grounded once airborne again") {
        EntityId box = *rig.store.add_entity(Vec3(0.5f, 0.5f, 0.5f), Vec3(0.0f), 1.0f, Vec3(0.5f));
        rig.run(1, &ground);
        REQUIRE(rig.store.has_flag(box, flags::Grounded));

        rig.store.set_velocity(box, Vec3(0.0f, 8.0f, 0.0f));
        rig.run(1, &ground);
        REQUIRE_FALSE(rig.store.has_flag(box, flags::Grounded));
    }
}

TEST_CASE("Integrator moves boxes excluded from collision", "[physics][integrator]") {
    Rig rig;
    BlockLookup ground = flat_ground;

    SECTION("flat box keeps falling and lands on the ground") {
        EntityId flat = *rig.store.add_entity(Vec3(0.5f, 3.0f, 0.5f), Vec3(0.0f), 1.0f, Vec3(0.5f, 0.0f, 0.5f));
        rig.run(1, &ground);
        REQUIRE(rig.store.has_flag(flat, flags::Excluded));
        REQUIRE(rig.stats.excluded_entities == 1);
        REQUIRE(rig.store.position(flat).y < 3.0f);

        rig.run(120, &ground);
        REQUIRE(rig.store.has_flag(flat, flags::Excluded));
        REQUIRE_THAT(rig.store.position(flat).y, WithinAbs(0.0f, 1e-5));
        REQUIRE(rig.store.velocity(flat).y == 0.0f);
        REQUIRE(rig.store.has_flag(flat, flags::Grounded));
    }

    SECTION("non-finite velocity stops integration") {
        EntityId box = *rig.store.add_entity(Vec3(0.5f, 3.0f, 0.5f), Vec3(0.0f), 1.0f, Vec3(0.5f));
        rig.store.set_velocity(box, Vec3(std::numeric_limits<float>::quiet_NaN(), 0.0f, 0.0f));
        rig.run(5, &ground);
        REQUIRE(rig.store.position(box) == Vec3(0.5f, 3.0f, 0.5f));
    }

    SECTION("boxes far outside block range skip the terrain") {
        const float far = 1.0e9f;
        EntityId box = *rig.store.add_entity(Vec3(far, -far, 0.0f), Vec3(0.0f), 1.0f, Vec3(0.5f));
        EntityId huge = *rig.store.add_entity(Vec3(0.0f, 500.0f, 0.0f), Vec3(0.0f), 1.0f, Vec3(1000.0f));
        rig.run(1, &ground);
        REQUIRE(rig.store.velocity(box).y < 0.0f);
        REQUIRE(rig.store.position(huge).y < 500.0f);
    }
}

TEST_CASE("Integrator water and ladders", "[physics][integrator]") {
    Rig rig;

    SECTION("water caps the fall speed") {
        BlockLookup pool_world = [](const IVec3& p) {
            if (p.y < 0) return BlockId{STONE};
            return p.y < 10 ? BlockId{WATER} : BlockId::air();
        };
        EntityId box = *rig.store.add_entity(Vec3(0.5f, 8.5f, 0.5f), Vec3(0.0f, -10.0f, 0.0f), 1.0f, Vec3(0.5f));
        rig.run(2, &pool_world);

        REQUIRE(rig.store.has_flag(box, flags::InWater));
        REQUIRE(rig.store.velocity(box).y >= -2.0f);
    }

    SECTION("ladders cancel gravity") {
        BlockLookup ladder_world = [](const IVec3& p) {
            if (p.y < 0) return BlockId{STONE};
            return (p.x == 0 && p.z == 0 && p.y < 10) ? BlockId{LADDER} : BlockId::air();
        };
        EntityId box = *rig.store.add_entity(Vec3(0.5f, 5.5f, 0.5f), Vec3(0.0f), 1.0f, Vec3(0.4f));
        rig.run(10, &ladder_world);

        REQUIRE(rig.store.has_flag(box, flags::OnLadder));
        REQUIRE(rig.store.velocity(box).y == 0.0f);
        REQUIRE_THAT(rig.store.position(box).y, WithinAbs(5.5f, 0.01f));
    }
}

TEST_CASE("Integrator accumulator", "[physics][integrator]") {
    Rig rig;
    EntityId box = *rig.store.add_entity(Vec3(0.0f, 10.0f, 0.0f), Vec3(1.0f, 0.0f, 0.0f), 1.0f, Vec3(0.5f));

    SECTION("leftover time becomes alpha") {
        const std::uint32_t steps = rig.integrator.advance(0.025f, rig.store, *rig.solver, nullptr, rig.stats);
        REQUIRE(steps == 1);
        REQUIRE(rig.stats.fixed_steps == 1);
        REQUIRE_THAT(rig.integrator.alpha(), WithinAbs(0.5f, 1e-3));

        Vec3 mid = Integrator::interpolated_position(rig.store, box, 0.5f);
        Vec3 expected = (rig.store.previous_position(box) + rig.store.position(box)) * 0.5f;
        REQUIRE_THAT(mid.x, WithinAbs(expected.x, 1e-6));
        REQUIRE(Integrator::interpolated_position(rig.store, box, 0.0f) == rig.store.previous_position(box));
        REQUIRE_THAT(Integrator::interpolated_position(rig.store, box, 1.0f).x,
                     WithinAbs(rig.store.position(box).x, 1e-6));
    }

    SECTION("short frames accumulate") {
        REQUIRE(rig.integrator.advance(0.01f, rig.store, *rig.solver, nullptr, rig.stats) == 0);
        REQUIRE(rig.integrator.advance(0.01f, rig.store, *rig.solver, nullptr, rig.stats) == 1);
    }

    SECTION("bad frame times are ignored") {
        REQUIRE(rig.integrator.advance(-1.0f, rig.store, *rig.solver, nullptr, rig.stats) == 0);
        REQUIRE(rig.integrator.advance(std::numeric_limits<float>::quiet_NaN(),
                                       rig.store, *rig.solver, nullptr, rig.stats) == 0);
        REQUIRE(rig.integrator.accumulator() == 0.0f);
    }

    SECTION("long frames are clamped") {
        const std::uint32_t steps = rig.integrator.advance(10.0f, rig.store, *rig.solver, nullptr, rig.stats);
        REQUIRE(steps >= 14);
        REQUIRE(steps <= 15);
        REQUIRE(rig.integrator.alpha() < 1.0f);
    }

    SECTION("reset") {
        (void)rig.integrator.advance(0.01f, rig.store, *rig.solver, nullptr, rig.stats);
        rig.integrator.reset_accumulator();
        REQUIRE(rig.integrator.alpha() == 0.0f);
    }
}

TEST_CASE("Simulation is independent of thread count", "[physics][integrator]") {
    auto populate = [](EntityStore& store) {
        std::mt19937 rng(7);
        std::uniform_real_distribution<float> xz(0.0f, 12.0f);
        std::uniform_real_distribution<float> y(1.0f, 20.0f);
        std::uniform_real_distribution<float> v(-2.0f, 2.0f);
        for (int i = 0; i < 300; ++i) {
            (void)store.add_entity(Vec3(xz(rng), y(rng), xz(rng)), Vec3(v(rng), v(rng), v(rng)), 1.0f, Vec3(0.4f));
        }
    };

    Rig single(0);
    Rig multi(3);
    populate(single.store);
    populate(multi.store);

    BlockLookup ground = flat_ground;
    single.run(60, &ground);
    multi.run(60, &ground);

    for (std::size_t i = 0; i < single.store.size(); ++i) {
        const EntityId id{static_cast<std::uint32_t>(i)};
        REQUIRE(single.store.position(id) == multi.store.position(id));
        REQUIRE(single.store.velocity(id) == multi.store.velocity(id));
        REQUIRE(single.store.entity_flags(id) == multi.store.entity_flags(id));
    }
}
