// voxel_physics ParallelSolver tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <voxel/physics/solver.hpp>

#include <limits>

using namespace voxel_physics;
using Catch::Matchers::WithinAbs;

namespace {

std::unique_ptr<ParallelSolver> make_solver(WorkerPool& pool, bool parallel = true) {
    SolverConfig config;
    config.parallel_resolution = parallel;
    SpatialHashConfig hash_config;
    auto solver = ParallelSolver::create(config, hash_config, pool);
    REQUIRE(solver.is_ok());
    return std::move(*solver);
}

EntityDesc bouncy_box(const Vec3& position, const Vec3& velocity) {
    EntityDesc desc = EntityDesc::dynamic_box(position, Vec3(0.5f));
    desc.velocity = velocity;
    desc.restitution = 1.0f;
    desc.friction = 0.0f;
    return desc;
}

} // anonymous namespace

TEST_CASE("ParallelSolver creation", "[physics][solver]") {
    WorkerPool pool(0);

    SECTION("invalid solver config") {
        SolverConfig config;
        config.iterations = 0;
        REQUIRE(ParallelSolver::create(config, SpatialHashConfig{}, pool).is_err());
    }

    SECTION("invalid hash config") {
        SpatialHashConfig hash_config;
        hash_config.cell_size = 0.0f;
        REQUIRE(ParallelSolver::create(SolverConfig{}, hash_config, pool).is_err());
    }
}

TEST_CASE("ParallelSolver elastic collision", "[physics][solver]") {
    const bool parallel = GENERATE(true, false);
    WorkerPool pool(2);
    auto solver = make_solver(pool, parallel);

    EntityStore store;
    EntityId a = *store.add_entity(bouncy_box(Vec3(0.0f), Vec3(1.0f, 0.0f, 0.0f)));
    EntityId b = *store.add_entity(bouncy_box(Vec3(0.9f, 0.0f, 0.0f), Vec3(-1.0f, 0.0f, 0.0f)));

    PhysicsStats stats;
    solver->step(store, stats);

    // Equal masses with restitution 1 exchange velocities
    REQUIRE_THAT(store.velocity(a).x, WithinAbs(-1.0f, 1e-5));
    REQUIRE_THAT(store.velocity(b).x, WithinAbs(1.0f, 1e-5));
    REQUIRE_THAT(store.velocity(a).y, WithinAbs(0.0f, 1e-6));

    // Positional correction pushed them apart
    REQUIRE(store.position(a).x < 0.0f);
    REQUIRE(store.position(b).x > 0.9f);

    REQUIRE(stats.broadphase_pairs == 1);
    REQUIRE(stats.contact_pairs == 1);
    REQUIRE(stats.contact_points == 1);
    REQUIRE(stats.color_groups == (parallel ? 1u : 0u));
}

TEST_CASE("ParallelSolver leaves static bodies alone", "[physics][solver]") {
    WorkerPool pool(2);
    auto solver = make_solver(pool);

    EntityStore store;
    EntityId floor = *store.add_entity(EntityDesc::static_box(Vec3(0.0f, -1.0f, 0.0f), Vec3(5.0f, 0.5f, 5.0f)));
    EntityDesc falling = EntityDesc::dynamic_box(Vec3(0.0f, -0.05f, 0.0f), Vec3(0.5f));
    falling.velocity = Vec3(0.0f, -2.0f, 0.0f);
    EntityId box = *store.add_entity(falling);

    PhysicsStats stats;
    solver->step(store, stats);

    REQUIRE(store.position(floor) == Vec3(0.0f, -1.0f, 0.0f));
    REQUIRE(store.velocity(floor) == Vec3(0.0f));

    // Bounced with the averaged restitution of 0.3
    REQUIRE_THAT(store.velocity(box).y, WithinAbs(0.6f, 1e-5));
    REQUIRE(store.position(box).y > -0.05f);
}

TEST_CASE("ParallelSolver shares a static body across one colour group", "[physics][solver]") {
    WorkerPool pool(3);
    auto solver = make_solver(pool);

    EntityStore store;
    EntityId floor = *store.add_entity(EntityDesc::static_box(Vec3(0.0f, -0.5f, 0.0f), Vec3(20.0f, 0.5f, 1.0f)));
    for (int i = 0; i < 16; ++i) {
        EntityDesc desc = EntityDesc::dynamic_box(Vec3(-15.0f + 2.0f * i, 0.45f, 0.0f), Vec3(0.5f));
        desc.velocity = Vec3(0.0f, -1.0f, 0.0f);
        (void)store.add_entity(desc);
    }

    PhysicsStats stats;
    for (int step = 0; step < 10; ++step) {
        solver->step(store, stats);

        // Every box touches only the floor, so all contacts fit in one group
        REQUIRE(stats.contact_pairs == 16);
        REQUIRE(solver->color_groups().group_count() == 1);
        REQUIRE(solver->color_groups().group(0).size() == 16);

        REQUIRE(store.position(floor) == Vec3(0.0f, -0.5f, 0.0f));
        REQUIRE(store.velocity(floor) == Vec3(0.0f));
    }
    for (std::size_t i = 1; i < store.size(); ++i) {
        REQUIRE(store.velocity(EntityId(static_cast<std::uint32_t>(i))).y >= 0.0f);
    }
}

TEST_CASE("ParallelSolver broad phase filtering", "[physics][solver]") {
    WorkerPool pool(0);
    auto solver = make_solver(pool);
    EntityStore store;
    PhysicsStats stats;

    SECTION("static pairs are skipped") {
        (void)store.add_entity(EntityDesc::static_box(Vec3(0.0f), Vec3(1.0f)));
        (void)store.add_entity(EntityDesc::static_box(Vec3(0.5f), Vec3(1.0f)));
        solver->step(store, stats);
        REQUIRE(stats.broadphase_pairs == 0);
    }

    SECTION("collision masks") {
        EntityDesc ghost = EntityDesc::dynamic_box(Vec3(0.0f), Vec3(0.5f));
        ghost.group = 1u << 1;
        ghost.mask = 1u << 1;
        (void)store.add_entity(ghost);
        (void)store.add_entity(EntityDesc::dynamic_box(Vec3(0.2f), Vec3(0.5f)));
        solver->step(store, stats);
        REQUIRE(stats.broadphase_pairs == 0);
    }

    SECTION("touching boxes are not candidates") {
        (void)store.add_entity(EntityDesc::dynamic_box(Vec3(0.0f), Vec3(0.5f)));
        (void)store.add_entity(EntityDesc::dynamic_box(Vec3(1.0f, 0.0f, 0.0f), Vec3(0.5f)));
        solver->step(store, stats);
        REQUIRE(stats.broadphase_pairs == 0);
    }

    SECTION("pair spanning several cells is reported once") {
        (void)store.add_entity(EntityDesc::dynamic_box(Vec3(0.0f), Vec3(3.0f)));
        (void)store.add_entity(EntityDesc::dynamic_box(Vec3(1.0f), Vec3(3.0f)));
        solver->step(store, stats);
        REQUIRE(stats.broadphase_pairs == 1);
    }
}

TEST_CASE("ParallelSolver excludes degenerate entities", "[physics][solver]") {
    WorkerPool pool(0);
    auto solver = make_solver(pool);
    EntityStore store;

    const float nan = std::numeric_limits<float>::quiet_NaN();
    EntityId bad = *store.add_entity(EntityDesc::dynamic_box(Vec3(nan), Vec3(0.5f)));
    EntityId flat = *store.add_entity(EntityDesc::dynamic_box(Vec3(0.0f), Vec3(0.5f, 0.0f, 0.5f)));
    EntityId good = *store.add_entity(EntityDesc::dynamic_box(Vec3(0.0f), Vec3(0.5f)));

    PhysicsStats stats;
    solver->step(store, stats);

    REQUIRE(stats.excluded_entities == 2);
    REQUIRE(store.has_flag(bad, flags::Excluded));
    REQUIRE(store.has_flag(flat, flags::Excluded));
    REQUIRE_FALSE(store.has_flag(good, flags::Excluded));
    REQUIRE(stats.broadphase_pairs == 0);

    // Exclusion is cleared once the geometry is fixed
    store.set_half_extents(flat, Vec3(0.5f));
    store.set_position(flat, Vec3(5.0f));
    solver->step(store, stats);
    REQUIRE_FALSE(store.has_flag(flat, flags::Excluded));
    REQUIRE(stats.excluded_entities == 1);
}

TEST_CASE("ParallelSolver stack of boxes", "[physics][solver]") {
    const std::size_t threads = GENERATE(0u, 3u);
    WorkerPool pool(threads);
    auto solver = make_solver(pool);

    EntityStore store;
    (void)store.add_entity(EntityDesc::static_box(Vec3(0.0f, -0.5f, 0.0f), Vec3(10.0f, 0.5f, 10.0f)));
    for (int i = 0; i < 10; ++i) {
        (void)store.add_entity(EntityDesc::dynamic_box(Vec3(0.0f, 0.45f + 0.95f * i, 0.0f), Vec3(0.5f)));
    }

    PhysicsStats stats;
    solver->step(store, stats);

    REQUIRE(stats.contact_pairs == 10);
    REQUIRE(stats.color_groups >= 2);
    for (std::size_t g = 0; g < solver->color_groups().group_count(); ++g) {
        REQUIRE_FALSE(solver->color_groups().group(g).empty());
    }
}
