// voxel_math AABB tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <voxel/math/bounds.hpp>

#include <limits>

using namespace voxel_math;
using Catch::Matchers::WithinAbs;

// =============================================================================
// AABB Tests
// =============================================================================

TEST_CASE("AABB construction", "[math][aabb]") {
    SECTION("from min/max") {
        AABB box(Vec3(-1.0f, -1.0f, -1.0f), Vec3(1.0f, 1.0f, 1.0f));
        REQUIRE(box.min == Vec3(-1.0f, -1.0f, -1.0f));
        REQUIRE(box.max == Vec3(1.0f, 1.0f, 1.0f));
    }

    SECTION("from center and half extents") {
        AABB box = AABB::from_center_half_extents(Vec3(1.0f, 2.0f, 3.0f), Vec3(0.5f));
        REQUIRE(box.min == Vec3(0.5f, 1.5f, 2.5f));
        REQUIRE(box.max == Vec3(1.5f, 2.5f, 3.5f));
        REQUIRE(box.center() == Vec3(1.0f, 2.0f, 3.0f));
        REQUIRE(box.half_extents() == Vec3(0.5f));
        REQUIRE(box.size() == Vec3(1.0f));
    }

    SECTION("default is empty") {
        AABB box;
        REQUIRE_FALSE(box.is_valid());
        box.expand_to_include(AABB(vec3::ZERO, vec3::ONE));
        REQUIRE(box == AABB(vec3::ZERO, vec3::ONE));
    }
}

TEST_CASE("AABB validity", "[math][aabb]") {
    REQUIRE(AABB(vec3::ZERO, vec3::ONE).is_finite());
    REQUIRE(AABB(vec3::ZERO, vec3::ZERO).is_valid());

    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();
    REQUIRE_FALSE(AABB(Vec3(nan, 0.0f, 0.0f), vec3::ONE).is_finite());
    REQUIRE_FALSE(AABB(vec3::ZERO, Vec3(0.0f, inf, 0.0f)).is_finite());
    REQUIRE_FALSE(AABB(vec3::ONE, vec3::ZERO).is_finite());
}

TEST_CASE("AABB overlap", "[math][aabb]") {
    AABB a(Vec3(0.0f), Vec3(1.0f));

    SECTION("overlapping boxes") {
        AABB b(Vec3(0.75f, 0.5f, 0.0f), Vec3(2.0f));
        REQUIRE(a.intersects(b));
        REQUIRE(a.overlaps(b));

        Vec3 extent = a.overlap_extent(b);
        REQUIRE_THAT(extent.x, WithinAbs(0.25f, 1e-6));
        REQUIRE_THAT(extent.y, WithinAbs(0.5f, 1e-6));
        REQUIRE_THAT(extent.z, WithinAbs(1.0f, 1e-6));
    }

    SECTION("touching faces intersect but do not overlap") {
        AABB b(Vec3(1.0f, 0.0f, 0.0f), Vec3(2.0f, 1.0f, 1.0f));
        REQUIRE(a.intersects(b));
        REQUIRE_FALSE(a.overlaps(b));
        REQUIRE_THAT(a.overlap_extent(b).x, WithinAbs(0.0f, 1e-6));
    }

    SECTION("separated boxes") {
        AABB b(Vec3(3.0f), Vec3(4.0f));
        REQUIRE_FALSE(a.intersects(b));
        REQUIRE_FALSE(a.overlaps(b));
        REQUIRE(a.overlap_extent(b).x < 0.0f);
    }
}

TEST_CASE("AABB transforms", "[math][aabb]") {
    AABB a(Vec3(0.0f), Vec3(1.0f));

    REQUIRE(a.translated(Vec3(1.0f, 0.0f, 0.0f)) == AABB(Vec3(1.0f, 0.0f, 0.0f), Vec3(2.0f, 1.0f, 1.0f)));
    REQUIRE(a.expanded(0.5f) == AABB(Vec3(-0.5f), Vec3(1.5f)));
    REQUIRE(a.union_with(AABB(Vec3(-1.0f), Vec3(0.0f))) == AABB(Vec3(-1.0f), Vec3(1.0f)));

    REQUIRE(a.contains_point(Vec3(0.5f)));
    REQUIRE(a.contains_point(Vec3(1.0f)));
    REQUIRE_FALSE(a.contains_point(Vec3(1.5f)));
}

TEST_CASE("Voxel coordinate helpers", "[math][types]") {
    REQUIRE(floor_to_int(Vec3(1.5f, -0.5f, -2.0f)) == IVec3(1, -1, -2));
    REQUIRE(is_finite(Vec3(1.0f)));
    REQUIRE_FALSE(is_finite(Vec3(std::numeric_limits<float>::infinity())));
}
