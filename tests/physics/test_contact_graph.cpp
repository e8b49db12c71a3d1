// voxel_physics contact colouring tests

#include <catch2/catch_test_macros.hpp>
#include <voxel/physics/contact_graph.hpp>

#include <random>
#include <set>
#include <vector>

using namespace voxel_physics;

namespace {

/// Manifold with one contact point between a and b
ContactManifold make_manifold(std::uint32_t a, std::uint32_t b) {
    ContactManifold m;
    m.pair = CandidatePair::make(EntityId(a), EntityId(b));
    m.points[0].normal = Vec3(0.0f, 1.0f, 0.0f);
    m.point_count = 1;
    return m;
}

/// No dynamic entity may appear twice within one group
bool groups_are_independent(const ColorGroups& groups,
                            const std::vector<ContactManifold>& manifolds,
                            const std::vector<float>& inverse_masses)
{
    for (std::size_t g = 0; g < groups.group_count(); ++g) {
        std::set<std::uint32_t> used;
        for (std::uint32_t index : groups.group(g)) {
            const CandidatePair& pair = manifolds[index].pair;
            for (EntityId id : {pair.a, pair.b}) {
                if (inverse_masses[id.index()] == 0.0f) {
                    continue;
                }
                if (!used.insert(id.value).second) {
                    return false;
                }
            }
        }
    }
    return true;
}

} // anonymous namespace

TEST_CASE("ContactColoring basics", "[physics][contact_graph]") {
    ContactColoring coloring;
    ColorGroups groups;

    SECTION("no contacts") {
        std::vector<ContactManifold> manifolds;
        std::vector<float> inverse_masses;
        coloring.build(manifolds, inverse_masses, groups);
        REQUIRE(groups.group_count() == 0);
        REQUIRE(groups.contact_count() == 0);
    }

    SECTION("chain needs two colours") {
        std::vector<ContactManifold> manifolds = {
            make_manifold(0, 1), make_manifold(1, 2), make_manifold(2, 3)
        };
        std::vector<float> inverse_masses(4, 1.0f);
        coloring.build(manifolds, inverse_masses, groups);

        REQUIRE(groups.group_count() == 2);
        REQUIRE(groups.group(0).size() == 2);
        REQUIRE(groups.group(0)[0] == 0);
        REQUIRE(groups.group(0)[1] == 2);
        REQUIRE(groups.group(1).size() == 1);
        REQUIRE(groups.group(1)[0] == 1);
    }

    SECTION("static entity is shared freely") {
        // Entity 0 is static ground under three dynamic boxes
        std::vector<ContactManifold> manifolds = {
            make_manifold(0, 1), make_manifold(0, 2), make_manifold(0, 3)
        };
        std::vector<float> inverse_masses = {0.0f, 1.0f, 1.0f, 1.0f};
        coloring.build(manifolds, inverse_masses, groups);
        REQUIRE(groups.group_count() == 1);
        REQUIRE(groups.contact_count() == 3);
    }

    SECTION("empty manifolds are skipped") {
        std::vector<ContactManifold> manifolds = {make_manifold(0, 1), make_manifold(2, 3)};
        manifolds[1].point_count = 0;
        std::vector<float> inverse_masses(4, 1.0f);
        coloring.build(manifolds, inverse_masses, groups);
        REQUIRE(groups.contact_count() == 1);
    }
}

TEST_CASE("ContactColoring on random graphs", "[physics][contact_graph]") {
    std::mt19937 rng(42);
    ContactColoring coloring;

    for (int trial = 0; trial < 20; ++trial) {
        const std::uint32_t entity_count = 50;
        std::uniform_int_distribution<std::uint32_t> pick(0, entity_count - 1);
        std::uniform_int_distribution<int> coin(0, 4);

        std::vector<float> inverse_masses(entity_count);
        for (auto& inv : inverse_masses) {
            inv = coin(rng) == 0 ? 0.0f : 1.0f;
        }

        std::vector<ContactManifold> manifolds;
        for (int i = 0; i < 200; ++i) {
            std::uint32_t a = pick(rng);
            std::uint32_t b = pick(rng);
            if (a != b) {
                manifolds.push_back(make_manifold(a, b));
            }
        }

        ColorGroups groups;
        coloring.build(manifolds, inverse_masses, groups);

        REQUIRE(groups.contact_count() == manifolds.size());
        REQUIRE(groups_are_independent(groups, manifolds, inverse_masses));

        // Every manifold lands in exactly one group
        std::set<std::uint32_t> seen;
        for (std::size_t g = 0; g < groups.group_count(); ++g) {
            for (std::uint32_t index : groups.group(g)) {
                REQUIRE(seen.insert(index).second);
            }
        }
        REQUIRE(seen.size() == manifolds.size());

        // Same input, same colouring
        ColorGroups again;
        coloring.build(manifolds, inverse_masses, again);
        REQUIRE(again.group_count() == groups.group_count());
        for (std::size_t g = 0; g < groups.group_count(); ++g) {
            REQUIRE(std::vector<std::uint32_t>(again.group(g).begin(), again.group(g).end()) ==
                    std::vector<std::uint32_t>(groups.group(g).begin(), groups.group(g).end()));
        }
    }
}
