#include <catch2/catch.hpp>

#include <algorithm>
#include <cmath>
#include <random>
#include <set>

#include "spatial_index.h"

namespace {

Structure at(int id, int x, int y, int z, Dimensions dims = Dimensions{1, 1, 1}) {
    Structure s;
    s.id = id;
    s.type = BuildingType::HOUSE;
    s.position = sf::Vector3i(x, y, z);
    s.dimensions = dims;
    return s;
}

void add(SpatialIndex& index, StructureMap& structures, const Structure& s) {
    structures[s.id] = s;
    index.insert(structures[s.id]);
}

} // namespace

TEST_CASE("SpatialIndex: radius query matches a brute-force scan")
{
    SpatialIndex index(8);
    StructureMap structures;
    std::mt19937 rng(12345);
    std::uniform_int_distribution<int> coord(0, 99);
    std::uniform_int_distribution<int> height(0, 20);
    for (int id = 1; id <= 300; ++id) {
        add(index, structures, at(id, coord(rng), height(rng), coord(rng)));
    }

    std::uniform_real_distribution<double> qpos(-5.0, 105.0);
    std::uniform_real_distribution<double> qrad(0.0, 40.0);
    for (int q = 0; q < 50; ++q) {
        const double x = qpos(rng), y = qpos(rng) / 5.0, z = qpos(rng);
        const double r = qrad(rng);

        std::set<int> expected;
        for (const auto& entry : structures) {
            const sf::Vector3i& p = entry.second.position;
            const double dx = p.x - x, dy = p.y - y, dz = p.z - z;
            if (dx * dx + dy * dy + dz * dz <= r * r) {
                expected.insert(entry.first);
            }
        }

        const std::vector<SpatialHit> hits = index.queryRadius(x, y, z, r, structures);
        std::set<int> got;
        for (const SpatialHit& h : hits) {
            got.insert(h.id);
        }
        CHECK(got == expected);
        CHECK(got.size() == hits.size());
        CHECK(std::is_sorted(hits.begin(), hits.end(), [](const SpatialHit& a, const SpatialHit& b) {
            return a.distance < b.distance;
        }));
    }
}

TEST_CASE("SpatialIndex: equal distances keep insertion order")
{
    SpatialIndex index(10);
    StructureMap structures;
    add(index, structures, at(30, 5, 0, 0));
    add(index, structures, at(10, -5, 0, 0));
    add(index, structures, at(20, 0, 0, 5));

    const std::vector<SpatialHit> hits = index.queryRadius(0.0, 0.0, 0.0, 5.0, structures);
    REQUIRE(hits.size() == 3);
    CHECK(hits[0].id == 30);
    CHECK(hits[1].id == 10);
    CHECK(hits[2].id == 20);

    // Moving a structure does not change its place in the order.
    structures[30].position = sf::Vector3i(0, 5, 0);
    index.update(structures[30]);
    const std::vector<SpatialHit> moved = index.queryRadius(0.0, 0.0, 0.0, 5.0, structures);
    REQUIRE(moved.size() == 3);
    CHECK(moved[0].id == 30);
}

TEST_CASE("SpatialIndex: large footprints span several chunks")
{
    SpatialIndex index(10);
    StructureMap structures;
    add(index, structures, at(1, 8, 0, 8, Dimensions{5, 3, 5}));

    const std::vector<GridKey> chunks = index.chunksOf(1);
    CHECK(chunks.size() == 4);
    CHECK(index.stats().chunkCount == 4);
    CHECK(index.stats().structureCount == 1);

    CHECK(index.remove(1));
    CHECK_FALSE(index.remove(1));
    CHECK(index.stats().chunkCount == 0);
}

TEST_CASE("SpatialIndex: region query by position")
{
    SpatialIndex index(4);
    StructureMap structures;
    add(index, structures, at(1, 1, 0, 1));
    add(index, structures, at(2, 6, 0, 6));
    add(index, structures, at(3, 12, 0, 3));
    add(index, structures, at(4, -3, 0, -3));

    // Corner order does not matter.
    const std::vector<int> ids = index.queryRegion(7, 2, 7, 0, 0, 0, structures);
    REQUIRE(ids.size() == 2);
    CHECK(ids[0] == 1);
    CHECK(ids[1] == 2);

    const std::vector<int> negative = index.queryRegion(-5, 0, -5, -1, 0, -1, structures);
    REQUIRE(negative.size() == 1);
    CHECK(negative[0] == 4);
    CHECK(index.chunkOf(-1, 0, -4) == GridKey{-1, 0, -1});
}

TEST_CASE("SpatialIndex: invalid queries return nothing")
{
    SpatialIndex index(10);
    StructureMap structures;
    add(index, structures, at(1, 0, 0, 0));

    CHECK(index.queryRadius(0.0, 0.0, 0.0, -1.0, structures).empty());
    CHECK(index.queryRadius(std::nan(""), 0.0, 0.0, 5.0, structures).empty());
    CHECK(index.queryRadius(0.0, 0.0, 0.0, 0.0, structures).size() == 1);
}
