#include <catch2/catch.hpp>

#include <cmath>
#include <limits>

#include "grid_index.h"

namespace {

Structure makeStructure(int x, int y, int z, int w, int h, int d) {
    Structure s;
    s.type = BuildingType::FARM;
    s.position = sf::Vector3i(x, y, z);
    s.dimensions = Dimensions{w, h, d};
    return s;
}

} // namespace

TEST_CASE("GridIndex: placement occupies exactly the footprint")
{
    GridIndex grid(100, 50);
    Structure s = makeStructure(5, 0, 5, 2, 1, 3);

    REQUIRE(grid.place(s).ok());
    CHECK(s.id == 1);
    CHECK(grid.occupiedCellCount() == 6);
    CHECK(grid.cellsOwnedBy(s.id) == 6);
    CHECK(grid.occupantAt(6, 0, 7).value() == s.id);
    CHECK_FALSE(grid.occupantAt(7, 0, 5).has_value());

    REQUIRE(grid.remove(s.id).ok());
    CHECK(grid.occupiedCellCount() == 0);
    CHECK_FALSE(grid.contains(s.id));
    CHECK(grid.validateIntegrity().empty());
}

TEST_CASE("GridIndex: overlapping placement is rejected and reported")
{
    GridIndex grid(100, 50);
    Structure a = makeStructure(10, 0, 10, 3, 2, 3);
    REQUIRE(grid.place(a).ok());

    Structure b = makeStructure(12, 1, 12, 2, 2, 2);
    const SimStatus st = grid.place(b);
    CHECK(st.code == SimErrorCode::RegionOccupied);
    CHECK(b.id == 0);

    const RegionCheck region = grid.isRegionFree(12, 1, 12, 2, 2, 2);
    CHECK_FALSE(region.free);
    // Only (12,1,12) overlaps the first structure.
    REQUIRE(region.issues.size() == 1);
    CHECK(region.issues.front().cell == sf::Vector3i(12, 1, 12));

    // Touching faces do not collide.
    Structure c = makeStructure(13, 0, 10, 1, 1, 1);
    CHECK(grid.place(c).ok());
    CHECK(grid.occupiedCellCount() == 19);
}

TEST_CASE("GridIndex: bounds checks")
{
    GridIndex grid(20, 10);

    CHECK(grid.validateBounds(0, 0, 0).ok());
    CHECK(grid.validateBounds(19, 9, 19).ok());
    CHECK(grid.validateBounds(20, 0, 0).code == SimErrorCode::OutOfBounds);
    CHECK(grid.validateBounds(0, -1, 0).code == SimErrorCode::OutOfBounds);

    CHECK(grid.validateBounds(1.0, 2.0, 3.0).ok());
    CHECK(grid.validateBounds(1.5, 2.0, 3.0).code == SimErrorCode::OutOfBounds);
    CHECK(grid.validateBounds(std::numeric_limits<double>::quiet_NaN(), 0.0, 0.0).code == SimErrorCode::OutOfBounds);

    Structure outside = makeStructure(-1, 0, 0, 1, 1, 1);
    CHECK(grid.place(outside).code == SimErrorCode::OutOfBounds);

    // Origin inside, footprint spilling over the edge.
    Structure spill = makeStructure(19, 0, 19, 2, 1, 2);
    CHECK(grid.place(spill).code == SimErrorCode::RegionOccupied);
    CHECK(grid.occupiedCellCount() == 0);
}

TEST_CASE("GridIndex: ids")
{
    GridIndex grid(50, 10);

    Structure explicitId = makeStructure(0, 0, 0, 1, 1, 1);
    explicitId.id = 7;
    REQUIRE(grid.place(explicitId).ok());
    CHECK(grid.peekNextId() == 8);

    Structure duplicate = makeStructure(5, 0, 5, 1, 1, 1);
    duplicate.id = 7;
    CHECK(grid.place(duplicate).code == SimErrorCode::InvalidState);

    Structure fresh = makeStructure(5, 0, 5, 1, 1, 1);
    REQUIRE(grid.place(fresh).ok());
    CHECK(fresh.id == 8);

    CHECK(grid.remove(99).code == SimErrorCode::NotFound);
    CHECK(grid.structureCount() == 2);
}
