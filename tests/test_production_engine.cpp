#include <catch2/catch.hpp>

#include "building_catalog.h"
#include "effect_registry.h"
#include "production_engine.h"
#include "simulation_context.h"
#include "spatial_index.h"
#include "storage_ledger.h"

namespace {

size_t slot(Resource::Type type) {
    return static_cast<size_t>(Resource::index(type));
}

struct ProductionFixture {
    SimulationConfig config;
    BuildingCatalog catalog;
    SpatialIndex spatial{10};
    EffectRegistry effects{spatial, catalog, config.effects};
    StorageLedger ledger{1000.0, config.storage.unitValues};
    StructureMap structures;
    WorkerAssignments assignments;

    ProductionFixture() { ledger.setWarningsEnabled(false); }

    void add(int id, BuildingType type, int x, int z, StructureStatus status = StructureStatus::COMPLETE) {
        Structure s;
        s.id = id;
        s.type = type;
        s.position = sf::Vector3i(x, 0, z);
        s.dimensions = catalog.find(type)->dimensions;
        s.status = status;
        structures[id] = s;
        spatial.insert(structures[id]);
        if (s.isComplete()) {
            effects.registerEffects(structures[id]);
        }
    }
};

} // namespace

TEST_CASE("ProductionEngine: staffed producers deposit their yield")
{
    ProductionFixture f;
    ProductionEngine engine(f.catalog, f.effects, f.ledger, f.config.production);
    f.add(1, BuildingType::FARM, 0, 0);
    f.add(2, BuildingType::LUMBER_MILL, 50, 50);
    f.add(3, BuildingType::MINE, 90, 0);
    f.assignments[1] = {101};
    f.assignments[2] = {102}; // one of two slots

    const ProductionTickResult r = engine.runTick(f.structures, f.assignments, 1.0);
    CHECK(r.tick == 0);
    CHECK(r.produced[slot(Resource::Type::FOOD)] == Approx(1.0));
    CHECK(r.produced[slot(Resource::Type::WOOD)] == Approx(0.5));
    CHECK(r.produced[slot(Resource::Type::STONE)] == 0.0);
    CHECK(r.perStructure.size() == 2);
    CHECK(f.ledger.getAmount(Resource::Type::FOOD) == Approx(1.0));
    CHECK(f.ledger.getAmount(Resource::Type::WOOD) == Approx(0.5));
    CHECK_FALSE(r.overflow.occurred());

    CHECK(engine.runTick(f.structures, f.assignments, 1.0).tick == 1);
    CHECK(engine.nextTick() == 2);
}

TEST_CASE("ProductionEngine: unfinished or unstaffed buildings produce nothing")
{
    ProductionFixture f;
    ProductionEngine engine(f.catalog, f.effects, f.ledger, f.config.production);
    f.add(1, BuildingType::FARM, 0, 0, StructureStatus::UNDER_CONSTRUCTION);
    f.add(2, BuildingType::FARM, 20, 20, StructureStatus::DAMAGED);
    f.add(3, BuildingType::FARM, 40, 40);
    f.assignments[1] = {1};
    f.assignments[2] = {2};

    const ProductionTickResult r = engine.runTick(f.structures, f.assignments, 1.0);
    CHECK(totalOf(r.produced) == 0.0);
    CHECK(r.perStructure.empty());
    CHECK(f.ledger.getTotalStored() == 0.0);
}

TEST_CASE("ProductionEngine: morale, aura and the hard cap")
{
    ProductionFixture f;
    f.add(1, BuildingType::FARM, 0, 0);
    f.assignments[1] = {7};

    SECTION("morale scales output")
    {
        ProductionEngine engine(f.catalog, f.effects, f.ledger, f.config.production);
        const ProductionTickResult r = engine.runTick(f.structures, f.assignments, 1.1);
        CHECK(r.produced[slot(Resource::Type::FOOD)] == Approx(1.1));
    }

    SECTION("a nearby town centre adds its aura")
    {
        f.add(2, BuildingType::TOWN_CENTER, 10, 10);
        ProductionEngine engine(f.catalog, f.effects, f.ledger, f.config.production);
        const ProductionTickResult r = engine.runTick(f.structures, f.assignments, 1.0);
        REQUIRE(r.perStructure.size() == 1);
        CHECK(r.perStructure[0].auraBonus == Approx(1.05));
        CHECK(r.produced[slot(Resource::Type::FOOD)] == Approx(1.05));
    }

    SECTION("the multiplier never exceeds the configured cap")
    {
        SimulationConfig::Production capped;
        capped.maxMultiplier = 1.0;
        ProductionEngine engine(f.catalog, f.effects, f.ledger, capped);
        const ProductionTickResult r = engine.runTick(f.structures, f.assignments, 1.1);
        CHECK(r.perStructure[0].multiplier == Approx(1.0));
        CHECK(r.produced[slot(Resource::Type::FOOD)] == Approx(1.0));
    }
}

TEST_CASE("ProductionEngine: output beyond capacity is resolved in the same tick")
{
    ProductionFixture f;
    f.ledger.setCapacity(0.25);
    ProductionEngine engine(f.catalog, f.effects, f.ledger, f.config.production);
    f.add(1, BuildingType::FARM, 0, 0);
    f.assignments[1] = {1};

    const ProductionTickResult r = engine.runTick(f.structures, f.assignments, 1.0);
    CHECK(r.overflow.occurred());
    CHECK(r.overflow.totalDumped == Approx(0.75));
    CHECK(f.ledger.getTotalStored() == Approx(0.25));
}
