#include <catch2/catch.hpp>

#include "building_catalog.h"
#include "effect_registry.h"
#include "simulation_context.h"
#include "spatial_index.h"

namespace {

struct EffectFixture {
    SpatialIndex spatial{10};
    BuildingCatalog catalog;
    StructureMap structures;
    SimulationConfig::Effects config;

    const Structure& add(int id, BuildingType type, int x, int y, int z,
                         StructureStatus status = StructureStatus::COMPLETE) {
        Structure s;
        s.id = id;
        s.type = type;
        s.position = sf::Vector3i(x, y, z);
        s.dimensions = catalog.find(type)->dimensions;
        s.status = status;
        structures[id] = s;
        spatial.insert(structures[id]);
        return structures[id];
    }
};

} // namespace

TEST_CASE("EffectRegistry: production aura reaches its radius and no further")
{
    EffectFixture f;
    EffectRegistry registry(f.spatial, f.catalog, f.config);
    const Structure& centre = f.add(1, BuildingType::TOWN_CENTER, 0, 0, 0);

    const EffectRegistration reg = registry.registerEffects(centre);
    REQUIRE(reg.status.ok());
    REQUIRE(reg.effectIds.size() == 1);

    CHECK(registry.getProductionBonusAt(10.0, 0.0, 0.0, f.structures) == Approx(1.05));
    CHECK(registry.getProductionBonusAt(50.0, 0.0, 0.0, f.structures) == Approx(1.05));
    CHECK(registry.getProductionBonusAt(51.0, 0.0, 0.0, f.structures) == 1.0);
    CHECK(registry.getDefenseBonusAt(10.0, 0.0, 0.0, f.structures) == 1.0);
    CHECK(registry.getTradeBonusAt(10.0, 0.0, 0.0, f.structures) == 1.0);
}

TEST_CASE("EffectRegistry: only COMPLETE structures register")
{
    EffectFixture f;
    EffectRegistry registry(f.spatial, f.catalog, f.config);
    const Structure& blueprint = f.add(1, BuildingType::MARKET, 0, 0, 0, StructureStatus::BLUEPRINT);

    const EffectRegistration reg = registry.registerEffects(blueprint);
    CHECK(reg.status.code == SimErrorCode::InvalidState);
    CHECK(registry.effectCount() == 0);

    // A type without bonuses registers cleanly with no effects.
    const Structure& farm = f.add(2, BuildingType::FARM, 20, 0, 20);
    const EffectRegistration none = registry.registerEffects(farm);
    CHECK(none.status.ok());
    CHECK(none.effectIds.empty());
}

TEST_CASE("EffectRegistry: re-registering replaces and unregistering removes")
{
    EffectFixture f;
    EffectRegistry registry(f.spatial, f.catalog, f.config);
    const Structure& castle = f.add(1, BuildingType::CASTLE, 10, 0, 10);

    REQUIRE(registry.registerEffects(castle).effectIds.size() == 2);
    REQUIRE(registry.registerEffects(castle).effectIds.size() == 2);
    CHECK(registry.effectCount() == 2);
    CHECK(registry.hasEffects(1));

    CHECK(registry.unregisterEffects(1) == 2);
    CHECK(registry.unregisterEffects(1) == 0);
    CHECK(registry.getDefenseBonusAt(10.0, 0.0, 10.0, f.structures) == 1.0);
}

TEST_CASE("EffectRegistry: overlapping zones compose by the configured rule")
{
    EffectFixture f;
    f.add(1, BuildingType::WATCHTOWER, 0, 0, 0);
    f.add(2, BuildingType::CASTLE, 20, 0, 0);

    auto defenseAtMidpoint = [&](SimulationConfig::Effects config) {
        EffectRegistry registry(f.spatial, f.catalog, config);
        registry.registerEffects(f.structures.at(1));
        registry.registerEffects(f.structures.at(2));
        return registry.getDefenseBonusAt(10.0, 0.0, 0.0, f.structures);
    };

    SimulationConfig::Effects config;
    config.composition = SimulationConfig::Effects::Composition::Max;
    CHECK(defenseAtMidpoint(config) == Approx(1.30));

    config.composition = SimulationConfig::Effects::Composition::Additive;
    CHECK(defenseAtMidpoint(config) == Approx(1.50));

    config.composition = SimulationConfig::Effects::Composition::Multiplicative;
    CHECK(defenseAtMidpoint(config) == Approx(1.56));

    config.maxCombinedMultiplier = 1.4;
    CHECK(defenseAtMidpoint(config) == Approx(1.4));
}

TEST_CASE("EffectRegistry: effects follow the structure's current position")
{
    EffectFixture f;
    EffectRegistry registry(f.spatial, f.catalog, f.config);
    f.add(1, BuildingType::MARKET, 0, 0, 0);
    REQUIRE(registry.registerEffects(f.structures.at(1)).status.ok());
    CHECK(registry.getTradeBonusAt(25.0, 0.0, 0.0, f.structures) == Approx(1.10));

    f.structures[1].position = sf::Vector3i(80, 0, 0);
    f.spatial.update(f.structures[1]);
    CHECK(registry.getTradeBonusAt(25.0, 0.0, 0.0, f.structures) == 1.0);
    CHECK(registry.getTradeBonusAt(90.0, 0.0, 0.0, f.structures) == Approx(1.10));
}

TEST_CASE("EffectRegistry: neighbour queries leave out the source structure")
{
    EffectFixture f;
    EffectRegistry registry(f.spatial, f.catalog, f.config);
    const Structure& centre = f.add(1, BuildingType::TOWN_CENTER, 0, 0, 0);
    const Structure& tower = f.add(2, BuildingType::WATCHTOWER, 30, 0, 0);
    f.add(3, BuildingType::FARM, 45, 0, 0);
    f.add(4, BuildingType::FARM, 60, 0, 0);

    const EffectRegistration centreReg = registry.registerEffects(centre);
    const EffectRegistration towerReg = registry.registerEffects(tower);
    REQUIRE(centreReg.effectIds.size() == 1);
    REQUIRE(towerReg.effectIds.size() == 1);

    // Radius 50 from the origin reaches the tower and the nearer farm.
    CHECK(registry.structuresAffectedBy(centreReg.effectIds[0], f.structures) == std::vector<int>{2, 3});
    // Radius 40 from x=30 reaches the centre, both farms, but never the tower itself.
    CHECK(registry.structuresAffectedBy(towerReg.effectIds[0], f.structures) == std::vector<int>{3, 1, 4});
    CHECK(registry.structuresAffectedBy(999, f.structures).empty());

    const std::vector<Effect> onTower = registry.affectingEffects(2, f.structures);
    REQUIRE(onTower.size() == 1);
    CHECK(onTower[0].originId == 1);

    const std::vector<Effect> onFarm = registry.affectingEffects(3, f.structures);
    CHECK(onFarm.size() == 2);
    CHECK(registry.affectingEffects(4, f.structures).size() == 1);
    CHECK(registry.affectingEffects(99, f.structures).empty());

    REQUIRE(registry.findEffect(towerReg.effectIds[0]).has_value());
    CHECK(registry.findEffect(towerReg.effectIds[0])->kind() == EffectKind::DefenseZone);
    CHECK_FALSE(registry.findEffect(999).has_value());
}
